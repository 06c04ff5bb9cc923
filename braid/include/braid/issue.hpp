#pragma once
// Issue: typed record for the current schema, markdown codec
//
// File shape:
//   ---
//   <YAML frontmatter>
//   ---
//
//   <markdown body>
//
// Older frontmatter is upgraded by migrations.hpp before the typed
// decode runs, so only the v9 shape is known here.

#include "error.hpp"
#include "fileio.hpp"
#include "migrations.hpp"
#include "timestamp.hpp"
#include "version.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace braid {

namespace fs = std::filesystem;

enum class Priority { P0, P1, P2, P3 };
enum class Status { Open, Doing, Done, Skip };
enum class IssueType { Design, Meta };

inline const char* to_string(Priority p) {
    switch (p) {
        case Priority::P0: return "P0";
        case Priority::P1: return "P1";
        case Priority::P2: return "P2";
        case Priority::P3: return "P3";
    }
    return "P2";
}

inline const char* to_string(Status s) {
    switch (s) {
        case Status::Open: return "open";
        case Status::Doing: return "doing";
        case Status::Done: return "done";
        case Status::Skip: return "skip";
    }
    return "open";
}

inline const char* to_string(IssueType t) {
    return t == IssueType::Design ? "design" : "meta";
}

inline std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline Result<Priority> parse_priority(const std::string& s) {
    std::string v = lowercase(s);
    if (v == "p0") return Priority::P0;
    if (v == "p1") return Priority::P1;
    if (v == "p2") return Priority::P2;
    if (v == "p3") return Priority::P3;
    return Error::usage("invalid priority: " + s);
}

inline Result<Status> parse_status(const std::string& s) {
    std::string v = lowercase(s);
    if (v == "open") return Status::Open;
    if (v == "doing") return Status::Doing;
    if (v == "done") return Status::Done;
    if (v == "skip") return Status::Skip;
    return Error::usage("invalid status: " + s);
}

inline Result<IssueType> parse_issue_type(const std::string& s) {
    std::string v = lowercase(s);
    if (v == "design") return IssueType::Design;
    if (v == "meta") return IssueType::Meta;
    return Error::usage("invalid type: " + s + " (valid: design, meta)");
}

struct Issue {
    int schema_version = version::CURRENT_SCHEMA;
    std::string id;
    std::string title;
    Priority priority = Priority::P2;
    Status status = Status::Open;
    std::optional<IssueType> issue_type;
    std::vector<std::string> deps;
    std::optional<std::string> owner;
    std::vector<std::string> tags;
    std::vector<std::string> acceptance;
    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::optional<Timestamp> scheduled_for;
    std::string body;

    bool is_meta() const { return issue_type == IssueType::Meta; }
    bool is_design() const { return issue_type == IssueType::Design; }
    bool has_dep(const std::string& dep) const {
        return std::find(deps.begin(), deps.end(), dep) != deps.end();
    }
    bool has_tag(const std::string& tag) const {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    }

    bool operator==(const Issue&) const = default;
};

// Fresh open issue stamped with `created`
inline Issue make_issue(std::string id, std::string title, Priority priority, Timestamp created) {
    Issue issue;
    issue.id = std::move(id);
    issue.title = std::move(title);
    issue.priority = priority;
    issue.created_at = created;
    return issue;
}

// Canonical order: priority, then age, then id
inline bool cmp_by_priority(const Issue& a, const Issue& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
}

struct Frontmatter {
    std::string yaml;
    std::string body;
};

inline Result<Frontmatter> split_frontmatter(const std::string& content, const std::string& where) {
    size_t start = 0;
    while (start < content.size() && std::isspace(static_cast<unsigned char>(content[start]))) {
        ++start;
    }
    if (content.compare(start, 3, "---") != 0) {
        return Error::parse(where, "missing frontmatter delimiter");
    }

    size_t end = content.find("\n---", start + 3);
    if (end == std::string::npos) {
        return Error::parse(where, "missing closing frontmatter delimiter");
    }

    Frontmatter fm;
    std::string yaml = content.substr(start + 3, end - start - 3);
    size_t a = yaml.find_first_not_of(" \t\r\n");
    size_t b = yaml.find_last_not_of(" \t\r\n");
    fm.yaml = a == std::string::npos ? "" : yaml.substr(a, b - a + 1);

    std::string rest = content.substr(std::min(end + 4, content.size()));
    size_t body_start = 0;
    while (body_start < rest.size() && (rest[body_start] == '\n' || rest[body_start] == '\r')) {
        ++body_start;
    }
    fm.body = rest.substr(body_start);
    return fm;
}

namespace detail {

inline bool defined(const YAML::Node& map, const char* key) {
    const YAML::Node& view = map;
    return view[key].IsDefined() && !view[key].IsNull();
}

inline Result<std::string> required_string(const YAML::Node& fm, const char* key,
                                           const std::string& where) {
    if (!defined(fm, key)) return Error::parse(where, std::string("missing field '") + key + "'");
    const YAML::Node& node = fm[key];
    if (!node.IsScalar()) return Error::parse(where, std::string("'") + key + "' must be a string");
    return node.Scalar();
}

inline Result<std::optional<std::string>> optional_string(const YAML::Node& fm, const char* key,
                                                          const std::string& where) {
    if (!defined(fm, key)) return std::optional<std::string>{};
    const YAML::Node& node = fm[key];
    if (!node.IsScalar()) return Error::parse(where, std::string("'") + key + "' must be a string");
    return std::optional<std::string>{node.Scalar()};
}

inline Result<std::vector<std::string>> string_list(const YAML::Node& fm, const char* key,
                                                    const std::string& where) {
    std::vector<std::string> items;
    if (!defined(fm, key)) return items;
    const YAML::Node& node = fm[key];
    if (!node.IsSequence()) return Error::parse(where, std::string("'") + key + "' must be a list");
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return Error::parse(where, std::string("'") + key + "' entries must be strings");
        }
        items.push_back(item.Scalar());
    }
    return items;
}

inline Result<std::optional<Timestamp>> optional_timestamp(const YAML::Node& fm, const char* key,
                                                           const std::string& where) {
    auto raw = optional_string(fm, key, where);
    if (!raw) return raw.error();
    if (!*raw) return std::optional<Timestamp>{};
    auto ts = parse_timestamp(**raw);
    if (!ts) return Error::parse(where, std::string("invalid timestamp for '") + key + "': " + **raw);
    return std::optional<Timestamp>{*ts};
}

// Strings YAML would read back as something else get quoted
inline bool needs_quotes(const std::string& s) {
    if (s.empty()) return true;
    std::string v = lowercase(s);
    return v == "null" || v == "~" || v == "true" || v == "false" || v == "yes" ||
           v == "no" || v == "on" || v == "off";
}

inline void emit_string(YAML::Emitter& out, const std::string& s) {
    if (needs_quotes(s)) {
        out << YAML::DoubleQuoted << s;
    } else {
        out << s;
    }
}

inline void emit_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& items) {
    if (items.empty()) return;
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& item : items) emit_string(out, item);
    out << YAML::EndSeq;
}

inline void emit_timestamp(YAML::Emitter& out, const char* key, const std::optional<Timestamp>& t) {
    if (!t) return;
    out << YAML::Key << key << YAML::Value << format_timestamp(*t);
}

// Re-anchor an error from a helper onto the file being parsed
inline Error in_file(const std::string& where, const Error& inner) {
    static const std::string prefix = "parse error in ";
    std::string what = inner.message;
    if (what.rfind(prefix, 0) == 0) what = what.substr(prefix.size());
    return Error::parse(where, what);
}

} // namespace detail

// Parse file content. `stem` is the file name without .md; the id must match it.
// `declared_version` receives the on-disk schema once it has been read.
inline Result<Issue> parse_issue(const std::string& content, const std::string& stem,
                                 const std::string& where, int* declared_version = nullptr) {
    auto split = split_frontmatter(content, where);
    if (!split) return split.error();

    YAML::Node raw;
    try {
        raw = YAML::Load(split->yaml);
    } catch (const YAML::Exception& e) {
        return Error::parse(where, e.what());
    }
    if (!raw.IsMap()) return Error::parse(where, "frontmatter is not a mapping");

    auto declared = migrations::get_schema_version(raw);
    if (!declared) return detail::in_file(where, declared.error());
    if (declared_version) *declared_version = *declared;

    auto migrated = migrations::migrate_frontmatter(raw);
    if (!migrated) return detail::in_file(where, migrated.error());
    const YAML::Node& fm = migrated->frontmatter;

    Issue issue;
    issue.schema_version = version::CURRENT_SCHEMA;
    issue.body = split->body;

    try {
        auto id = detail::required_string(fm, "id", where);
        if (!id) return id.error();
        issue.id = *id;

        auto title = detail::required_string(fm, "title", where);
        if (!title) return title.error();
        issue.title = *title;

        auto priority_raw = detail::required_string(fm, "priority", where);
        if (!priority_raw) return priority_raw.error();
        auto priority = parse_priority(*priority_raw);
        if (!priority) return Error::parse(where, priority.error().message);
        issue.priority = *priority;

        auto status_raw = detail::required_string(fm, "status", where);
        if (!status_raw) return status_raw.error();
        auto status = parse_status(*status_raw);
        if (!status) return Error::parse(where, status.error().message);
        issue.status = *status;

        const char* type_key = detail::defined(fm, "issue_type") ? "issue_type" : "type";
        auto type_raw = detail::optional_string(fm, type_key, where);
        if (!type_raw) return type_raw.error();
        if (*type_raw) {
            auto type = parse_issue_type(**type_raw);
            if (!type) return Error::parse(where, type.error().message);
            issue.issue_type = *type;
        }

        auto deps = detail::string_list(fm, "deps", where);
        if (!deps) return deps.error();
        issue.deps = *deps;

        auto owner = detail::optional_string(fm, "owner", where);
        if (!owner) return owner.error();
        issue.owner = *owner;

        auto tags = detail::string_list(fm, "tags", where);
        if (!tags) return tags.error();
        issue.tags = *tags;

        auto acceptance = detail::string_list(fm, "acceptance", where);
        if (!acceptance) return acceptance.error();
        issue.acceptance = *acceptance;

        auto created_raw = detail::required_string(fm, "created_at", where);
        if (!created_raw) return created_raw.error();
        auto created = parse_timestamp(*created_raw);
        if (!created) return Error::parse(where, "invalid timestamp for 'created_at': " + *created_raw);
        issue.created_at = *created;

        auto started = detail::optional_timestamp(fm, "started_at", where);
        if (!started) return started.error();
        issue.started_at = *started;

        auto completed = detail::optional_timestamp(fm, "completed_at", where);
        if (!completed) return completed.error();
        issue.completed_at = *completed;

        auto scheduled = detail::optional_timestamp(fm, "scheduled_for", where);
        if (!scheduled) return scheduled.error();
        issue.scheduled_for = *scheduled;
    } catch (const YAML::Exception& e) {
        return Error::parse(where, e.what());
    }

    if (issue.id != stem) {
        return Error::parse(where, "id '" + issue.id + "' does not match filename '" + stem + "'");
    }
    return issue;
}

// Frontmatter YAML in canonical key order
inline std::string to_yaml(const Issue& issue) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "schema_version" << YAML::Value << version::CURRENT_SCHEMA;
    out << YAML::Key << "id" << YAML::Value << issue.id;
    out << YAML::Key << "title" << YAML::Value;
    detail::emit_string(out, issue.title);
    out << YAML::Key << "priority" << YAML::Value << to_string(issue.priority);
    out << YAML::Key << "status" << YAML::Value << to_string(issue.status);
    if (issue.issue_type) {
        out << YAML::Key << "issue_type" << YAML::Value << to_string(*issue.issue_type);
    }
    detail::emit_list(out, "deps", issue.deps);
    if (issue.owner) {
        out << YAML::Key << "owner" << YAML::Value;
        detail::emit_string(out, *issue.owner);
    }
    detail::emit_list(out, "tags", issue.tags);
    out << YAML::Key << "created_at" << YAML::Value << format_timestamp(issue.created_at);
    detail::emit_timestamp(out, "started_at", issue.started_at);
    detail::emit_timestamp(out, "completed_at", issue.completed_at);
    detail::emit_timestamp(out, "scheduled_for", issue.scheduled_for);
    detail::emit_list(out, "acceptance", issue.acceptance);
    out << YAML::EndMap;
    return out.c_str();
}

inline std::string to_markdown(const Issue& issue) {
    std::string content = "---\n" + to_yaml(issue) + "\n---\n";
    if (!issue.body.empty()) {
        content += "\n" + issue.body;
    }
    return content;
}

inline Result<Issue> load_issue(const fs::path& path, int* declared_version = nullptr) {
    auto content = read_file(path);
    if (!content) return content.error();
    return parse_issue(*content, path.stem().string(), path.string(), declared_version);
}

inline Result<void> save_issue(const Issue& issue, const fs::path& path) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir) return dir.error();
    return write_atomic(path, to_markdown(issue));
}

} // namespace braid
