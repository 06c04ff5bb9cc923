#pragma once
// Config: .braid/config.toml
//
// Loaded once per invocation. Older shapes are migrated in memory;
// the migrated form reaches disk only through save().

#include "error.hpp"
#include "fileio.hpp"
#include "log.hpp"
#include "toml.hpp"
#include "version.hpp"
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>

namespace braid {

namespace fs = std::filesystem;

struct Config {
    int64_t schema_version = version::CURRENT_SCHEMA;
    std::string id_prefix = "brd";
    int id_len = 4;
    std::optional<std::string> issues_branch;  // issues-branch mode
    std::optional<std::string> issues_repo;    // external-repo mode
    bool auto_pull = true;
    bool auto_push = true;

    bool is_issues_branch_mode() const { return issues_branch.has_value(); }
    bool is_external_repo_mode() const { return issues_repo.has_value(); }
};

// First four ASCII alphanumerics of the repo name, lowercased, padded with 'x'
inline std::string derive_prefix(const std::string& name) {
    std::string prefix;
    for (char c : name) {
        if (prefix.size() == 4) break;
        if (std::isalnum(static_cast<unsigned char>(c))) {
            prefix += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    while (prefix.size() < 4) prefix += 'x';
    return prefix;
}

inline Config config_with_derived_prefix(const std::string& repo_name) {
    Config config;
    config.id_prefix = derive_prefix(repo_name);
    return config;
}

// Apply config-shape migrations to the raw table. Returns true if changed.
//   < v5: sync_branch renamed to issues_branch
//   < v6: auto_pull / auto_push default to true
inline bool migrate_config_table(toml::Table& table) {
    int64_t schema = 0;
    if (auto v = table.find("schema_version")) {
        if (auto n = std::get_if<int64_t>(v)) schema = *n;
    }
    if (schema >= 6) return false;

    if (schema < 5) {
        if (auto v = table.find("sync_branch")) {
            toml::Value branch = *v;
            table.remove("sync_branch");
            table.set("issues_branch", branch);
        }
    }
    if (!table.contains("auto_pull")) table.set("auto_pull", true);
    if (!table.contains("auto_push")) table.set("auto_push", true);
    table.set("schema_version", static_cast<int64_t>(version::CURRENT_SCHEMA));
    return true;
}

inline Result<Config> parse_config(const std::string& text, const std::string& where,
                                   bool* migrated = nullptr) {
    auto parsed = toml::parse(text, where);
    if (!parsed) return parsed.error();
    toml::Table table = *parsed;

    bool changed = migrate_config_table(table);
    if (migrated) *migrated = changed;
    if (changed) log::debug("config", "migrated %s in memory", where.c_str());

    Config config;

    auto schema = toml::get_int(table, "schema_version", where);
    if (!schema) return schema.error();
    if (!*schema) return Error::parse(where, "missing field 'schema_version'");
    if (**schema < 0) return Error::parse(where, "schema_version must not be negative");
    config.schema_version = **schema;

    auto prefix = toml::get_string(table, "id_prefix", where);
    if (!prefix) return prefix.error();
    if (!*prefix) return Error::parse(where, "missing field 'id_prefix'");
    config.id_prefix = **prefix;

    auto id_len = toml::get_int(table, "id_len", where);
    if (!id_len) return id_len.error();
    if (!*id_len) return Error::parse(where, "missing field 'id_len'");
    if (**id_len < 0 || **id_len > std::numeric_limits<int>::max()) {
        return Error::parse(where, "id_len must be between 4 and 10, got " + std::to_string(**id_len));
    }
    config.id_len = static_cast<int>(**id_len);

    auto branch = toml::get_string(table, "issues_branch", where);
    if (!branch) return branch.error();
    config.issues_branch = *branch;

    auto repo = toml::get_string(table, "issues_repo", where);
    if (!repo) return repo.error();
    config.issues_repo = *repo;

    auto pull = toml::get_bool(table, "auto_pull", where);
    if (!pull) return pull.error();
    config.auto_pull = pull->value_or(true);

    auto push = toml::get_bool(table, "auto_push", where);
    if (!push) return push.error();
    config.auto_push = push->value_or(true);

    return config;
}

inline std::string serialize_config(const Config& config) {
    toml::Table table;
    table.set("schema_version", config.schema_version);
    table.set("id_prefix", config.id_prefix);
    table.set("id_len", static_cast<int64_t>(config.id_len));
    if (config.issues_branch) table.set("issues_branch", *config.issues_branch);
    if (config.issues_repo) table.set("issues_repo", *config.issues_repo);
    table.set("auto_pull", config.auto_pull);
    table.set("auto_push", config.auto_push);
    return toml::serialize(table);
}

// Schema newer than this build. Agent worktrees get rebase guidance.
inline Error schema_mismatch_error(const std::string& location, int64_t repo_version,
                                   const fs::path& worktree_root) {
    std::string msg = location + " uses schema v" + std::to_string(repo_version) +
                      ", but this brd only supports up to v" +
                      std::to_string(version::CURRENT_SCHEMA);

    if (!worktree_root.empty() && path_exists(worktree_root / ".braid" / "agent.toml")) {
        msg += "\n\nfor agent worktrees:\n"
               "  1. rebase on main: git fetch origin main && git rebase origin/main\n"
               "  2. rebuild brd from the rebased tree\n"
               "  3. if still failing, ask a human - there may be an unreleased schema change\n\n"
               "NEVER manually edit schema_version in config files.";
    } else {
        msg += "\n\nupgrade brd to a release that supports schema v" +
               std::to_string(repo_version);
    }
    return {ErrorKind::ParseError, msg, {}};
}

inline Result<void> validate_config(const Config& config, const fs::path& worktree_root = {}) {
    if (config.schema_version > version::CURRENT_SCHEMA) {
        return schema_mismatch_error("this repo", config.schema_version, worktree_root);
    }
    if (config.id_len < 4 || config.id_len > 10) {
        return Error::parse("config", "id_len must be between 4 and 10, got " +
                                      std::to_string(config.id_len));
    }
    if (config.id_prefix.size() < 2 || config.id_prefix.size() > 12) {
        return Error::parse("config", "id_prefix must be 2-12 chars, got " +
                                      std::to_string(config.id_prefix.size()) + " chars");
    }
    for (char c : config.id_prefix) {
        if (!std::isalnum(static_cast<unsigned char>(c)) ||
            std::isupper(static_cast<unsigned char>(c))) {
            return Error::parse("config", "id_prefix must be lowercase alphanumeric, got '" +
                                          config.id_prefix + "'");
        }
    }
    if (config.issues_branch && config.issues_repo) {
        return Error::parse("config", "issues_branch and issues_repo are mutually exclusive");
    }
    return {};
}

// Load and validate. A missing file means the repo was never initialized.
inline Result<Config> load_config(const fs::path& path, const fs::path& worktree_root = {},
                                  bool* migrated = nullptr) {
    if (!path_exists(path)) return Error::not_initialized();

    auto text = read_file(path);
    if (!text) return text.error();

    auto config = parse_config(*text, path.string(), migrated);
    if (!config) return config.error();

    auto valid = validate_config(*config, worktree_root);
    if (!valid) return valid.error();
    return config;
}

inline Result<void> save_config(const Config& config, const fs::path& path) {
    return write_atomic(path, serialize_config(config));
}

} // namespace braid
