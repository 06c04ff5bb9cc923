#pragma once
// Issue store: one markdown file per issue in a flat directory
//
// Readers tolerate individual broken files (warned, skipped). A file
// declaring a schema newer than this build fails the whole load.

#include "config.hpp"
#include "error.hpp"
#include "issue.hpp"
#include "log.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace braid {

namespace fs = std::filesystem;

using IssueMap = std::map<std::string, Issue>;

struct LoadFailure {
    fs::path path;
    Error error;
};

struct LoadReport {
    IssueMap issues;
    std::vector<LoadFailure> failures;
    std::map<std::string, int> declared_versions;  // on-disk schema per id

    std::vector<std::string> needing_migration() const {
        std::vector<std::string> ids;
        for (const auto& [id, v] : declared_versions) {
            if (migrations::needs_migration(v)) ids.push_back(id);
        }
        return ids;
    }
};

inline fs::path issue_path(const fs::path& issues_dir, const std::string& id) {
    return issues_dir / (id + ".md");
}

// Every *.md file directly under dir, sorted by name
inline Result<std::vector<fs::path>> list_issue_files(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return files;

    for (fs::directory_iterator it(dir, ec), end; it != end && !ec; it.increment(ec)) {
        const auto& entry = *it;
        if (entry.path().extension() == ".md" && entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    if (ec) return Error::io("cannot list " + dir.string() + ": " + ec.message());
    std::sort(files.begin(), files.end());
    return files;
}

inline Result<LoadReport> load_all(const fs::path& dir, bool quiet = false) {
    LoadReport report;
    auto files = list_issue_files(dir);
    if (!files) return files.error();

    for (const auto& path : *files) {
        int declared = -1;
        auto issue = load_issue(path, &declared);
        if (!issue) {
            if (declared > migrations::CURRENT_VERSION) return issue.error();
            if (!quiet) log::warn("failed to load " + path.string() + ": " + issue.error().message);
            report.failures.push_back({path, issue.error()});
            continue;
        }
        report.declared_versions[issue->id] = declared;
        report.issues.emplace(issue->id, std::move(*issue));
    }

    log::debug("store", "loaded %zu issues from %s (%zu failed)",
               report.issues.size(), dir.c_str(), report.failures.size());
    return report;
}

inline Result<IssueMap> load_issues(const fs::path& dir) {
    auto report = load_all(dir);
    if (!report) return report.error();
    return std::move(report->issues);
}

// Exact id, else every id containing the partial. One match wins.
inline Result<std::string> resolve_issue_id(const std::string& partial, const IssueMap& issues) {
    std::string needle = lowercase(partial);
    if (issues.count(needle)) return needle;

    std::vector<std::string> matches;
    for (const auto& [id, issue] : issues) {
        if (id.find(needle) != std::string::npos) matches.push_back(id);
    }

    if (matches.empty()) return Error::issue_not_found(partial);
    if (matches.size() == 1) return matches.front();
    std::sort(matches.begin(), matches.end());
    return Error::ambiguous_id(partial, std::move(matches));
}

inline Result<std::string> generate_issue_id(const Config& config, const fs::path& issues_dir) {
    static const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    constexpr int max_attempts = 20;

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dist(0, static_cast<int>(sizeof(charset)) - 2);

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        std::string suffix;
        for (int i = 0; i < config.id_len; ++i) suffix += charset[dist(gen)];
        std::string id = config.id_prefix + "-" + suffix;
        if (!path_exists(issue_path(issues_dir, id))) return id;
        log::debug("store", "id collision %s, retrying", id.c_str());
    }
    return Error::other("failed to generate unique ID after " + std::to_string(max_attempts) +
                        " attempts");
}

// Issues in canonical order
inline std::vector<const Issue*> sorted_issues(const IssueMap& issues) {
    std::vector<const Issue*> out;
    out.reserve(issues.size());
    for (const auto& [id, issue] : issues) out.push_back(&issue);
    std::sort(out.begin(), out.end(),
              [](const Issue* a, const Issue* b) { return cmp_by_priority(*a, *b); });
    return out;
}

} // namespace braid
