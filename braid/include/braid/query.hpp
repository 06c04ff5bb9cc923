#pragma once
// Query: read-only views over a loaded store
//
// Readers take no lock. They load whatever parses and warn about the rest.

#include "agent.hpp"
#include "error.hpp"
#include "git.hpp"
#include "graph.hpp"
#include "issue.hpp"
#include "layout.hpp"
#include "store.hpp"
#include <algorithm>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace braid {

struct ListFilter {
    std::optional<Status> status;
    std::optional<Priority> priority;
    bool ready = false;
    bool blocked = false;
    bool all = false;                // include done/skip without a status filter
    std::vector<std::string> tags;   // every tag must be present
};

// Matching issues in canonical order
inline std::vector<const Issue*> filter_issues(const IssueMap& issues, const ListFilter& filter) {
    std::vector<const Issue*> out;
    for (const Issue* issue : sorted_issues(issues)) {
        if (filter.status) {
            if (issue->status != *filter.status) continue;
        } else if (!filter.all && (issue->status == Status::Done || issue->status == Status::Skip)) {
            continue;
        }
        if (filter.priority && issue->priority != *filter.priority) continue;
        if (filter.ready || filter.blocked) {
            Derived d = compute_derived(*issue, issues);
            if (filter.ready && !d.is_ready) continue;
            if (filter.blocked && !d.is_blocked) continue;
        }
        bool tagged = std::all_of(filter.tags.begin(), filter.tags.end(),
                                  [&](const std::string& t) { return issue->has_tag(t); });
        if (!tagged) continue;
        out.push_back(issue);
    }
    return out;
}

struct StatusCounts {
    size_t open = 0;
    size_t doing = 0;
    size_t done = 0;
    size_t skip = 0;
};

inline StatusCounts count_by_status(const IssueMap& issues) {
    StatusCounts counts;
    for (const auto& [id, issue] : issues) {
        switch (issue.status) {
            case Status::Open: ++counts.open; break;
            case Status::Doing: ++counts.doing; break;
            case Status::Done: ++counts.done; break;
            case Status::Skip: ++counts.skip; break;
        }
    }
    return counts;
}

// Position of the committing checkout relative to its upstream
struct SyncInfo {
    std::string state;  // up-to-date, ahead, behind, diverged, no-upstream, missing-worktree, unknown
    std::optional<std::string> upstream;
    std::optional<int> ahead;
    std::optional<int> behind;
};

inline SyncInfo read_sync_info(const Workspace& ws) {
    SyncInfo info;
    if (ws.issues_branch && !path_exists(ws.sync_root / ".git")) {
        info.state = "missing-worktree";
        return info;
    }

    auto branch = git::current_branch(ws.sync_root);
    if (!branch) {
        info.state = "unknown";
        return info;
    }

    auto upstream = git::run(ws.sync_root, {"rev-parse", "--abbrev-ref", *branch + "@{u}"});
    if (!upstream || !upstream->ok() || upstream->trimmed().empty()) {
        info.state = "no-upstream";
        return info;
    }
    info.upstream = upstream->trimmed();

    auto counts = git::run(ws.sync_root,
                           {"rev-list", "--left-right", "--count", *info.upstream + "...HEAD"});
    int behind = 0, ahead = 0;
    if (!counts || !counts->ok() || !(std::istringstream(counts->trimmed()) >> behind >> ahead)) {
        info.state = "unknown";
        return info;
    }
    info.ahead = ahead;
    info.behind = behind;
    if (ahead == 0 && behind == 0) info.state = "up-to-date";
    else if (behind == 0) info.state = "ahead";
    else if (ahead == 0) info.state = "behind";
    else info.state = "diverged";
    return info;
}

struct StatusReport {
    Mode mode = Mode::GitNative;
    std::optional<std::string> branch;
    std::optional<std::string> external_repo;
    std::string agent;
    std::string prefix;
    fs::path issues_dir;
    StatusCounts counts;
    size_t ready = 0;
    std::vector<std::string> mine;  // doing, owned by this agent
    SyncInfo sync;
};

inline Result<StatusReport> build_status(const Workspace& ws) {
    auto issues = load_issues(ws.issues_dir);
    if (!issues) return issues.error();
    auto agent = resolve_agent_id(ws.paths.agent_path());
    if (!agent) return agent.error();

    StatusReport report;
    report.mode = ws.mode;
    report.branch = ws.issues_branch;
    report.external_repo = ws.config.issues_repo;
    report.agent = *agent;
    report.prefix = ws.store_config.id_prefix;
    report.issues_dir = ws.issues_dir;
    report.counts = count_by_status(*issues);
    report.ready = ready_issues(*issues).size();
    for (const Issue* issue : sorted_issues(*issues)) {
        if (issue->status == Status::Doing && issue->owner == *agent) report.mine.push_back(issue->id);
    }
    report.sync = read_sync_info(ws);
    return report;
}

} // namespace braid
