#pragma once
// Output: JSON shapes and human-readable rendering for the CLI
//
// JSON is built with nlohmann::json and printed with two-space indent.
// Text goes to the stream passed in so tests can capture it.

#include "doctor.hpp"
#include "error.hpp"
#include "graph.hpp"
#include "issue.hpp"
#include "layout.hpp"
#include "query.hpp"
#include "store.hpp"
#include "timestamp.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace braid {

using json = nlohmann::json;

inline void print_json(const json& j, std::ostream& out = std::cout) {
    out << j.dump(2) << "\n";
}

inline json optional_json(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

inline json optional_json(const std::optional<Timestamp>& t) {
    return t ? json(format_timestamp(*t)) : json(nullptr);
}

inline json derived_to_json(const Derived& d) {
    return {
        {"is_ready", d.is_ready},
        {"is_blocked", d.is_blocked},
        {"open_deps", d.open_deps},
        {"missing_deps", d.missing_deps}
    };
}

inline json issue_to_json(const Issue& issue, const IssueMap& issues) {
    return {
        {"id", issue.id},
        {"title", issue.title},
        {"priority", to_string(issue.priority)},
        {"status", to_string(issue.status)},
        {"type", issue.issue_type ? json(to_string(*issue.issue_type)) : json(nullptr)},
        {"deps", issue.deps},
        {"tags", issue.tags},
        {"owner", optional_json(issue.owner)},
        {"created_at", format_timestamp(issue.created_at)},
        {"started_at", optional_json(issue.started_at)},
        {"completed_at", optional_json(issue.completed_at)},
        {"scheduled_for", optional_json(issue.scheduled_for)},
        {"acceptance", issue.acceptance},
        {"body", issue.body},
        {"derived", derived_to_json(compute_derived(issue, issues))}
    };
}

inline json issues_to_json(const std::vector<const Issue*>& list, const IssueMap& issues) {
    json arr = json::array();
    for (const Issue* issue : list) arr.push_back(issue_to_json(*issue, issues));
    return arr;
}

inline json error_to_json(const Error& error) {
    json j = {
        {"ok", false},
        {"code", error.code()},
        {"message", error.message},
        {"exit_code", error.exit_code()}
    };
    if (error.kind == ErrorKind::AmbiguousId) j["candidates"] = error.candidates;
    return j;
}

inline json agent_worktrees_to_json(const std::vector<AgentWorktree>& worktrees) {
    json arr = json::array();
    for (const auto& wt : worktrees) {
        arr.push_back({{"branch", wt.branch}, {"path", wt.path.string()}});
    }
    return arr;
}

inline json doctor_to_json(const DoctorReport& report) {
    json checks = json::array();
    for (const auto& c : report.checks) {
        checks.push_back({{"name", c.name}, {"description", c.description}, {"passed", c.passed}});
    }
    json errors = json::array();
    for (const auto& e : report.errors) {
        if (e.code == "missing_dep") {
            errors.push_back({{"code", e.code}, {"issue", e.issue}, {"dep", e.dep}});
        } else if (e.code == "cycle") {
            errors.push_back({{"code", e.code}, {"cycle", e.cycle}});
        } else {
            errors.push_back({{"code", e.code}, {"message", e.message}});
        }
    }
    return {{"ok", report.ok()}, {"checks", checks}, {"errors", errors},
            {"warnings", report.warnings}};
}

inline json status_to_json(const StatusReport& report) {
    json j = {
        {"mode", to_string(report.mode)},
        {"agent", report.agent},
        {"prefix", report.prefix},
        {"issues_dir", report.issues_dir.string()},
        {"issues", {
            {"open", report.counts.open},
            {"doing", report.counts.doing},
            {"done", report.counts.done},
            {"skip", report.counts.skip}
        }},
        {"ready", report.ready},
        {"current", report.mine},
        {"sync", {
            {"status", report.sync.state},
            {"upstream", optional_json(report.sync.upstream)},
            {"ahead", report.sync.ahead ? json(*report.sync.ahead) : json(nullptr)},
            {"behind", report.sync.behind ? json(*report.sync.behind) : json(nullptr)}
        }}
    };
    if (report.branch) j["branch"] = *report.branch;
    if (report.external_repo) j["external_repo"] = *report.external_repo;
    return j;
}

// ============================================================================
// Text rendering
// ============================================================================

// "ID  P  status  title (deps:N open:M)"
inline std::string format_issue_line(const Issue& issue, const IssueMap& issues) {
    std::string line = issue.id + "  " + to_string(issue.priority) + "  " +
                       to_string(issue.status) + "  " + issue.title;
    if (!issue.deps.empty()) {
        Derived d = compute_derived(issue, issues);
        line += " (deps:" + std::to_string(issue.deps.size()) +
                " open:" + std::to_string(d.open_deps.size()) + ")";
    }
    return line;
}

inline void print_issue_list(std::ostream& out, const std::vector<const Issue*>& list,
                             const IssueMap& issues) {
    if (list.empty()) {
        out << "No issues found.\n";
        return;
    }
    for (const Issue* issue : list) out << format_issue_line(*issue, issues) << "\n";
}

// "ID  P  title", used by ready and next
inline void print_ready_list(std::ostream& out, const std::vector<const Issue*>& list) {
    if (list.empty()) {
        out << "No ready issues.\n";
        return;
    }
    for (const Issue* issue : list) {
        out << issue->id << "  " << to_string(issue->priority) << "  " << issue->title << "\n";
    }
}

namespace detail {

inline void labelled(std::ostream& out, const std::string& label, const std::string& value) {
    std::string padded = label + ":";
    if (padded.size() < 10) padded.resize(10, ' ');
    else padded += ' ';
    out << padded << value << "\n";
}

} // namespace detail

inline void print_issue_detail(std::ostream& out, const Issue& issue, const IssueMap& issues,
                               Timestamp reference) {
    detail::labelled(out, "ID", issue.id);
    detail::labelled(out, "Title", issue.title);
    detail::labelled(out, "Priority", to_string(issue.priority));
    detail::labelled(out, "Status", to_string(issue.status));
    if (issue.issue_type) detail::labelled(out, "Type", to_string(*issue.issue_type));
    if (!issue.deps.empty()) detail::labelled(out, "Deps", join(issue.deps, ", "));
    if (!issue.tags.empty()) detail::labelled(out, "Tags", join(issue.tags, ", "));
    if (issue.owner) detail::labelled(out, "Owner", *issue.owner);
    detail::labelled(out, "Created", format_timestamp(issue.created_at));
    if (issue.started_at) detail::labelled(out, "Started", format_timestamp(*issue.started_at));
    if (issue.completed_at) detail::labelled(out, "Completed", format_timestamp(*issue.completed_at));
    if (issue.scheduled_for) {
        detail::labelled(out, "Scheduled", format_timestamp(*issue.scheduled_for) + " (" +
                                           format_relative(*issue.scheduled_for, reference) + ")");
    }

    Derived d = compute_derived(issue, issues);
    if (d.is_ready) {
        detail::labelled(out, "State", "READY");
    } else if (d.is_blocked) {
        detail::labelled(out, "State", "BLOCKED");
        if (!d.open_deps.empty()) out << "  open:   " << join(d.open_deps, ", ") << "\n";
        if (!d.missing_deps.empty()) out << "  missing: " << join(d.missing_deps, ", ") << "\n";
    }

    if (!issue.acceptance.empty()) {
        out << "\nAcceptance:\n";
        for (const auto& ac : issue.acceptance) out << "  - " << ac << "\n";
    }
    if (!issue.body.empty()) out << "\n" << issue.body << "\n";
}

inline void print_status(std::ostream& out, const StatusReport& report) {
    std::string header = "braid status";
    out << header << "\n" << std::string(header.size(), '-') << "\n";

    std::string mode = to_string(report.mode);
    if (report.branch) mode += " (branch: " + *report.branch + ")";
    if (report.external_repo) mode += " (" + *report.external_repo + ")";
    detail::labelled(out, "Mode", mode);
    detail::labelled(out, "Agent", report.agent);
    detail::labelled(out, "Prefix", report.prefix);
    detail::labelled(out, "Store", report.issues_dir.string());

    std::string counts = std::to_string(report.counts.open) + " open, " +
                         std::to_string(report.counts.doing) + " doing, " +
                         std::to_string(report.counts.done) + " done";
    if (report.counts.skip > 0) counts += ", " + std::to_string(report.counts.skip) + " skip";
    detail::labelled(out, "Issues", counts);
    detail::labelled(out, "Ready", std::to_string(report.ready));
    if (!report.mine.empty()) detail::labelled(out, "Current", join(report.mine, ", "));

    const SyncInfo& s = report.sync;
    std::string sync;
    std::string up = s.upstream ? *s.upstream : "";
    if (s.state == "up-to-date") sync = "up to date with " + up;
    else if (s.state == "ahead") sync = "ahead of " + up + " by " + std::to_string(*s.ahead);
    else if (s.state == "behind") sync = "behind " + up + " by " + std::to_string(*s.behind);
    else if (s.state == "diverged") {
        sync = "diverged from " + up + " (ahead " + std::to_string(*s.ahead) + ", behind " +
               std::to_string(*s.behind) + ")";
    } else if (s.state == "no-upstream") sync = "no upstream";
    else if (s.state == "missing-worktree") sync = "issues worktree missing";
    else sync = "unknown";
    detail::labelled(out, "Sync", sync);
}

// Checks on stdout, findings on stderr
inline void print_doctor(std::ostream& out, std::ostream& err, const DoctorReport& report) {
    for (const auto& c : report.checks) {
        out << (c.passed ? "✓ " : "✗ ") << c.description << "\n";
    }
    for (const auto& w : report.warnings) err << "  warning: " << w << "\n";
    if (report.ok()) return;

    out << "\n";
    for (const auto& e : report.errors) err << "  error: " << e.message << "\n";
}

inline void print_agent_worktree_warning(std::ostream& out, const std::vector<AgentWorktree>& worktrees) {
    if (worktrees.empty()) return;
    out << "\nWarning: Found " << worktrees.size()
        << " agent worktree(s) that need to rebase on main:\n";
    for (const auto& wt : worktrees) {
        out << "  - " << wt.branch << " (at " << wt.path.string() << ")\n";
    }
    out << "\nRun `git rebase main` in each worktree to pick up the new config.\n";
}

} // namespace braid
