#pragma once
// Operations: every mutation of the issue store
//
// Each operation runs inside a Session: lock acquired, store
// materialized, every issue loaded. Changed issues are written back
// atomically before the lock is released; commits happen under the
// same lock.

#include "agent.hpp"
#include "config.hpp"
#include "error.hpp"
#include "graph.hpp"
#include "issue.hpp"
#include "layout.hpp"
#include "lock.hpp"
#include "log.hpp"
#include "migrations.hpp"
#include "store.hpp"
#include "sync.hpp"
#include "timestamp.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace braid {

namespace fs = std::filesystem;

// Locked view of the store for one mutation.
// With `pull`, the store is fetched and rebased under the lock before loading.
class Session {
public:
    static Result<Session> open(const Workspace& ws, bool pull = false, bool stash = false) {
        auto lock = LockGuard::acquire(ws.lock_path);
        if (!lock) return lock.error();

        auto store = ensure_store(ws);
        if (!store) return store.error();

        if (pull) {
            auto pulled = pull_before_claim(ws, stash);
            if (!pulled) return pulled.error();
        }

        auto report = load_all(ws.issues_dir);
        if (!report) return report.error();

        // An in-memory config upgrade reaches disk with the first write
        if (ws.config_migrated) {
            auto saved = save_config(ws.config, ws.paths.config_path());
            if (!saved) return saved.error();
            log::debug("config", "persisted migrated config");
        }
        return Session(ws, std::move(*lock), std::move(*report));
    }

    IssueMap& issues() { return report_.issues; }
    const IssueMap& issues() const { return report_.issues; }
    const LoadReport& report() const { return report_; }
    const Workspace& workspace() const { return *ws_; }

    Result<std::string> resolve(const std::string& partial) const {
        return resolve_issue_id(partial, report_.issues);
    }

    Issue& at(const std::string& id) { return report_.issues.at(id); }

    fs::path path_for(const std::string& id) const { return issue_path(ws_->issues_dir, id); }

    Result<void> save(const std::string& id) {
        auto it = report_.issues.find(id);
        if (it == report_.issues.end()) return Error::issue_not_found(id);
        return save_issue(it->second, path_for(id));
    }

    Result<void> save_all(const std::set<std::string>& ids) {
        for (const auto& id : ids) {
            auto saved = save(id);
            if (!saved) return saved;
        }
        return {};
    }

    Result<void> remove(const std::string& id) {
        auto removed = remove_file(path_for(id));
        if (!removed) return removed;
        report_.issues.erase(id);
        return {};
    }

private:
    Session(const Workspace& ws, LockGuard lock, LoadReport report)
        : ws_(&ws), lock_(std::move(lock)), report_(std::move(report)) {}

    const Workspace* ws_;
    LockGuard lock_;
    LoadReport report_;
};

// ============================================================================
// Status transitions
// ============================================================================

inline void mark_started(Issue& issue, const std::string& agent, Timestamp at) {
    issue.status = Status::Doing;
    issue.owner = agent;
    issue.started_at = at;
    issue.completed_at.reset();
}

inline void mark_done(Issue& issue, Timestamp at) {
    issue.status = Status::Done;
    issue.owner.reset();
    if (!issue.started_at) issue.started_at = at;
    issue.completed_at = at;
}

inline void mark_skipped(Issue& issue, Timestamp at) {
    issue.status = Status::Skip;
    issue.owner.reset();
    issue.completed_at = at;
}

inline void mark_reopened(Issue& issue) {
    issue.status = Status::Open;
    issue.owner.reset();
    issue.started_at.reset();
    issue.completed_at.reset();
}

// ============================================================================
// add
// ============================================================================

struct AddOptions {
    std::string title;
    Priority priority = Priority::P2;
    std::optional<IssueType> issue_type;
    std::vector<std::string> deps;
    std::vector<std::string> tags;
    std::vector<std::string> acceptance;
    std::string body;
    std::optional<std::string> scheduled;
};

struct AddResult {
    Issue issue;
    fs::path path;
    IssueMap issues;
};

inline Result<AddResult> add_issue(const Workspace& ws, const AddOptions& opts) {
    if (opts.title.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error::usage("title must not be empty");
    }

    auto session = Session::open(ws);
    if (!session) return session.error();

    Timestamp created = now();
    auto id = generate_issue_id(ws.store_config, ws.issues_dir);
    if (!id) return id.error();

    Issue issue = make_issue(*id, opts.title, opts.priority, created);
    issue.issue_type = opts.issue_type;
    issue.acceptance = opts.acceptance;
    issue.body = opts.body;

    for (const auto& partial : opts.deps) {
        auto dep = session->resolve(partial);
        if (!dep) return dep.error();
        if (!issue.has_dep(*dep)) issue.deps.push_back(*dep);
    }
    for (const auto& tag : opts.tags) {
        if (!tag.empty() && !issue.has_tag(tag)) issue.tags.push_back(tag);
    }
    if (opts.scheduled) {
        auto when = parse_scheduled(*opts.scheduled, created);
        if (!when) return when.error();
        issue.scheduled_for = *when;
    }

    session->issues().emplace(issue.id, issue);
    auto saved = session->save(issue.id);
    if (!saved) return saved.error();
    log::debug("ops", "created %s", issue.id.c_str());

    return AddResult{issue, session->path_for(issue.id), session->issues()};
}

// ============================================================================
// start
// ============================================================================

struct StartOptions {
    std::optional<std::string> id;
    bool force = false;
    bool no_sync = false;
    bool no_push = false;
    bool stash = false;
};

struct StartResult {
    std::string id;
    std::string agent;
    std::vector<Issue> still_doing;  // other issues this agent owns
    IssueMap issues;
};

inline Result<StartResult> start_issue(const Workspace& ws, const StartOptions& opts) {
    auto session = Session::open(ws, !opts.no_sync && ws.config.auto_pull, opts.stash);
    if (!session) return session.error();

    std::string id;
    if (opts.id) {
        auto resolved = session->resolve(*opts.id);
        if (!resolved) return resolved.error();
        id = *resolved;
    } else {
        const Issue* next = next_issue(session->issues());
        if (!next) return Error{ErrorKind::IssueNotFound, "no ready issues", {}};
        id = next->id;
    }

    auto agent = resolve_agent_id(ws.paths.agent_path());
    if (!agent) return agent.error();

    Issue& issue = session->at(id);
    if (issue.status == Status::Doing && !opts.force) {
        return Error::claim_conflict("issue " + id + " is already being worked on by '" +
                                     issue.owner.value_or("unknown") +
                                     "' (use --force to reassign)");
    }
    mark_started(issue, *agent, now());

    auto saved = session->save(id);
    if (!saved) return saved.error();

    if (!opts.no_push && ws.config.auto_push) {
        auto pushed = commit_and_push(ws, "start", id);
        if (!pushed) return pushed.error();
    }

    StartResult result{id, *agent, {}, session->issues()};
    for (const auto& [other_id, other] : result.issues) {
        if (other_id != id && other.status == Status::Doing && other.owner == *agent) {
            result.still_doing.push_back(other);
        }
    }
    return result;
}

// ============================================================================
// done
// ============================================================================

struct DoneOptions {
    std::string id;
    bool force = false;
    std::vector<std::string> results;
    bool no_push = false;
};

struct DoneResult {
    std::string id;
    std::vector<std::string> results;
    std::vector<std::string> updated_dependents;
    IssueMap issues;
};

inline Result<DoneResult> complete_issue(const Workspace& ws, const DoneOptions& opts) {
    auto session = Session::open(ws);
    if (!session) return session.error();

    auto resolved = session->resolve(opts.id);
    if (!resolved) return resolved.error();
    const std::string id = *resolved;
    IssueMap& issues = session->issues();

    if (issues.at(id).is_design() && opts.results.empty() && !opts.force) {
        return Error::other("design issues require --result <issue-id> to specify resulting issues\n"
                            "use --force to close without results");
    }

    DoneResult result;
    result.id = id;
    for (const auto& partial : opts.results) {
        auto r = session->resolve(partial);
        if (!r) return r.error();
        if (*r == id) return Error::other("design issue cannot list itself as a result");
        if (std::find(result.results.begin(), result.results.end(), *r) == result.results.end()) {
            result.results.push_back(*r);
        }
    }

    std::set<std::string> changed;
    if (!result.results.empty()) {
        // Results inherit the finished issue's own deps
        const std::vector<std::string> inherited = issues.at(id).deps;
        for (const auto& r : result.results) {
            for (const auto& dep : inherited) {
                if (dep == r) continue;
                auto added = add_dep_checked(issues, r, dep);
                if (!added) return added.error();
                if (*added) changed.insert(r);
            }
        }

        // Dependents now also wait on every result. Results that depend on
        // the finished issue are siblings, never wired to each other.
        for (const auto& dependent : dependents(id, issues)) {
            if (std::find(result.results.begin(), result.results.end(), dependent) !=
                result.results.end()) {
                continue;
            }
            result.updated_dependents.push_back(dependent);
            for (const auto& r : result.results) {
                auto added = add_dep_checked(issues, dependent, r);
                if (!added) return added.error();
                if (*added) changed.insert(dependent);
            }
        }
    }

    mark_done(issues.at(id), now());
    changed.insert(id);

    auto saved = session->save_all(changed);
    if (!saved) return saved.error();

    if (!opts.no_push && ws.config.auto_push) {
        auto pushed = commit_and_push(ws, "done", id);
        if (!pushed) return pushed.error();
    }

    result.issues = session->issues();
    return result;
}

// ============================================================================
// skip / reopen
// ============================================================================

struct TransitionResult {
    std::string id;
    IssueMap issues;
};

inline Result<TransitionResult> skip_issue(const Workspace& ws, const std::string& partial) {
    auto session = Session::open(ws);
    if (!session) return session.error();
    auto id = session->resolve(partial);
    if (!id) return id.error();

    mark_skipped(session->at(*id), now());
    auto saved = session->save(*id);
    if (!saved) return saved.error();
    return TransitionResult{*id, session->issues()};
}

inline Result<TransitionResult> reopen_issue(const Workspace& ws, const std::string& partial) {
    auto session = Session::open(ws);
    if (!session) return session.error();
    auto id = session->resolve(partial);
    if (!id) return id.error();

    mark_reopened(session->at(*id));
    auto saved = session->save(*id);
    if (!saved) return saved.error();
    return TransitionResult{*id, session->issues()};
}

// ============================================================================
// set
// ============================================================================

struct SetResult {
    std::string id;
    std::string field;
    std::string value;  // normalized, as written
    IssueMap issues;
};

// Apply one field edit. `agent` stamps ownership when status becomes doing.
inline Result<std::string> apply_field(Issue& issue, const std::string& field, const std::string& value,
                                       const std::string& agent, Timestamp at) {
    std::string f = lowercase(field);

    if (f == "priority" || f == "p") {
        auto p = parse_priority(value);
        if (!p) return p.error();
        issue.priority = *p;
        return std::string(to_string(*p));
    }

    if (f == "status" || f == "s") {
        auto s = parse_status(value);
        if (!s) return s.error();
        switch (*s) {
            case Status::Doing:
                issue.status = Status::Doing;
                if (!issue.owner) issue.owner = agent;
                if (!issue.started_at) issue.started_at = at;
                issue.completed_at.reset();
                break;
            case Status::Done: mark_done(issue, at); break;
            case Status::Skip: mark_skipped(issue, at); break;
            case Status::Open:
                issue.status = Status::Open;
                issue.owner.reset();
                issue.completed_at.reset();
                break;
        }
        return std::string(to_string(*s));
    }

    if (f == "type" || f == "t") {
        if (value == "-") {
            issue.issue_type.reset();
            return std::string("-");
        }
        auto t = parse_issue_type(value);
        if (!t) return t.error();
        issue.issue_type = *t;
        return std::string(to_string(*t));
    }

    if (f == "owner" || f == "o") {
        if (value == "-") {
            if (issue.status == Status::Doing) {
                return Error::usage("cannot clear owner of an issue in progress (reopen or finish it first)");
            }
            issue.owner.reset();
            return std::string("-");
        }
        issue.owner = value;
        return value;
    }

    if (f == "title") {
        if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
            return Error::usage("title must not be empty");
        }
        issue.title = value;
        return value;
    }

    if (f == "tag") {
        if (!value.empty() && value[0] == '-') {
            std::string tag = value.substr(1);
            issue.tags.erase(std::remove(issue.tags.begin(), issue.tags.end(), tag), issue.tags.end());
            return value;
        }
        std::string tag = !value.empty() && value[0] == '+' ? value.substr(1) : value;
        if (tag.empty()) return Error::usage("tag must not be empty");
        if (!issue.has_tag(tag)) issue.tags.push_back(tag);
        return "+" + tag;
    }

    if (f == "scheduled" || f == "scheduled_for") {
        if (value == "-") {
            issue.scheduled_for.reset();
            return std::string("-");
        }
        auto when = parse_scheduled(value, at);
        if (!when) return when.error();
        issue.scheduled_for = *when;
        return format_timestamp(*when);
    }

    return Error::usage("unknown field '" + field +
                        "'. supported fields: priority, status, type, owner, title, tag, scheduled");
}

inline Result<SetResult> set_field(const Workspace& ws, const std::string& partial,
                                   const std::string& field, const std::string& value) {
    auto session = Session::open(ws);
    if (!session) return session.error();
    auto id = session->resolve(partial);
    if (!id) return id.error();

    std::string agent;
    std::string f = lowercase(field);
    if ((f == "status" || f == "s") && lowercase(value) == "doing") {
        auto resolved = resolve_agent_id(ws.paths.agent_path());
        if (!resolved) return resolved.error();
        agent = *resolved;
    }

    auto written = apply_field(session->at(*id), field, value, agent, now());
    if (!written) return written.error();

    auto saved = session->save(*id);
    if (!saved) return saved.error();
    return SetResult{*id, field, *written, session->issues()};
}

// ============================================================================
// rm
// ============================================================================

inline Result<std::string> remove_issue(const Workspace& ws, const std::string& partial, bool force) {
    auto session = Session::open(ws);
    if (!session) return session.error();
    auto id = session->resolve(partial);
    if (!id) return id.error();

    if (session->at(*id).status == Status::Doing && !force) {
        return Error::other("issue " + *id + " is in progress (use --force to delete anyway)");
    }
    auto removed = session->remove(*id);
    if (!removed) return removed.error();
    return *id;
}

// ============================================================================
// dep add / dep rm
// ============================================================================

struct DepChange {
    std::string child;
    std::string parent;
    bool changed = false;
};

inline Result<DepChange> add_dependency(const Workspace& ws, const std::string& child_partial,
                                        const std::string& parent_partial) {
    auto session = Session::open(ws);
    if (!session) return session.error();
    auto child = session->resolve(child_partial);
    if (!child) return child.error();
    auto parent = session->resolve(parent_partial);
    if (!parent) return parent.error();

    auto added = add_dep_checked(session->issues(), *child, *parent);
    if (!added) return added.error();
    if (*added) {
        auto saved = session->save(*child);
        if (!saved) return saved.error();
    }
    return DepChange{*child, *parent, *added};
}

inline Result<DepChange> remove_dependency(const Workspace& ws, const std::string& child_partial,
                                           const std::string& parent_partial) {
    auto session = Session::open(ws);
    if (!session) return session.error();
    auto child = session->resolve(child_partial);
    if (!child) return child.error();
    auto parent = session->resolve(parent_partial);
    if (!parent) return parent.error();

    Issue& issue = session->at(*child);
    auto it = std::find(issue.deps.begin(), issue.deps.end(), *parent);
    DepChange change{*child, *parent, it != issue.deps.end()};
    if (change.changed) {
        issue.deps.erase(it);
        auto saved = session->save(*child);
        if (!saved) return saved.error();
    }
    return change;
}

// ============================================================================
// migrate
// ============================================================================

struct MigrationEntry {
    std::string id;
    int from_version = 0;
    int to_version = migrations::CURRENT_VERSION;
    std::vector<std::string> steps;
};

struct MigrateReport {
    bool dry_run = false;
    bool config_migrated = false;
    std::vector<MigrationEntry> entries;
};

inline Result<MigrateReport> migrate_store(const Workspace& ws, bool dry_run) {
    MigrateReport report;
    report.dry_run = dry_run;
    report.config_migrated = ws.config_migrated;

    auto collect = [&](const LoadReport& loaded) {
        for (const auto& id : loaded.needing_migration()) {
            int from = loaded.declared_versions.at(id);
            report.entries.push_back({id, from, migrations::CURRENT_VERSION,
                                      migrations::migration_summary(from, migrations::CURRENT_VERSION)});
        }
    };

    if (dry_run) {
        auto loaded = load_all(ws.issues_dir);
        if (!loaded) return loaded.error();
        collect(*loaded);
        return report;
    }

    // Session::open persists a migrated config
    auto session = Session::open(ws);
    if (!session) return session.error();
    collect(session->report());
    for (const auto& entry : report.entries) {
        auto saved = session->save(entry.id);
        if (!saved) return saved.error();
        log::debug("migrate", "rewrote %s v%d -> v%d", entry.id.c_str(), entry.from_version,
                   entry.to_version);
    }
    return report;
}

// ============================================================================
// init
// ============================================================================

struct InitResult {
    fs::path braid_dir;
    fs::path worktree;
    bool created_config = false;
    std::string id_prefix;
};

inline Result<InitResult> init_braid(const RepoPaths& paths) {
    auto lock = LockGuard::acquire(paths.lock_path());
    if (!lock) return lock.error();

    auto issues = ensure_dir(paths.local_issues_dir());
    if (!issues) return issues.error();

    InitResult result;
    result.braid_dir = paths.braid_dir();
    result.worktree = paths.worktree_root;

    if (!path_exists(paths.config_path())) {
        Config config = config_with_derived_prefix(paths.worktree_root.filename().string());
        auto saved = save_config(config, paths.config_path());
        if (!saved) return saved.error();
        result.created_config = true;
        result.id_prefix = config.id_prefix;
    } else {
        auto config = load_config(paths.config_path(), paths.worktree_root);
        if (!config) return config.error();
        result.id_prefix = config->id_prefix;
    }

    auto ignore = write_atomic(paths.gitignore_path(), "agent.toml\nruntime/\n");
    if (!ignore) return ignore.error();

    if (!path_exists(paths.agent_path())) {
        auto agent = write_agent_file(paths.agent_path(), user_or_default());
        if (!agent) return agent.error();
    }
    return result;
}

} // namespace braid
