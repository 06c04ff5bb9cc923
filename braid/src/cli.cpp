// brd: command-line interface for braid issue tracking
//
// Usage: brd [--json] [--verbose] [-C DIR] <command> [args]
//
// Commands:
//   init       Set up .braid in this repository
//   add        Create an issue
//   ls         List issues
//   start      Claim an issue
//   done       Finish an issue
//   doctor     Validate the store
//   agent      Create agent worktrees
//   help       Show this help

#include <braid/braid.hpp>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace braid;

namespace fs = std::filesystem;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "brd " << BRAID_VERSION << " - repo-local issue tracking for agents\n\n"
              << "Usage: " << name << " [--json] [--verbose] [-C DIR] <command> [args]\n\n"
              << "Issues:\n"
              << "  init                     Initialize braid in this repository\n"
              << "  add TITLE                Create an issue\n"
              << "  ls                       List issues (open and doing by default)\n"
              << "  show ID                  Show one issue\n"
              << "  ready                    List issues ready to start\n"
              << "  next                     Show the next issue to start\n"
              << "  path ID                  Print the issue file path\n"
              << "  status                   Summarize mode, agent and counts\n"
              << "  doctor                   Validate config, issues and graph\n\n"
              << "Workflow:\n"
              << "  start [ID]               Claim an issue (next ready if omitted)\n"
              << "  done ID                  Mark done (design issues need --result)\n"
              << "  skip ID                  Mark skipped\n"
              << "  reopen ID                Return an issue to open\n"
              << "  set ID FIELD VALUE       Edit priority|status|type|owner|title|tag|scheduled\n"
              << "  rm ID                    Delete an issue\n"
              << "  dep add CHILD PARENT     CHILD is blocked by PARENT\n"
              << "  dep rm CHILD PARENT      Remove a dependency\n"
              << "  migrate                  Rewrite issues at the current schema\n"
              << "  commit                   Commit pending .braid changes\n"
              << "  sync                     Sync the issues branch with its remote\n"
              << "  config [show]            Show the repo config\n"
              << "  config issues-branch [NAME|--clear]\n"
              << "  config external-repo [PATH|--clear]\n"
              << "  config auto-sync [on|off]\n"
              << "  agent init NAME          Create a worktree for another agent\n\n"
              << "Options:\n"
              << "  --json                   Output as JSON\n"
              << "  --verbose                Enable verbose debug logging\n"
              << "  -C DIR                   Run as if started in DIR\n"
              << "  -p, --priority P         P0..P3 (add, ls)\n"
              << "  -t, --type TYPE          design|meta (add)\n"
              << "  -d, --dep ID             Dependency (add, repeatable)\n"
              << "  --tag TAG                Tag (add, ls; repeatable)\n"
              << "  --ac TEXT                Acceptance criterion (add, repeatable)\n"
              << "  -b, --body TEXT          Issue body (add)\n"
              << "  --scheduled DATE         YYYY-MM-DD, +Nd, +Nw, +Nmo, tomorrow (add)\n"
              << "  --status S               Filter by status (ls)\n"
              << "  --ready, --blocked       Filter by readiness (ls)\n"
              << "  -a, --all                Include done and skipped issues (ls)\n"
              << "  -f, --force              Override claim, design and in-progress checks\n"
              << "  -r, --result ID          Resulting issue of a design (done, repeatable)\n"
              << "  --no-sync                Skip fetch/rebase before start\n"
              << "  --no-push                Skip commit/push after start or done\n"
              << "  --stash                  Stash unrelated changes around the pre-start rebase\n"
              << "  --dry-run                Only report (migrate)\n"
              << "  -m, --message MSG        Commit message (commit)\n"
              << "  --push                   Push even without an upstream (sync)\n"
              << "  --clear                  Remove the setting (config)\n"
              << "  --base BRANCH            Branch to start from (agent init)\n"
              << "  -V, --version            Show version\n";
}

struct Options {
    bool json = false;
    std::optional<std::string> dir;
    std::string command;
    std::vector<std::string> args;

    std::optional<std::string> priority;
    std::optional<std::string> type;
    std::vector<std::string> deps;
    std::vector<std::string> tags;
    std::vector<std::string> acceptance;
    std::string body;
    std::optional<std::string> scheduled;
    std::optional<std::string> status;
    std::vector<std::string> results;
    std::optional<std::string> message;
    std::optional<std::string> base;

    bool ready = false;
    bool blocked = false;
    bool all = false;
    bool force = false;
    bool no_sync = false;
    bool no_push = false;
    bool stash = false;
    bool dry_run = false;
    bool push = false;
    bool clear = false;
};

static int report_error(const Error& error, bool json_output) {
    if (json_output) {
        print_json(error_to_json(error));
    } else {
        std::cerr << "error: " << error.message << "\n";
    }
    return error.exit_code();
}

static Error usage_error(const std::string& usage) {
    return Error::usage("usage: brd " + usage);
}

static const std::string& arg(const Options& o, size_t i) {
    return o.args.at(i);
}

// ============================================================================
// Readers
// ============================================================================

int cmd_ls(const Workspace& ws, const Options& o) {
    ListFilter filter;
    if (o.status) {
        auto s = parse_status(*o.status);
        if (!s) return report_error(s.error(), o.json);
        filter.status = *s;
    }
    if (o.priority) {
        auto p = parse_priority(*o.priority);
        if (!p) return report_error(p.error(), o.json);
        filter.priority = *p;
    }
    filter.ready = o.ready;
    filter.blocked = o.blocked;
    filter.all = o.all;
    filter.tags = o.tags;

    auto issues = load_issues(ws.issues_dir);
    if (!issues) return report_error(issues.error(), o.json);

    auto list = filter_issues(*issues, filter);
    if (o.json) {
        print_json(issues_to_json(list, *issues));
    } else {
        print_issue_list(std::cout, list, *issues);
    }
    return 0;
}

int cmd_show(const Workspace& ws, const Options& o) {
    if (o.args.size() != 1) return report_error(usage_error("show ID"), o.json);

    auto issues = load_issues(ws.issues_dir);
    if (!issues) return report_error(issues.error(), o.json);
    auto id = resolve_issue_id(arg(o, 0), *issues);
    if (!id) return report_error(id.error(), o.json);

    const Issue& issue = issues->at(*id);
    if (o.json) {
        print_json(issue_to_json(issue, *issues));
    } else {
        print_issue_detail(std::cout, issue, *issues, now());
    }
    return 0;
}

int cmd_ready(const Workspace& ws, const Options& o) {
    auto issues = load_issues(ws.issues_dir);
    if (!issues) return report_error(issues.error(), o.json);

    auto ready = ready_issues(*issues);
    if (o.json) {
        print_json(issues_to_json(ready, *issues));
    } else {
        print_ready_list(std::cout, ready);
    }
    return 0;
}

int cmd_next(const Workspace& ws, const Options& o) {
    auto issues = load_issues(ws.issues_dir);
    if (!issues) return report_error(issues.error(), o.json);

    const Issue* next = next_issue(*issues);
    if (o.json) {
        print_json(next ? issue_to_json(*next, *issues) : json(nullptr));
    } else if (next) {
        print_ready_list(std::cout, {next});
    } else {
        std::cout << "No ready issues.\n";
    }
    return 0;
}

int cmd_path(const Workspace& ws, const Options& o) {
    if (o.args.size() != 1) return report_error(usage_error("path ID"), o.json);

    auto issues = load_issues(ws.issues_dir);
    if (!issues) return report_error(issues.error(), o.json);
    auto id = resolve_issue_id(arg(o, 0), *issues);
    if (!id) return report_error(id.error(), o.json);

    fs::path path = canonical_or_self(issue_path(ws.issues_dir, *id));
    if (o.json) {
        print_json({{"ok", true}, {"id", *id}, {"path", path.string()}});
    } else {
        std::cout << path.string() << "\n";
    }
    return 0;
}

int cmd_status(const Workspace& ws, const Options& o) {
    auto report = build_status(ws);
    if (!report) return report_error(report.error(), o.json);
    if (o.json) {
        print_json(status_to_json(*report));
    } else {
        print_status(std::cout, *report);
    }
    return 0;
}

int cmd_doctor(const RepoPaths& paths, const Options& o) {
    auto report = run_doctor(paths);
    if (!report) return report_error(report.error(), o.json);

    if (o.json) {
        print_json(doctor_to_json(*report));
        return report->status() ? 0 : report->status().error().exit_code();
    }
    print_doctor(std::cout, std::cerr, *report);
    auto status = report->status();
    if (!status) return report_error(status.error(), false);
    return 0;
}

// ============================================================================
// Mutations
// ============================================================================

int cmd_init(const RepoPaths& paths, const Options& o) {
    auto result = init_braid(paths);
    if (!result) return report_error(result.error(), o.json);

    if (o.json) {
        print_json({{"ok", true},
                    {"braid_dir", result->braid_dir.string()},
                    {"worktree", result->worktree.string()}});
    } else {
        std::cout << "Initialized braid in " << result->braid_dir.string() << "\n\n"
                  << "next steps:\n"
                  << "  brd add \"my first task\"     # create an issue\n";
    }
    return 0;
}

int cmd_add(const Workspace& ws, const Options& o) {
    if (o.args.size() != 1) return report_error(usage_error("add TITLE [options]"), o.json);

    AddOptions opts;
    opts.title = arg(o, 0);
    if (o.priority) {
        auto p = parse_priority(*o.priority);
        if (!p) return report_error(p.error(), o.json);
        opts.priority = *p;
    }
    if (o.type) {
        auto t = parse_issue_type(*o.type);
        if (!t) return report_error(t.error(), o.json);
        opts.issue_type = *t;
    }
    opts.deps = o.deps;
    opts.tags = o.tags;
    opts.acceptance = o.acceptance;
    opts.body = o.body;
    opts.scheduled = o.scheduled;

    auto result = add_issue(ws, opts);
    if (!result) return report_error(result.error(), o.json);

    if (o.json) {
        print_json(issue_to_json(result->issue, result->issues));
    } else {
        std::cout << "Created issue: " << result->issue.id << "\n"
                  << "  " << result->path.string() << "\n";
    }
    return 0;
}

int cmd_start(const Workspace& ws, const Options& o) {
    if (o.args.size() > 1) return report_error(usage_error("start [ID] [--force]"), o.json);

    StartOptions opts;
    if (!o.args.empty()) opts.id = arg(o, 0);
    opts.force = o.force;
    opts.no_sync = o.no_sync;
    opts.no_push = o.no_push;
    opts.stash = o.stash;

    auto result = start_issue(ws, opts);
    if (!result) return report_error(result.error(), o.json);

    if (!result->still_doing.empty() && !o.json) {
        std::cerr << "warning: you have " << result->still_doing.size()
                  << " issue(s) still in progress:\n";
        for (const auto& other : result->still_doing) {
            std::cerr << "  - " << other.id << ": " << other.title << "\n";
        }
        std::cerr << "\n";
    }

    if (o.json) {
        print_json(issue_to_json(result->issues.at(result->id), result->issues));
    } else {
        std::cout << "Started: " << result->id << " (owner: " << result->agent << ")\n";
    }
    return 0;
}

int cmd_done(const Workspace& ws, const Options& o) {
    if (o.args.size() != 1) return report_error(usage_error("done ID [--result ID]... [--force]"), o.json);

    DoneOptions opts;
    opts.id = arg(o, 0);
    opts.force = o.force;
    opts.results = o.results;
    opts.no_push = o.no_push;

    auto result = complete_issue(ws, opts);
    if (!result) return report_error(result.error(), o.json);

    if (!result->results.empty() && !result->updated_dependents.empty() && !o.json) {
        std::cerr << "updated deps for " << result->updated_dependents.size()
                  << " issue(s): " << join(result->updated_dependents, ", ") << "\n";
    }

    if (o.json) {
        print_json(issue_to_json(result->issues.at(result->id), result->issues));
    } else {
        std::cout << "Done: " << result->id << "\n";
    }
    return 0;
}

int cmd_transition(const Workspace& ws, const Options& o, bool skip) {
    const char* name = skip ? "skip" : "reopen";
    if (o.args.size() != 1) return report_error(usage_error(std::string(name) + " ID"), o.json);

    auto result = skip ? skip_issue(ws, arg(o, 0)) : reopen_issue(ws, arg(o, 0));
    if (!result) return report_error(result.error(), o.json);

    if (o.json) {
        print_json(issue_to_json(result->issues.at(result->id), result->issues));
    } else {
        std::cout << (skip ? "Skipped: " : "Reopened: ") << result->id << "\n";
    }
    return 0;
}

int cmd_set(const Workspace& ws, const Options& o) {
    if (o.args.size() != 3) return report_error(usage_error("set ID FIELD VALUE"), o.json);

    auto result = set_field(ws, arg(o, 0), arg(o, 1), arg(o, 2));
    if (!result) return report_error(result.error(), o.json);

    if (o.json) {
        print_json(issue_to_json(result->issues.at(result->id), result->issues));
    } else {
        std::cout << result->id << " " << result->field << " = " << result->value << "\n";
    }
    return 0;
}

int cmd_rm(const Workspace& ws, const Options& o) {
    if (o.args.size() != 1) return report_error(usage_error("rm ID [--force]"), o.json);

    auto id = remove_issue(ws, arg(o, 0), o.force);
    if (!id) return report_error(id.error(), o.json);

    if (o.json) {
        print_json({{"ok", true}, {"deleted", *id}});
    } else {
        std::cout << "Deleted: " << *id << "\n";
    }
    return 0;
}

int cmd_dep(const Workspace& ws, const Options& o) {
    if (o.args.size() != 3 || (arg(o, 0) != "add" && arg(o, 0) != "rm")) {
        return report_error(usage_error("dep add|rm CHILD PARENT"), o.json);
    }
    bool adding = arg(o, 0) == "add";

    auto change = adding ? add_dependency(ws, arg(o, 1), arg(o, 2))
                         : remove_dependency(ws, arg(o, 1), arg(o, 2));
    if (!change) return report_error(change.error(), o.json);

    if (o.json) {
        print_json({{"ok", true}});
    } else if (adding) {
        std::cout << "added dependency: " << change->child << " blocked by " << change->parent << "\n";
    } else {
        std::cout << "removed dependency: " << change->child << " no longer blocked by "
                  << change->parent << "\n";
    }
    return 0;
}

int cmd_migrate(const Workspace& ws, const Options& o) {
    auto report = migrate_store(ws, o.dry_run);
    if (!report) return report_error(report.error(), o.json);

    const int current = migrations::CURRENT_VERSION;
    if (o.json) {
        json entries = json::array();
        for (const auto& e : report->entries) {
            entries.push_back({{"id", e.id},
                               {"from_version", e.from_version},
                               {"to_version", e.to_version},
                               {"migrations", e.steps}});
        }
        size_t n = report->entries.size();
        print_json({{"ok", true},
                    {"dry_run", report->dry_run},
                    {"migrated", report->dry_run ? 0 : n},
                    {"would_migrate", report->dry_run ? n : 0},
                    {"config_migrated", report->config_migrated},
                    {"issues", entries}});
        return 0;
    }

    if (report->config_migrated) {
        std::cout << (report->dry_run ? "config.toml would be migrated to v"
                                      : "migrated config.toml to v")
                  << current << "\n";
    }
    if (report->entries.empty()) {
        if (!path_exists(ws.issues_dir)) {
            std::cout << "No issues to migrate.\n";
        } else {
            std::cout << "All issues are up to date (schema v" << current << ").\n";
        }
        return 0;
    }

    for (const auto& e : report->entries) {
        if (report->dry_run) {
            std::cout << e.id << ": v" << e.from_version << " → v" << e.to_version
                      << " (" << join(e.steps, ", ") << ")\n";
        } else {
            std::cout << "migrated " << e.id << ": v" << e.from_version << " → v" << e.to_version
                      << "\n";
        }
    }
    if (report->dry_run) {
        std::cout << "\n" << report->entries.size()
                  << " issue(s) would be migrated. Run without --dry-run to apply.\n";
    } else {
        std::cout << "\nMigrated " << report->entries.size() << " issue(s).\n";
    }
    return 0;
}

int cmd_commit(const Workspace& ws, const Options& o) {
    auto outcome = commit_pending(ws, o.message);
    if (!outcome) return report_error(outcome.error(), o.json);

    if (o.json) {
        if (outcome->committed) {
            print_json({{"ok", true}, {"message", "committed"}, {"commit_message", outcome->message}});
        } else {
            print_json({{"ok", true}, {"message", "nothing to commit"}});
        }
    } else if (outcome->committed) {
        std::cout << "committed: " << outcome->message << "\n";
    } else {
        std::cout << "nothing to commit\n";
    }
    return 0;
}

int cmd_sync(const Workspace& ws, const Options& o) {
    auto outcome = sync_issues(ws, o.push);
    if (!outcome) return report_error(outcome.error(), o.json);

    if (o.json) {
        print_json({{"ok", true},
                    {"branch", outcome->branch},
                    {"issues_worktree", outcome->issues_worktree.string()}});
    } else {
        std::cout << "Sync complete.\n";
    }
    return 0;
}

// ============================================================================
// config
// ============================================================================

static json config_to_json(const Config& c) {
    return {{"schema_version", c.schema_version},
            {"id_prefix", c.id_prefix},
            {"id_len", c.id_len},
            {"issues_branch", optional_json(c.issues_branch)},
            {"issues_repo", optional_json(c.issues_repo)},
            {"auto_pull", c.auto_pull},
            {"auto_push", c.auto_push}};
}

int cmd_config_issues_branch(const RepoPaths& paths, const Config& config, const Options& o) {
    if (o.clear) {
        auto change = clear_issues_branch(paths);
        if (!change) return report_error(change.error(), o.json);
        if (o.json) {
            print_json({{"ok", true},
                        {"issues_branch", nullptr},
                        {"moved_issues", change->moved},
                        {"agent_worktrees_needing_rebase", agent_worktrees_to_json(change->agent_worktrees)}});
            return 0;
        }
        if (change->unchanged) {
            std::cout << "issues-branch is not set\n";
            return 0;
        }
        std::cout << "issues-branch cleared\n"
                  << "Issues now live in .braid/issues/\n";
        if (path_exists(change->issues_worktree / ".git")) {
            std::cout << "\nNote: worktree still exists at " << change->issues_worktree.string() << "\n"
                      << "You can remove it with: git worktree remove "
                      << change->issues_worktree.string() << "\n";
        }
        print_agent_worktree_warning(std::cout, change->agent_worktrees);
        return 0;
    }

    if (o.args.size() < 2) {
        if (o.json) {
            print_json({{"issues_branch", optional_json(config.issues_branch)}});
        } else {
            std::cout << "issues-branch: " << config.issues_branch.value_or("(not set)") << "\n";
        }
        return 0;
    }

    auto change = set_issues_branch(paths, arg(o, 1));
    if (!change) return report_error(change.error(), o.json);
    if (o.json) {
        print_json({{"ok", true},
                    {"issues_branch", change->branch},
                    {"issues_worktree", change->issues_worktree.string()},
                    {"moved_issues", change->moved},
                    {"agent_worktrees_needing_rebase", agent_worktrees_to_json(change->agent_worktrees)}});
        return 0;
    }
    if (change->unchanged) {
        std::cout << "issues-branch already set to '" << change->branch << "'\n";
        return 0;
    }
    std::cout << "issues-branch set to '" << change->branch << "'\n"
              << "Issues now live on shared worktree.\n";
    if (change->moved > 0) {
        std::cout << "Moved " << change->moved << " issue(s) to " << change->issues_worktree.string() << "\n";
    }
    print_agent_worktree_warning(std::cout, change->agent_worktrees);
    return 0;
}

int cmd_config_external_repo(const RepoPaths& paths, const Config& config, const Options& o) {
    if (o.clear) {
        auto change = clear_external_repo(paths);
        if (!change) return report_error(change.error(), o.json);
        if (o.json) {
            print_json({{"ok", true},
                        {"external_repo", nullptr},
                        {"agent_worktrees_needing_rebase", agent_worktrees_to_json(change->agent_worktrees)}});
            return 0;
        }
        if (change->unchanged) {
            std::cout << "external-repo is not set\n";
            return 0;
        }
        std::cout << "external-repo cleared\n"
                  << "Note: issues remain in '" << change->issues_repo
                  << "'; local .braid/issues/ is used again.\n";
        print_agent_worktree_warning(std::cout, change->agent_worktrees);
        return 0;
    }

    if (o.args.size() < 2) {
        if (o.json) {
            print_json({{"external_repo", optional_json(config.issues_repo)}});
        } else {
            std::cout << "external-repo: " << config.issues_repo.value_or("(not set)") << "\n";
        }
        return 0;
    }

    auto change = set_external_repo(paths, arg(o, 1));
    if (!change) return report_error(change.error(), o.json);
    if (o.json) {
        print_json({{"ok", true},
                    {"external_repo", change->issues_repo},
                    {"resolved", change->resolved.string()},
                    {"agent_worktrees_needing_rebase", agent_worktrees_to_json(change->agent_worktrees)}});
        return 0;
    }
    if (change->unchanged) {
        std::cout << "external-repo already set to '" << change->issues_repo << "'\n";
        return 0;
    }
    std::cout << "external-repo set to '" << change->issues_repo << "'\n"
              << "Issues now tracked in: " << change->resolved.string() << "\n";
    print_agent_worktree_warning(std::cout, change->agent_worktrees);
    return 0;
}

int cmd_config_auto_sync(const RepoPaths& paths, const Config& config, const Options& o) {
    if (o.args.size() < 2) {
        bool enabled = config.auto_pull && config.auto_push;
        if (o.json) {
            print_json({{"auto_sync", enabled}, {"auto_pull", config.auto_pull}, {"auto_push", config.auto_push}});
        } else {
            std::cout << "auto-sync: " << (enabled ? "enabled" : "disabled") << "\n";
        }
        return 0;
    }

    const std::string& value = arg(o, 1);
    bool enabled;
    if (value == "on" || value == "true" || value == "enabled") {
        enabled = true;
    } else if (value == "off" || value == "false" || value == "disabled") {
        enabled = false;
    } else {
        return report_error(usage_error("config auto-sync on|off"), o.json);
    }

    auto changed = set_auto_sync(paths, enabled);
    if (!changed) return report_error(changed.error(), o.json);

    const char* word = enabled ? "enabled" : "disabled";
    if (o.json) {
        print_json({{"ok", true}, {"auto_sync", enabled}, {"auto_pull", enabled}, {"auto_push", enabled}});
    } else if (*changed) {
        std::cout << "auto-sync " << word << "\n";
    } else {
        std::cout << "auto-sync already " << word << "\n";
    }
    return 0;
}

int cmd_config(const RepoPaths& paths, const Options& o) {
    auto config = load_config(paths.config_path(), paths.worktree_root);
    if (!config) return report_error(config.error(), o.json);

    std::string sub = o.args.empty() ? "show" : arg(o, 0);
    if (sub == "show") {
        if (o.json) {
            print_json(config_to_json(*config));
        } else {
            std::cout << serialize_config(*config);
        }
        return 0;
    }
    if (sub == "issues-branch") return cmd_config_issues_branch(paths, *config, o);
    if (sub == "external-repo") return cmd_config_external_repo(paths, *config, o);
    if (sub == "auto-sync") return cmd_config_auto_sync(paths, *config, o);

    return report_error(Error::usage("unknown config key '" + sub +
                                     "'. supported: show, issues-branch, external-repo, auto-sync"),
                        o.json);
}

int cmd_agent(const RepoPaths& paths, const Options& o) {
    if (o.args.size() != 2 || arg(o, 0) != "init") {
        return report_error(usage_error("agent init NAME [--base BRANCH]"), o.json);
    }

    auto result = init_agent_worktree(paths, arg(o, 1), o.base);
    if (!result) return report_error(result.error(), o.json);

    if (o.json) {
        print_json({{"ok", true},
                    {"agent_id", result->agent_id},
                    {"worktree", result->worktree.string()},
                    {"branch", result->branch},
                    {"base", result->base},
                    {"issues_branch", optional_json(result->issues_branch)}});
        return 0;
    }

    std::cout << "Created agent worktree: " << result->agent_id << "\n"
              << "  path:   " << result->worktree.string() << "\n"
              << "  branch: " << result->branch << " (from " << result->base << ")\n";
    if (result->issues_branch) {
        std::cout << "  sync:   issues on '" << *result->issues_branch << "' branch\n";
    }
    std::cout << "\nTo use this agent:\n"
              << "  cd " << result->worktree.string() << "\n"
              << "  brd next  # get next issue to work on\n";
    if (result->issues_branch) std::cout << "  brd sync  # sync issues with remote\n";
    return 0;
}

// ============================================================================
// main
// ============================================================================

static int run(const Options& o) {
    std::error_code ec;
    fs::path start = o.dir ? fs::path(*o.dir) : fs::current_path(ec);
    if (ec) return report_error(Error::io("cannot read working directory: " + ec.message()), o.json);

    auto paths = discover(start);
    if (!paths) return report_error(paths.error(), o.json);

    if (o.command == "init") return cmd_init(*paths, o);
    if (o.command == "doctor") return cmd_doctor(*paths, o);
    if (o.command == "config") return cmd_config(*paths, o);
    if (o.command == "agent") return cmd_agent(*paths, o);

    auto ws = open_workspace(*paths);
    if (!ws) return report_error(ws.error(), o.json);

    if (o.command == "add") return cmd_add(*ws, o);
    if (o.command == "ls") return cmd_ls(*ws, o);
    if (o.command == "show") return cmd_show(*ws, o);
    if (o.command == "ready") return cmd_ready(*ws, o);
    if (o.command == "next") return cmd_next(*ws, o);
    if (o.command == "path") return cmd_path(*ws, o);
    if (o.command == "status") return cmd_status(*ws, o);
    if (o.command == "start") return cmd_start(*ws, o);
    if (o.command == "done") return cmd_done(*ws, o);
    if (o.command == "skip") return cmd_transition(*ws, o, true);
    if (o.command == "reopen") return cmd_transition(*ws, o, false);
    if (o.command == "set") return cmd_set(*ws, o);
    if (o.command == "rm") return cmd_rm(*ws, o);
    if (o.command == "dep") return cmd_dep(*ws, o);
    if (o.command == "migrate") return cmd_migrate(*ws, o);
    if (o.command == "commit") return cmd_commit(*ws, o);
    if (o.command == "sync") return cmd_sync(*ws, o);

    return report_error(Error::usage("unknown command: " + o.command), o.json);
}

int main(int argc, char* argv[]) {
    Options o;
    bool positional_only = false;

    auto value_of = [&](int& i) -> const char* {
        return i + 1 < argc ? argv[++i] : nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        // set VALUE may legitimately start with '-' ("-", "-tag")
        bool raw_value = o.command == "set" && o.args.size() == 2;

        if (positional_only || raw_value || a[0] != '-' || strcmp(a, "-") == 0) {
            if (o.command.empty()) {
                o.command = a;
            } else {
                o.args.push_back(a);
            }
            continue;
        }

        if (strcmp(a, "--") == 0) {
            positional_only = true;
        } else if (strcmp(a, "--json") == 0) {
            o.json = true;
        } else if (strcmp(a, "--verbose") == 0) {
            log::set_verbose(true);
        } else if (strcmp(a, "-h") == 0 || strcmp(a, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(a, "-V") == 0 || strcmp(a, "--version") == 0) {
            std::cout << "brd " << BRAID_VERSION << "\n";
            return 0;
        } else if (strcmp(a, "--force") == 0 || strcmp(a, "-f") == 0) {
            o.force = true;
        } else if (strcmp(a, "--no-sync") == 0) {
            o.no_sync = true;
        } else if (strcmp(a, "--no-push") == 0) {
            o.no_push = true;
        } else if (strcmp(a, "--stash") == 0) {
            o.stash = true;
        } else if (strcmp(a, "--ready") == 0) {
            o.ready = true;
        } else if (strcmp(a, "--blocked") == 0) {
            o.blocked = true;
        } else if (strcmp(a, "--all") == 0 || strcmp(a, "-a") == 0) {
            o.all = true;
        } else if (strcmp(a, "--dry-run") == 0) {
            o.dry_run = true;
        } else if (strcmp(a, "--push") == 0) {
            o.push = true;
        } else if (strcmp(a, "--clear") == 0) {
            o.clear = true;
        } else {
            // Options taking a value
            const char* v = value_of(i);
            if (!v) {
                std::cerr << "Missing value for " << a << "\n";
                print_usage(argv[0]);
                return exit_code::USAGE;
            }
            if (strcmp(a, "-C") == 0) {
                o.dir = v;
            } else if (strcmp(a, "-p") == 0 || strcmp(a, "--priority") == 0) {
                o.priority = v;
            } else if (strcmp(a, "-t") == 0 || strcmp(a, "--type") == 0) {
                o.type = v;
            } else if (strcmp(a, "-d") == 0 || strcmp(a, "--dep") == 0) {
                o.deps.push_back(v);
            } else if (strcmp(a, "--tag") == 0) {
                o.tags.push_back(v);
            } else if (strcmp(a, "--ac") == 0) {
                o.acceptance.push_back(v);
            } else if (strcmp(a, "-b") == 0 || strcmp(a, "--body") == 0) {
                o.body = v;
            } else if (strcmp(a, "--scheduled") == 0) {
                o.scheduled = v;
            } else if (strcmp(a, "--status") == 0 || strcmp(a, "-s") == 0) {
                o.status = v;
            } else if (strcmp(a, "-r") == 0 || strcmp(a, "--result") == 0) {
                o.results.push_back(v);
            } else if (strcmp(a, "-m") == 0 || strcmp(a, "--message") == 0) {
                o.message = v;
            } else if (strcmp(a, "--base") == 0) {
                o.base = v;
            } else {
                std::cerr << "Unknown option: " << a << "\n";
                print_usage(argv[0]);
                return exit_code::USAGE;
            }
        }
    }

    if (o.command.empty() || o.command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    try {
        return run(o);
    } catch (const json::exception& e) {
        // Only reachable when issue text is not valid UTF-8
        return report_error(Error::other(std::string("cannot encode JSON: ") + e.what()), o.json);
    }
}
