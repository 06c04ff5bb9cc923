#pragma once
// Layout: where the issue store lives and which checkout commits it
//
// Three modes, chosen by config:
//   git-native     issues in <worktree>/.braid/issues, committed with the code
//   issues-branch  issues on a dedicated branch, checked out once under
//                  <git-common-dir>/brd/issues and shared by every worktree
//   external-repo  issues owned by another braid repository (which may itself
//                  use git-native or issues-branch, never external-repo)
//
// The lock guarding a store is the lock of the repository that owns it.

#include "agent.hpp"
#include "config.hpp"
#include "error.hpp"
#include "fileio.hpp"
#include "git.hpp"
#include "lock.hpp"
#include "log.hpp"
#include "repo.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace braid {

namespace fs = std::filesystem;

enum class Mode { GitNative, IssuesBranch, ExternalRepo };

inline const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::GitNative: return "git-native";
        case Mode::IssuesBranch: return "issues-branch";
        case Mode::ExternalRepo: return "external-repo";
    }
    return "git-native";
}

struct Workspace {
    RepoPaths paths;               // the checkout brd was invoked in
    Config config;                 // its config
    bool config_migrated = false;  // config was upgraded in memory
    Mode mode = Mode::GitNative;

    RepoPaths store_repo;          // repository that owns the issues
    Config store_config;           // that repository's config (ids, branch)
    fs::path issues_dir;
    fs::path lock_path;
    fs::path sync_root;            // checkout where issue changes are committed
    std::optional<std::string> issues_branch;  // branch checked out at sync_root

    bool is_external() const { return mode == Mode::ExternalRepo; }
};

// Shared issues worktree for `branch`, created on first use
inline Result<fs::path> ensure_issues_worktree(const RepoPaths& paths, const std::string& branch) {
    fs::path wt = paths.issues_worktree_dir();
    if (path_exists(wt / ".git")) return wt;

    auto pruned = git::run(paths.worktree_root, {"worktree", "prune"});
    if (!pruned) return pruned.error();

    if (!git::branch_exists(paths.worktree_root, branch)) {
        std::vector<std::string> args{"branch", branch};
        if (git::has_remote_branch(paths.worktree_root, "origin", branch)) {
            args.push_back("origin/" + branch);
        }
        auto created = git::check(paths.worktree_root, args,
                                  "failed to create branch '" + branch + "'");
        if (!created) return created.error();
    }

    auto dir = ensure_dir(wt.parent_path());
    if (!dir) return dir.error();

    auto added = git::check(paths.worktree_root, {"worktree", "add", wt.string(), branch},
                            "failed to create issues worktree at " + wt.string());
    if (!added) return added.error();

    log::debug("layout", "issues worktree for %s at %s", branch.c_str(), wt.c_str());
    return wt;
}

// issues_repo is relative to the worktree root unless absolute
inline fs::path resolve_external_path(const RepoPaths& paths, const std::string& issues_repo) {
    fs::path p(issues_repo);
    return p.is_absolute() ? p : paths.worktree_root / p;
}

struct ExternalRepo {
    RepoPaths paths;
    Config config;
};

inline Result<ExternalRepo> open_external_repo(const RepoPaths& paths, const std::string& issues_repo) {
    fs::path target = resolve_external_path(paths, issues_repo);
    std::error_code ec;
    fs::path canonical = fs::canonical(target, ec);
    if (ec) return Error::control_root_invalid("external repo path does not exist: " + target.string());

    auto ext_paths = discover(canonical);
    if (!ext_paths) {
        return Error::control_root_invalid("external repo is not a git repository: " +
                                           canonical.string());
    }

    auto ext_config = load_config(ext_paths->config_path(), ext_paths->worktree_root);
    if (!ext_config) {
        if (ext_config.error().kind == ErrorKind::NotInitialized) {
            return Error::control_root_invalid("external repo is not initialized with braid: " +
                                               canonical.string());
        }
        return ext_config.error();
    }
    if (ext_config->is_external_repo_mode()) {
        return Error::control_root_invalid("external repo " + canonical.string() +
                                           " points at another external repo; chains are not supported");
    }
    return ExternalRepo{*ext_paths, *ext_config};
}

// Resolve config and store location. Touches nothing on disk.
inline Result<Workspace> open_workspace(const RepoPaths& paths) {
    Workspace ws;
    ws.paths = paths;

    auto config = load_config(paths.config_path(), paths.worktree_root, &ws.config_migrated);
    if (!config) return config.error();
    ws.config = *config;

    ws.store_repo = paths;
    ws.store_config = ws.config;
    if (ws.config.issues_repo) {
        auto ext = open_external_repo(paths, *ws.config.issues_repo);
        if (!ext) return ext.error();
        ws.mode = Mode::ExternalRepo;
        ws.store_repo = ext->paths;
        ws.store_config = ext->config;
    } else if (ws.config.issues_branch) {
        ws.mode = Mode::IssuesBranch;
    }

    if (ws.store_config.issues_branch) {
        fs::path wt = ws.store_repo.issues_worktree_dir();
        ws.issues_dir = wt / ".braid" / "issues";
        ws.sync_root = wt;
        ws.issues_branch = ws.store_config.issues_branch;
    } else {
        ws.issues_dir = ws.store_repo.local_issues_dir();
        ws.sync_root = ws.store_repo.worktree_root;
    }
    ws.lock_path = ws.store_repo.lock_path();

    log::debug("layout", "mode=%s issues=%s", to_string(ws.mode), ws.issues_dir.c_str());
    return ws;
}

inline Result<Workspace> open_workspace_at(const fs::path& from) {
    auto paths = discover(from);
    if (!paths) return paths.error();
    return open_workspace(*paths);
}

// Materialize the store for writing. Call with the lock held.
inline Result<void> ensure_store(const Workspace& ws) {
    if (ws.issues_branch) {
        auto wt = ensure_issues_worktree(ws.store_repo, *ws.issues_branch);
        if (!wt) return wt.error();
    }
    return ensure_dir(ws.issues_dir);
}

struct AgentWorktree {
    std::string branch;
    fs::path path;
};

// Commits on main missing from the worktree's HEAD
inline bool is_behind_main(const fs::path& worktree) {
    auto count = git::run(worktree, {"rev-list", "--count", "HEAD..main"});
    if (!count || !count->ok()) return false;
    try {
        return std::stol(count->trimmed()) > 0;
    } catch (const std::exception&) {
        return false;
    }
}

// Worktrees carrying .braid/agent.toml that have fallen behind main
inline std::vector<AgentWorktree> find_agent_worktrees_needing_rebase(const fs::path& cwd) {
    std::vector<AgentWorktree> result;
    auto listing = git::run(cwd, {"worktree", "list", "--porcelain"});
    if (!listing || !listing->ok()) return result;

    std::optional<fs::path> path;
    std::optional<std::string> branch;
    auto flush = [&] {
        if (path && branch && path_exists(*path / ".braid" / "agent.toml") && is_behind_main(*path)) {
            result.push_back({*branch, *path});
        }
        path.reset();
        branch.reset();
    };

    std::istringstream in(listing->out);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("worktree ", 0) == 0) {
            path = fs::path(line.substr(9));
            branch.reset();
        } else if (line.rfind("branch refs/heads/", 0) == 0) {
            branch = line.substr(18);
        } else if (line.empty()) {
            flush();
        }
    }
    flush();
    return result;
}

// ============================================================================
// Agent worktrees
// ============================================================================

struct AgentInit {
    std::string agent_id;
    fs::path worktree;
    std::string branch;
    std::string base;
    std::optional<std::string> issues_branch;
};

inline bool valid_agent_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') return false;
    }
    return true;
}

// ~/.braid/worktrees/<repo-name>/<agent>
inline Result<fs::path> agent_worktree_path(const RepoPaths& paths, const std::string& name) {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return Error::other("cannot determine home directory");
    std::string repo_name = paths.worktree_root.filename().string();
    if (repo_name.empty()) return Error::other("cannot determine repo name");
    return fs::path(home) / ".braid" / "worktrees" / repo_name / name;
}

// New sibling worktree on branch `name`, identified by its own agent.toml.
// Linked worktrees carry a .git file instead of a directory.
inline Result<AgentInit> init_agent_worktree(const RepoPaths& paths, const std::string& name,
                                             const std::optional<std::string>& base) {
    std::error_code ec;
    if (fs::is_regular_file(paths.worktree_root / ".git", ec)) {
        return Error::other("already in an agent worktree. run `brd agent init` from main instead.");
    }
    if (!valid_agent_name(name)) {
        return Error::usage("invalid agent name '" + name +
                            "': use only alphanumeric, hyphens, underscores");
    }

    AgentInit result;
    result.agent_id = name;
    result.branch = name;

    auto wt = agent_worktree_path(paths, name);
    if (!wt) return wt.error();
    result.worktree = *wt;
    if (path_exists(result.worktree)) {
        return Error::other("directory already exists: " + result.worktree.string());
    }
    auto parent = ensure_dir(result.worktree.parent_path());
    if (!parent) return parent.error();

    if (base) {
        result.base = *base;
    } else {
        auto head = git::run(paths.worktree_root, {"rev-parse", "--abbrev-ref", "HEAD"});
        if (!head) return head.error();
        if (!head->ok()) return Error::other("failed to get current branch");
        result.base = head->trimmed();
    }

    auto added = git::check(paths.worktree_root,
                            {"worktree", "add", "-b", name, result.worktree.string(), result.base},
                            "failed to create worktree");
    if (!added) return added.error();

    auto dir = ensure_dir(result.worktree / ".braid");
    if (!dir) return dir.error();
    auto written = write_agent_file(result.worktree / ".braid" / "agent.toml", name);
    if (!written) return written.error();

    std::optional<Config> config;
    if (path_exists(paths.config_path())) {
        auto loaded = load_config(paths.config_path(), paths.worktree_root);
        if (!loaded) return loaded.error();
        config = *loaded;
    }
    if (config && config->issues_branch) {
        result.issues_branch = config->issues_branch;
        auto lock = LockGuard::acquire(paths.lock_path());
        if (!lock) return lock.error();
        auto issues_wt = ensure_issues_worktree(paths, *config->issues_branch);
        if (!issues_wt) log::warn("failed to ensure issues worktree: " + issues_wt.error().message);
    }

    log::debug("layout", "agent %s at %s (from %s)", name.c_str(), result.worktree.c_str(),
               result.base.c_str());
    return result;
}

// ============================================================================
// Mode switches (config subcommands)
// ============================================================================

struct IssuesBranchChange {
    bool unchanged = false;  // already in the requested state
    std::string branch;
    fs::path issues_worktree;
    bool created_branch = false;
    int moved = 0;
    std::vector<AgentWorktree> agent_worktrees;
};

namespace detail {

inline Result<int> copy_issue_files(const fs::path& from, const fs::path& to, bool remove_source) {
    int count = 0;
    std::error_code ec;
    if (!fs::is_directory(from, ec)) return count;

    auto dir = ensure_dir(to);
    if (!dir) return dir.error();

    for (fs::directory_iterator it(from, ec), end; it != end && !ec; it.increment(ec)) {
        const fs::path src = it->path();
        if (src.extension() != ".md") continue;
        fs::copy_file(src, to / src.filename(), fs::copy_options::overwrite_existing, ec);
        if (ec) return Error::io("cannot copy " + src.string() + ": " + ec.message());
        if (remove_source) {
            auto rm = remove_file(src);
            if (!rm) return rm.error();
        }
        ++count;
    }
    if (ec) return Error::io("cannot list " + from.string() + ": " + ec.message());
    return count;
}

inline Result<void> require_clean(const fs::path& root, const std::string& message) {
    auto clean = git::is_clean(root);
    if (!clean) return clean.error();
    if (!*clean) return Error::other(message);
    return {};
}

} // namespace detail

inline Result<IssuesBranchChange> set_issues_branch(const RepoPaths& paths, const std::string& branch) {
    auto lock = LockGuard::acquire(paths.lock_path());
    if (!lock) return lock.error();

    auto config = load_config(paths.config_path(), paths.worktree_root);
    if (!config) return config.error();

    IssuesBranchChange change;
    change.branch = branch;
    if (config->issues_branch == branch) {
        change.unchanged = true;
        change.issues_worktree = paths.issues_worktree_dir();
        return change;
    }
    if (config->issues_branch) {
        return Error::other("issues-branch already set to '" + *config->issues_branch +
                            "'. run `brd config issues-branch --clear` first.");
    }
    if (config->issues_repo) {
        return Error::other("external-repo is set. run `brd config external-repo --clear` first.");
    }

    auto clean = detail::require_clean(paths.worktree_root,
                                       "working tree has uncommitted changes - commit or stash first");
    if (!clean) return clean.error();

    // A worktree left behind by an earlier --clear is reused, so it must be clean
    if (path_exists(paths.issues_worktree_dir() / ".git")) {
        auto wt_clean = detail::require_clean(
            paths.issues_worktree_dir(),
            "issues worktree has uncommitted changes - commit or discard them first");
        if (!wt_clean) return wt_clean.error();
    }

    change.created_branch = !git::branch_exists(paths.worktree_root, branch);
    auto wt = ensure_issues_worktree(paths, branch);
    if (!wt) return wt.error();
    change.issues_worktree = *wt;

    auto moved = detail::copy_issue_files(paths.local_issues_dir(), *wt / ".braid" / "issues", true);
    if (!moved) return moved.error();
    change.moved = *moved;

    config->issues_branch = branch;
    auto saved = save_config(*config, paths.config_path());
    if (!saved) return saved.error();

    auto committed = git::commit_braid(paths.worktree_root,
                                       "chore(braid): set issues-branch to '" + branch + "'");
    if (!committed) return committed.error();
    auto initial = git::commit_braid(*wt, "chore(braid): initial issues");
    if (!initial) return initial.error();

    change.agent_worktrees = find_agent_worktrees_needing_rebase(paths.worktree_root);
    return change;
}

inline Result<IssuesBranchChange> clear_issues_branch(const RepoPaths& paths) {
    auto lock = LockGuard::acquire(paths.lock_path());
    if (!lock) return lock.error();

    auto config = load_config(paths.config_path(), paths.worktree_root);
    if (!config) return config.error();

    IssuesBranchChange change;
    if (!config->issues_branch) {
        change.unchanged = true;
        return change;
    }
    change.branch = *config->issues_branch;

    auto clean = detail::require_clean(paths.worktree_root,
                                       "working tree has uncommitted changes - commit or stash first");
    if (!clean) return clean.error();

    fs::path wt = paths.issues_worktree_dir();
    change.issues_worktree = wt;
    if (path_exists(wt / ".git")) {
        auto wt_clean = detail::require_clean(
            wt, "issues worktree has uncommitted changes - commit them first with `brd sync`");
        if (!wt_clean) return wt_clean.error();
    }

    auto copied = detail::copy_issue_files(wt / ".braid" / "issues", paths.local_issues_dir(), false);
    if (!copied) return copied.error();
    change.moved = *copied;

    config->issues_branch.reset();
    auto saved = save_config(*config, paths.config_path());
    if (!saved) return saved.error();

    auto committed = git::commit_braid(paths.worktree_root,
                                       "chore(braid): clear issues-branch (was '" + change.branch + "')");
    if (!committed) return committed.error();

    change.agent_worktrees = find_agent_worktrees_needing_rebase(paths.worktree_root);
    return change;
}

struct ExternalRepoChange {
    bool unchanged = false;
    std::string issues_repo;
    fs::path resolved;
    std::vector<AgentWorktree> agent_worktrees;
};

inline Result<ExternalRepoChange> set_external_repo(const RepoPaths& paths, const std::string& issues_repo) {
    auto lock = LockGuard::acquire(paths.lock_path());
    if (!lock) return lock.error();

    auto config = load_config(paths.config_path(), paths.worktree_root);
    if (!config) return config.error();

    ExternalRepoChange change;
    change.issues_repo = issues_repo;
    if (config->issues_repo == issues_repo) {
        change.unchanged = true;
        return change;
    }
    if (config->issues_repo) {
        return Error::other("external-repo already set to '" + *config->issues_repo +
                            "'. run `brd config external-repo --clear` first.");
    }
    if (config->issues_branch) {
        return Error::other("issues-branch is set. run `brd config issues-branch --clear` first.");
    }

    auto ext = open_external_repo(paths, issues_repo);
    if (!ext) return ext.error();
    change.resolved = ext->paths.worktree_root;

    config->issues_repo = issues_repo;
    auto saved = save_config(*config, paths.config_path());
    if (!saved) return saved.error();

    auto committed = git::commit_braid(paths.worktree_root,
                                       "chore(braid): set external-repo to '" + issues_repo + "'");
    if (!committed) return committed.error();

    change.agent_worktrees = find_agent_worktrees_needing_rebase(paths.worktree_root);
    return change;
}

inline Result<ExternalRepoChange> clear_external_repo(const RepoPaths& paths) {
    auto lock = LockGuard::acquire(paths.lock_path());
    if (!lock) return lock.error();

    auto config = load_config(paths.config_path(), paths.worktree_root);
    if (!config) return config.error();

    ExternalRepoChange change;
    if (!config->issues_repo) {
        change.unchanged = true;
        return change;
    }
    change.issues_repo = *config->issues_repo;

    config->issues_repo.reset();
    auto saved = save_config(*config, paths.config_path());
    if (!saved) return saved.error();

    auto committed = git::commit_braid(paths.worktree_root,
                                       "chore(braid): clear external-repo (was '" + change.issues_repo + "')");
    if (!committed) return committed.error();

    change.agent_worktrees = find_agent_worktrees_needing_rebase(paths.worktree_root);
    return change;
}

// Returns false when both flags already had the requested value
inline Result<bool> set_auto_sync(const RepoPaths& paths, bool enabled) {
    auto lock = LockGuard::acquire(paths.lock_path());
    if (!lock) return lock.error();

    auto config = load_config(paths.config_path(), paths.worktree_root);
    if (!config) return config.error();

    if (config->auto_pull == enabled && config->auto_push == enabled) return false;

    config->auto_pull = enabled;
    config->auto_push = enabled;
    auto saved = save_config(*config, paths.config_path());
    if (!saved) return saved.error();

    auto committed = git::commit_braid(paths.worktree_root,
                                       std::string("chore(braid): set auto-sync to ") +
                                       (enabled ? "enabled" : "disabled"));
    if (!committed) return committed.error();
    return true;
}

} // namespace braid
