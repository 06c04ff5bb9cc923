#pragma once
// Sync: fetch/rebase before claiming, commit/push after mutating
//
// git-native stores sync with origin/main from the checkout that owns
// them; issues-branch stores sync the shared issues worktree with
// origin/<branch>. Repositories without an origin remote skip the
// network steps silently.

#include "error.hpp"
#include "git.hpp"
#include "layout.hpp"
#include "lock.hpp"
#include "log.hpp"
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace braid {

namespace fs = std::filesystem;

constexpr int PUSH_RETRIES = 2;

inline Result<size_t> stash_count(const fs::path& cwd) {
    auto out = git::output(cwd, {"stash", "list"});
    if (!out) return out.error();
    if (out->empty()) return size_t{0};
    size_t lines = 1;
    for (char c : *out) {
        if (c == '\n') ++lines;
    }
    return lines;
}

// True when a stash entry was actually created
inline Result<bool> stash_push(const fs::path& cwd, const std::string& message) {
    auto before = stash_count(cwd);
    if (!before) return before.error();
    auto pushed = git::check(cwd, {"stash", "push", "--include-untracked", "-m", message},
                             "failed to stash changes");
    if (!pushed) return pushed.error();
    auto after = stash_count(cwd);
    if (!after) return after.error();
    return *after > *before;
}

inline Result<bool> stash_pop(const fs::path& cwd) {
    return git::succeeds(cwd, {"stash", "pop"});
}

inline bool has_upstream(const fs::path& cwd, const std::string& branch) {
    auto r = git::run(cwd, {"rev-parse", "--abbrev-ref", branch + "@{u}"});
    return r && r->ok();
}

// Porcelain status lines touching anything outside .braid/
inline Result<bool> has_non_braid_changes(const fs::path& root) {
    auto status = git::output(root, {"status", "--porcelain"});
    if (!status) return status.error();
    std::istringstream in(*status);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.find(".braid/") == std::string::npos) return true;
    }
    return false;
}

// Undo a failed rebase and put stashed work back
inline void abandon_rebase(const fs::path& root, bool stashed) {
    auto aborted = git::run(root, {"rebase", "--abort"});
    if (!aborted || !aborted->ok()) log::debug("sync", "rebase --abort failed in %s", root.c_str());
    if (stashed) {
        log::note("  restoring stashed changes...");
        auto popped = stash_pop(root);
        if (!popped || !*popped) log::warn("could not restore stash; run `git stash pop`");
    }
}

// Fetch and rebase onto origin/main before claiming
inline Result<void> sync_with_main(const fs::path& root, bool stash) {
    if (!git::has_remote(root, "origin")) {
        log::note("(no origin remote, skipping sync)");
        return {};
    }
    log::note("syncing with origin/main...");

    auto dirty = has_non_braid_changes(root);
    if (!dirty) return dirty.error();

    bool stashed = false;
    if (*dirty) {
        if (!stash) {
            return Error::other("working tree has uncommitted changes outside .braid\n\n"
                                "options:\n"
                                "  - commit or stash manually first\n"
                                "  - use --stash to auto-stash and restore after sync\n"
                                "  - use --no-sync to skip sync (trust local state)");
        }
        log::note("  stashing uncommitted changes...");
        auto pushed = stash_push(root, "brd start: stashing changes");
        if (!pushed) return pushed.error();
        stashed = *pushed;
    }

    auto fetched = git::succeeds(root, {"fetch", "origin", "main"});
    if (!fetched) return fetched.error();
    if (!*fetched) {
        if (stashed) {
            log::note("  restoring stashed changes...");
            auto popped = stash_pop(root);
            if (!popped) return popped.error();
        }
        log::note("  (origin/main not found, skipping rebase)");
        return {};
    }

    if (git::has_remote_branch(root, "origin", "main")) {
        auto rebased = git::succeeds(root, {"rebase", "origin/main"});
        if (!rebased) return rebased.error();
        if (!*rebased) {
            abandon_rebase(root, stashed);
            return Error::other("rebase failed - resolve conflicts manually or use --no-sync");
        }
    }

    if (stashed) {
        log::note("  restoring stashed changes...");
        auto popped = stash_pop(root);
        if (!popped) return popped.error();
        if (!*popped) {
            return Error::other("sync succeeded but failed to restore stashed changes\n"
                                "your changes are in `git stash` - run `git stash pop` to restore");
        }
    }
    return {};
}

// Fetch and rebase the shared issues worktree onto origin/<branch>
inline Result<void> sync_issues_branch(const Workspace& ws) {
    auto wt = ensure_issues_worktree(ws.store_repo, *ws.issues_branch);
    if (!wt) return wt.error();
    const std::string& branch = *ws.issues_branch;

    if (!git::has_remote(*wt, "origin")) {
        log::note("(no origin remote, skipping sync)");
        return {};
    }
    log::note("syncing with origin/" + branch + "...");

    auto fetched = git::succeeds(*wt, {"fetch", "origin", branch});
    if (!fetched) return fetched.error();
    if (!*fetched) {
        log::note("  (origin/" + branch + " not found, skipping rebase)");
        return {};
    }

    if (git::has_remote_branch(*wt, "origin", branch)) {
        auto rebased = git::succeeds(*wt, {"rebase", "origin/" + branch});
        if (!rebased) return rebased.error();
        if (!*rebased) {
            abandon_rebase(*wt, false);
            return Error::other("rebase failed on issues branch - resolve conflicts manually or use --no-sync");
        }
    }
    return {};
}

// Pre-claim sync for whichever layout the workspace uses
inline Result<void> pull_before_claim(const Workspace& ws, bool stash) {
    if (ws.issues_branch) return sync_issues_branch(ws);
    return sync_with_main(ws.sync_root, stash);
}

namespace detail {

// Push `refspec`, rebasing onto origin/<branch> between attempts
inline Result<void> push_with_retry(const fs::path& root, const std::string& refspec,
                                    const std::string& branch) {
    for (int attempt = 0; attempt <= PUSH_RETRIES; ++attempt) {
        auto pushed = git::succeeds(root, {"push", "origin", refspec});
        if (!pushed) return pushed.error();
        if (*pushed) return {};
        if (attempt == PUSH_RETRIES) break;

        log::note("  push rejected, rebasing and retrying (" + std::to_string(attempt + 1) + "/" +
                  std::to_string(PUSH_RETRIES) + ")...");
        auto fetched = git::succeeds(root, {"fetch", "origin", branch});
        if (!fetched) return fetched.error();
        if (!*fetched) return Error::other("failed to fetch during retry");

        auto rebased = git::succeeds(root, {"rebase", "origin/" + branch});
        if (!rebased) return rebased.error();
        if (!*rebased) {
            abandon_rebase(root, false);
            return Error::other("rebase failed during push retry - resolve manually");
        }
    }
    return Error::other("push failed after " + std::to_string(PUSH_RETRIES) +
                        " retries - another agent may have pushed. run `git pull --rebase origin " +
                        branch + "` and check if the issue is still available");
}

} // namespace detail

// Commit `chore(braid): <action> <id>` where the store lives and push it
inline Result<void> commit_and_push(const Workspace& ws, const std::string& action,
                                    const std::string& id) {
    auto committed = git::commit_braid(ws.sync_root, "chore(braid): " + action + " " + id);
    if (!committed) return committed.error();
    if (!*committed) log::note("  (no changes to commit)");

    if (!git::has_remote(ws.sync_root, "origin")) {
        log::note("  (no origin remote, skipping push)");
        return {};
    }
    if (ws.issues_branch) {
        return detail::push_with_retry(ws.sync_root, *ws.issues_branch, *ws.issues_branch);
    }
    return detail::push_with_retry(ws.sync_root, "HEAD:main", "main");
}

// Summary of staged .braid changes, e.g. "chore(braid): add 1, update 2 issues (a, b, c)"
inline std::string generate_commit_message(const fs::path& root) {
    const std::string fallback = "chore(braid): update issues";
    auto diff = git::run(root, {"diff", "--cached", "--name-status", "--", ".braid"});
    if (!diff || !diff->ok()) return fallback;

    int added = 0, modified = 0, deleted = 0;
    std::vector<std::string> ids;
    std::istringstream in(diff->out);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string status, path;
        if (!(fields >> status >> path)) continue;

        const std::string prefix = ".braid/issues/";
        if (path.rfind(prefix, 0) == 0 && path.size() > prefix.size() + 3 &&
            path.compare(path.size() - 3, 3, ".md") == 0) {
            ids.push_back(path.substr(prefix.size(), path.size() - prefix.size() - 3));
        }
        if (status == "A") ++added;
        else if (status == "M") ++modified;
        else if (status == "D") ++deleted;
    }

    std::vector<std::string> parts;
    if (added > 0) parts.push_back("add " + std::to_string(added));
    if (modified > 0) parts.push_back("update " + std::to_string(modified));
    if (deleted > 0) parts.push_back("remove " + std::to_string(deleted));
    if (parts.empty()) return fallback;

    std::string action = join(parts, ", ");
    if (ids.size() == 1) return "chore(braid): " + action + " issue (" + ids[0] + ")";
    if (!ids.empty() && ids.size() <= 3) {
        return "chore(braid): " + action + " issues (" + join(ids, ", ") + ")";
    }
    return "chore(braid): " + action + " issues";
}

struct CommitOutcome {
    bool committed = false;
    std::string message;
};

// `brd commit`: stage .braid where the store lives and commit it
inline Result<CommitOutcome> commit_pending(const Workspace& ws,
                                            const std::optional<std::string>& message) {
    if (!path_exists(ws.sync_root / ".braid")) return Error::other("no .braid directory found");

    auto lock = LockGuard::acquire(ws.lock_path);
    if (!lock) return lock.error();

    auto staged = git::check(ws.sync_root, {"add", "-A", ".braid"}, "git add failed");
    if (!staged) return staged.error();

    auto diff = git::run(ws.sync_root, {"diff", "--cached", "--quiet", "--", ".braid"});
    if (!diff) return diff.error();

    CommitOutcome outcome;
    if (diff->ok()) return outcome;

    outcome.message = message ? *message : generate_commit_message(ws.sync_root);
    auto committed = git::check(ws.sync_root, {"commit", "-m", outcome.message, "--", ".braid"},
                                "git commit failed");
    if (!committed) return committed.error();
    outcome.committed = true;
    return outcome;
}

struct SyncOutcome {
    std::string branch;
    fs::path issues_worktree;
    bool committed = false;
    bool pushed = false;
};

// `brd sync`: reconcile the shared issues worktree with its remote branch
inline Result<SyncOutcome> sync_issues(const Workspace& ws, bool push) {
    if (!ws.issues_branch) {
        return Error::other("not in issues-branch mode. use `brd config issues-branch <name>` to enable");
    }

    auto lock = LockGuard::acquire(ws.lock_path);
    if (!lock) return lock.error();

    SyncOutcome outcome;
    outcome.branch = *ws.issues_branch;
    auto wt = ensure_issues_worktree(ws.store_repo, outcome.branch);
    if (!wt) return wt.error();
    outcome.issues_worktree = *wt;

    bool upstream = has_upstream(*wt, outcome.branch);
    bool should_push = upstream || push;
    log::note(should_push ? "Syncing issues with remote '" + outcome.branch + "'..."
                          : "syncing issues locally on '" + outcome.branch + "'...");

    auto clean = git::is_clean(*wt);
    if (!clean) return clean.error();

    bool stashed = false;
    if (!*clean) {
        log::note("  stashing local changes...");
        auto pushed = stash_push(*wt, "brd sync: stashing local changes");
        if (!pushed) return pushed.error();
        stashed = *pushed;
    }

    bool remote_exists = false;
    if (upstream) {
        log::note("  fetching origin/" + outcome.branch + "...");
        auto fetched = git::succeeds(*wt, {"fetch", "origin", outcome.branch});
        if (!fetched) return fetched.error();
        remote_exists = *fetched;
    }

    if (remote_exists) {
        log::note("  rebasing onto origin/" + outcome.branch + "...");
        auto rebased = git::succeeds(*wt, {"rebase", "origin/" + outcome.branch});
        if (!rebased) return rebased.error();
        if (!*rebased) {
            abandon_rebase(*wt, stashed);
            return Error::other("rebase failed - there may be conflicts. resolve manually in the issues worktree");
        }
    }

    if (stashed) {
        log::note("  restoring local changes...");
        auto popped = stash_pop(*wt);
        if (!popped) return popped.error();
        if (!*popped) return Error::other("failed to restore local changes from stash");
    }

    auto committed = git::commit_braid(*wt, "chore(braid): sync issues");
    if (!committed) return committed.error();
    outcome.committed = *committed;

    if (should_push) {
        log::note("  pushing to origin/" + outcome.branch + "...");
        auto pushed = git::succeeds(*wt, {"push", "origin", outcome.branch});
        if (!pushed) return pushed.error();
        if (!*pushed) {
            auto retried = git::succeeds(*wt, {"push", "--set-upstream", "origin", outcome.branch});
            if (!retried) return retried.error();
            if (!*retried) {
                return Error::other("failed to push to origin/" + outcome.branch +
                                    ". you may need to pull and retry.");
            }
        }
        outcome.pushed = true;
    }
    return outcome;
}

} // namespace braid
