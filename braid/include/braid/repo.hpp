#pragma once
// Repo locator: worktree root, shared git dir and derived paths
//
// Coordination state lives under the git common dir so every
// worktree of one repository shares the same lock and issues worktree.

#include "error.hpp"
#include "git.hpp"
#include "log.hpp"
#include <filesystem>
#include <string>
#include <system_error>

namespace braid {

namespace fs = std::filesystem;

struct RepoPaths {
    fs::path worktree_root;   // git rev-parse --show-toplevel
    fs::path git_common_dir;  // git rev-parse --git-common-dir
    fs::path brd_common_dir;  // <git_common_dir>/brd

    fs::path braid_dir() const { return worktree_root / ".braid"; }
    fs::path config_path() const { return braid_dir() / "config.toml"; }
    fs::path agent_path() const { return braid_dir() / "agent.toml"; }
    fs::path gitignore_path() const { return braid_dir() / ".gitignore"; }
    fs::path local_issues_dir() const { return braid_dir() / "issues"; }
    fs::path lock_path() const { return brd_common_dir / "lock"; }
    fs::path issues_worktree_dir() const { return brd_common_dir / "issues"; }
};

inline fs::path canonical_or_self(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::canonical(p, ec);
    return ec ? p : c;
}

inline Result<RepoPaths> discover(const fs::path& from) {
    auto top = git::run(from, {"rev-parse", "--show-toplevel"});
    if (!top) return top.error();
    if (!top->ok() || top->trimmed().empty()) return Error::not_git_repo();

    auto common = git::run(from, {"rev-parse", "--git-common-dir"});
    if (!common) return common.error();
    if (!common->ok() || common->trimmed().empty()) return Error::not_git_repo();

    RepoPaths paths;
    paths.worktree_root = fs::path(top->trimmed());

    fs::path common_dir(common->trimmed());
    if (common_dir.is_relative()) {
        common_dir = canonical_or_self(from / common_dir);
    }
    paths.git_common_dir = common_dir;
    paths.brd_common_dir = common_dir / "brd";

    log::debug("repo", "worktree=%s common=%s",
               paths.worktree_root.c_str(), paths.git_common_dir.c_str());
    return paths;
}

} // namespace braid
