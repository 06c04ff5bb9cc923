#pragma once
// Git: subprocess helpers around the git executable
//
// Output formats of git are not a stable API. Callers only parse
// porcelain output or single-value commands (rev-parse, rev-list --count).

#include "error.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <sys/wait.h>

namespace braid::git {

namespace fs = std::filesystem;

struct Output {
    int status = -1;
    std::string out;

    bool ok() const { return status == 0; }

    // stdout with trailing whitespace removed
    std::string trimmed() const {
        std::string s = out;
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r' ||
                              s.back() == ' ' || s.back() == '\t')) {
            s.pop_back();
        }
        size_t start = 0;
        while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\n')) {
            ++start;
        }
        return s.substr(start);
    }
};

inline std::string shell_quote(const std::string& s) {
    std::string quoted = "'";
    for (char c : s) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// Run `git -C cwd args...`. stderr is discarded unless merge_stderr is set,
// in which case it is folded into the captured output for error messages.
inline Result<Output> run(const fs::path& cwd, const std::vector<std::string>& args,
                          bool merge_stderr = false) {
    std::string cmd = "git -C " + shell_quote(cwd.string());
    for (const auto& arg : args) {
        cmd += " " + shell_quote(arg);
    }
    cmd += merge_stderr ? " 2>&1" : " 2>/dev/null";
    cmd += " </dev/null";

    log::debug("git", "%s", cmd.c_str());

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return Error::io(std::string("failed to run git: ") + strerror(errno));
    }

    Output result;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.out.append(buffer, n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        return Error::io(std::string("failed to wait for git: ") + strerror(errno));
    }
    result.status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    log::debug("git", "exit %d", result.status);
    return result;
}

// True when git exited 0
inline Result<bool> succeeds(const fs::path& cwd, const std::vector<std::string>& args) {
    auto r = run(cwd, args);
    if (!r) return r.error();
    return r->ok();
}

// Trimmed stdout regardless of exit status
inline Result<std::string> output(const fs::path& cwd, const std::vector<std::string>& args) {
    auto r = run(cwd, args);
    if (!r) return r.error();
    return r->trimmed();
}

// Run and require success; failure carries git's own message
inline Result<void> check(const fs::path& cwd, const std::vector<std::string>& args,
                    const std::string& what) {
    auto r = run(cwd, args, true);
    if (!r) return r.error();
    if (!r->ok()) {
        std::string detail = r->trimmed();
        return Error::other(what + (detail.empty() ? "" : ": " + detail));
    }
    return {};
}

inline Result<bool> is_clean(const fs::path& cwd) {
    auto r = run(cwd, {"status", "--porcelain"});
    if (!r) return r.error();
    if (!r->ok()) return Error::other("git status failed in " + cwd.string());
    return r->trimmed().empty();
}

inline bool has_remote(const fs::path& cwd, const std::string& name) {
    auto r = run(cwd, {"remote", "get-url", name});
    return r && r->ok();
}

inline bool branch_exists(const fs::path& cwd, const std::string& branch) {
    auto r = run(cwd, {"rev-parse", "--verify", "--quiet", branch});
    return r && r->ok();
}

inline bool has_remote_branch(const fs::path& cwd, const std::string& remote,
                              const std::string& branch) {
    return branch_exists(cwd, remote + "/" + branch);
}

inline std::optional<std::string> current_branch(const fs::path& cwd) {
    auto r = run(cwd, {"rev-parse", "--abbrev-ref", "HEAD"});
    if (!r || !r->ok()) return std::nullopt;
    std::string branch = r->trimmed();
    if (branch.empty()) return std::nullopt;
    return branch;
}

// Stage .braid and commit. Returns false when there was nothing to commit.
inline Result<bool> commit_braid(const fs::path& cwd, const std::string& message) {
    auto st = check(cwd, {"add", "-A", ".braid"}, "failed to stage .braid");
    if (!st) return st.error();

    auto staged = run(cwd, {"diff", "--cached", "--quiet", "--", ".braid"});
    if (!staged) return staged.error();
    if (staged->ok()) return false;

    st = check(cwd, {"commit", "-m", message, "--", ".braid"}, "git commit failed");
    if (!st) return st.error();
    return true;
}

} // namespace braid::git
