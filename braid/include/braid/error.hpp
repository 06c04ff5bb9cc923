#pragma once
// Errors: closed set of failure kinds with stable exit codes
//
// Every fallible operation returns Result<T>. The kind decides the
// process exit code and the short string scripts match on.

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace braid {

enum class ErrorKind {
    NotGitRepo,
    ControlRootInvalid,
    IssueNotFound,
    AmbiguousId,
    ClaimConflict,
    InvalidGraph,
    ParseError,
    NotInitialized,
    Io,
    Usage,
    Other
};

// Stable exit codes for automation
namespace exit_code {
    constexpr int SUCCESS = 0;
    constexpr int GENERIC_FAILURE = 1;
    constexpr int USAGE = 2;
    constexpr int NOT_GIT_REPO = 10;
    constexpr int CONTROL_ROOT_INVALID = 11;
    constexpr int ISSUE_NOT_FOUND = 12;
    constexpr int AMBIGUOUS_ID = 13;
    constexpr int CLAIM_CONFLICT = 14;
    constexpr int INVALID_GRAPH = 15;
    constexpr int PARSE_ERROR = 16;
    constexpr int NOT_INITIALIZED = 17;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

struct Error {
    ErrorKind kind = ErrorKind::Other;
    std::string message;
    std::vector<std::string> candidates;  // AmbiguousId only

    static Error not_git_repo() {
        return {ErrorKind::NotGitRepo, "not a git repository", {}};
    }

    static Error not_initialized() {
        return {ErrorKind::NotInitialized,
                "braid not initialized\n\nrun `brd init` to set up issue tracking", {}};
    }

    static Error control_root_invalid(const std::string& detail) {
        return {ErrorKind::ControlRootInvalid,
                "control root not found or invalid: " + detail, {}};
    }

    static Error issue_not_found(const std::string& id) {
        return {ErrorKind::IssueNotFound, "issue not found: " + id, {}};
    }

    static Error ambiguous_id(const std::string& partial, std::vector<std::string> matches) {
        std::vector<std::string> quoted;
        for (const auto& m : matches) quoted.push_back("\"" + m + "\"");
        Error e{ErrorKind::AmbiguousId,
                "ambiguous issue id '" + partial + "': matches [" + join(quoted, ", ") + "]", {}};
        e.candidates = std::move(matches);
        return e;
    }

    static Error claim_conflict(const std::string& message) {
        return {ErrorKind::ClaimConflict, message, {}};
    }

    static Error invalid_graph(const std::string& message) {
        return {ErrorKind::InvalidGraph, message, {}};
    }

    static Error parse(const std::string& where, const std::string& what) {
        return {ErrorKind::ParseError, "parse error in " + where + ": " + what, {}};
    }

    static Error io(const std::string& message) {
        return {ErrorKind::Io, "io error: " + message, {}};
    }

    static Error usage(const std::string& message) {
        return {ErrorKind::Usage, message, {}};
    }

    static Error other(const std::string& message) {
        return {ErrorKind::Other, message, {}};
    }

    int exit_code() const {
        switch (kind) {
            case ErrorKind::NotGitRepo: return exit_code::NOT_GIT_REPO;
            case ErrorKind::ControlRootInvalid: return exit_code::CONTROL_ROOT_INVALID;
            case ErrorKind::IssueNotFound: return exit_code::ISSUE_NOT_FOUND;
            case ErrorKind::AmbiguousId: return exit_code::AMBIGUOUS_ID;
            case ErrorKind::ClaimConflict: return exit_code::CLAIM_CONFLICT;
            case ErrorKind::InvalidGraph: return exit_code::INVALID_GRAPH;
            case ErrorKind::ParseError: return exit_code::PARSE_ERROR;
            case ErrorKind::NotInitialized: return exit_code::NOT_INITIALIZED;
            case ErrorKind::Usage: return exit_code::USAGE;
            case ErrorKind::Io:
            case ErrorKind::Other: return exit_code::GENERIC_FAILURE;
        }
        return exit_code::GENERIC_FAILURE;
    }

    const char* code() const {
        switch (kind) {
            case ErrorKind::NotGitRepo: return "not_git_repo";
            case ErrorKind::ControlRootInvalid: return "control_root_invalid";
            case ErrorKind::IssueNotFound: return "issue_not_found";
            case ErrorKind::AmbiguousId: return "ambiguous_id";
            case ErrorKind::ClaimConflict: return "claim_conflict";
            case ErrorKind::InvalidGraph: return "invalid_graph";
            case ErrorKind::ParseError: return "parse_error";
            case ErrorKind::NotInitialized: return "not_initialized";
            case ErrorKind::Io: return "io_error";
            case ErrorKind::Usage: return "usage";
            case ErrorKind::Other: return "error";
        }
        return "error";
    }
};

// Value or Error. Converts implicitly from either so callers can
// `return value;` or `return Error::...;` and propagate with
// `if (!r) return r.error();`.
template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Error error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(state_); }
    const T& value() const { return std::get<T>(state_); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<Error>(state_); }

private:
    std::variant<T, Error> state_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

} // namespace braid
