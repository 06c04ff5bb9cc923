#pragma once
// Doctor: read-only health report for a braid repository
//
// Every check runs even when an earlier one fails. Errors make the
// command fail; warnings (unparseable files, old schema, leftover temp
// files) do not.

#include "config.hpp"
#include "error.hpp"
#include "graph.hpp"
#include "layout.hpp"
#include "migrations.hpp"
#include "repo.hpp"
#include "store.hpp"
#include "toml.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace braid {

namespace fs = std::filesystem;

struct DoctorCheck {
    std::string name;
    std::string description;
    bool passed = false;
};

struct DoctorError {
    std::string code;
    std::string message;
    std::string issue;                // missing_dep
    std::string dep;                  // missing_dep
    std::vector<std::string> cycle;   // cycle
};

struct DoctorReport {
    std::vector<DoctorCheck> checks;
    std::vector<DoctorError> errors;
    std::vector<std::string> warnings;

    bool ok() const { return errors.empty(); }

    bool only_cycles() const {
        if (errors.empty()) return false;
        for (const auto& e : errors) {
            if (e.code != "cycle") return false;
        }
        return true;
    }

    void check(const std::string& name, const std::string& description, bool passed) {
        checks.push_back({name, description, passed});
    }

    void error(const std::string& code, const std::string& message) {
        DoctorError e;
        e.code = code;
        e.message = message;
        errors.push_back(std::move(e));
    }

    // Exit status: ok, invalid graph when only cycles, generic otherwise
    Result<void> status() const {
        if (ok()) return {};
        if (only_cycles()) return Error::invalid_graph("doctor found errors");
        return Error::other("doctor found errors");
    }
};

namespace detail {

// schema_version of a config file without validating the rest
inline Result<int64_t> raw_config_schema(const fs::path& path) {
    auto text = read_file(path);
    if (!text) return text.error();
    auto table = toml::parse(*text, path.string());
    if (!table) return table.error();
    auto schema = toml::get_int(*table, "schema_version", path.string());
    if (!schema) return schema.error();
    return schema->has_value() ? **schema : int64_t{1};
}

inline void check_schema(DoctorReport& report, const std::string& name, const std::string& label,
                         const std::string& error_prefix, int64_t schema) {
    const std::string v = "v" + std::to_string(schema);
    if (schema <= version::CURRENT_SCHEMA) {
        report.check(name, label + " config at schema " + v + " (supported)", true);
        return;
    }
    report.check(name, label + " uses schema " + v + ", this brd supports up to v" +
                       std::to_string(version::CURRENT_SCHEMA),
                 false);
    report.error(error_prefix + "_schema_unsupported",
                 label + " uses schema " + v + ", please upgrade brd");
}

inline std::vector<fs::path> stale_temp_files(const std::vector<fs::path>& dirs) {
    std::vector<fs::path> found;
    for (const auto& dir : dirs) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;
        for (fs::directory_iterator it(dir, ec), end; it != end && !ec; it.increment(ec)) {
            if (it->path().filename().string().find(".tmp.") != std::string::npos) {
                found.push_back(it->path());
            }
        }
    }
    return found;
}

} // namespace detail

inline Result<DoctorReport> run_doctor(const RepoPaths& paths) {
    DoctorReport report;

    // A config from a newer brd is not ours to judge
    if (path_exists(paths.config_path())) {
        auto schema = detail::raw_config_schema(paths.config_path());
        if (schema && *schema > version::CURRENT_SCHEMA) {
            return schema_mismatch_error("this repo", *schema, paths.worktree_root);
        }
    }

    bool braid_exists = path_exists(paths.braid_dir());
    report.check("braid_dir", ".braid directory exists", braid_exists);
    if (!braid_exists) report.error("missing_braid_dir", ".braid directory not found");

    auto config = load_config(paths.config_path(), paths.worktree_root);
    report.check("config_valid", "config.toml is valid", config.ok());
    if (!config) report.error("invalid_config", "config.toml is missing or invalid");

    Config cfg = config ? *config : Config{};
    fs::path issues_dir = paths.local_issues_dir();
    fs::path braid_dir = paths.braid_dir();

    if (cfg.issues_repo) {
        fs::path target = resolve_external_path(paths, *cfg.issues_repo);
        std::error_code ec;
        fs::path canonical = fs::canonical(target, ec);
        if (ec) {
            report.check("external_config_version", "external repo not found: " + *cfg.issues_repo, false);
            report.error("external_config_error", "external repo not found: " + *cfg.issues_repo);
        } else if (auto ext_paths = discover(canonical); !ext_paths) {
            std::string msg = "external path is not a git repo: " + canonical.string();
            report.check("external_config_version", msg, false);
            report.error("external_config_error", msg);
        } else {
            auto schema = detail::raw_config_schema(ext_paths->config_path());
            if (!schema) {
                std::string msg = "failed to load external config: " + schema.error().message;
                report.check("external_config_version", msg, false);
                report.error("external_config_error", msg);
            } else {
                detail::check_schema(report, "external_config_version", "external repo", "external",
                                     *schema);
            }
        }
    }

    if (cfg.is_issues_branch_mode()) {
        fs::path wt_config = paths.issues_worktree_dir() / ".braid" / "config.toml";
        if (!path_exists(wt_config)) {
            report.check("worktree_config_version", "issues worktree not yet created", true);
        } else {
            auto schema = detail::raw_config_schema(wt_config);
            if (!schema) {
                std::string msg = "failed to load issues worktree config: " + schema.error().message;
                report.check("worktree_config_version", msg, false);
                report.error("worktree_config_error", msg);
            } else {
                detail::check_schema(report, "worktree_config_version", "issues worktree", "worktree",
                                     *schema);
            }
        }
    }

    if (config) {
        auto ws = open_workspace(paths);
        if (ws) {
            issues_dir = ws->issues_dir;
            braid_dir = issues_dir.parent_path();
        }
    }

    IssueMap issues;
    auto loaded = load_all(issues_dir, true);
    if (!loaded) {
        report.check("issues_parse", "all issue files parse correctly", false);
        report.error("parse_error", loaded.error().message);
    } else {
        report.check("issues_parse", "all issue files parse correctly", loaded->failures.empty());
        for (const auto& failure : loaded->failures) {
            report.warnings.push_back("failed to load " + failure.path.string() + ": " +
                                      failure.error.message);
        }

        auto stale = loaded->needing_migration();
        report.check("schema_current",
                     "all issues at schema v" + std::to_string(migrations::CURRENT_VERSION),
                     stale.empty());
        if (!stale.empty()) {
            report.warnings.push_back(std::to_string(stale.size()) +
                                      " issue(s) need migration, run `brd migrate`");
        }
        issues = std::move(loaded->issues);
    }

    bool missing = false;
    for (const auto& [id, issue] : issues) {
        for (const auto& dep : compute_derived(issue, issues).missing_deps) {
            DoctorError e;
            e.code = "missing_dep";
            e.message = id + " depends on missing issue " + dep;
            e.issue = id;
            e.dep = dep;
            report.errors.push_back(std::move(e));
            missing = true;
        }
    }
    report.check("no_missing_deps", "no missing dependencies", !missing);

    auto cycles = find_cycles(issues);
    for (auto& cycle : cycles) {
        DoctorError e;
        e.code = "cycle";
        e.message = "dependency cycle: " + format_cycle(cycle);
        e.cycle = std::move(cycle);
        report.errors.push_back(std::move(e));
    }
    report.check("no_cycles", "no dependency cycles", cycles.empty());

    auto temps = detail::stale_temp_files({issues_dir, braid_dir});
    report.check("no_stale_temp_files", "no stale temporary files", temps.empty());
    for (const auto& t : temps) {
        report.warnings.push_back("stale temporary file from an interrupted write: " + t.string());
    }

    return report;
}

} // namespace braid
