#pragma once
// Graph: readiness and cycle detection over the dependency edges
//
// Edges point from an issue to the issues it depends on. Only `done`
// resolves a dependency; deps absent from the store are reported as
// missing and keep the dependent blocked.

#include "error.hpp"
#include "issue.hpp"
#include "store.hpp"
#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace braid {

struct Derived {
    bool is_ready = false;
    bool is_blocked = false;
    std::vector<std::string> open_deps;
    std::vector<std::string> missing_deps;
};

inline Derived compute_derived(const Issue& issue, const IssueMap& issues) {
    Derived d;
    for (const auto& dep : issue.deps) {
        auto it = issues.find(dep);
        if (it == issues.end()) {
            d.missing_deps.push_back(dep);
        } else if (it->second.status != Status::Done) {
            d.open_deps.push_back(dep);
        }
    }
    bool unresolved = !d.open_deps.empty() || !d.missing_deps.empty();
    d.is_ready = issue.status == Status::Open && !unresolved;
    d.is_blocked = issue.status == Status::Open && unresolved;
    return d;
}

namespace detail {

struct CycleSearch {
    const IssueMap& issues;
    std::set<std::string> visited;
    std::set<std::string> on_stack;
    std::vector<std::string> path;
    std::vector<std::vector<std::string>> cycles;

    void visit(const std::string& id) {
        visited.insert(id);
        on_stack.insert(id);
        path.push_back(id);

        auto it = issues.find(id);
        if (it != issues.end()) {
            for (const auto& dep : it->second.deps) {
                if (!visited.count(dep)) {
                    visit(dep);
                } else if (on_stack.count(dep)) {
                    auto start = std::find(path.begin(), path.end(), dep);
                    std::vector<std::string> cycle(start, path.end());
                    cycle.push_back(dep);
                    cycles.push_back(std::move(cycle));
                }
            }
        }

        path.pop_back();
        on_stack.erase(id);
    }
};

inline bool can_reach(const std::string& from, const std::string& to, const IssueMap& issues,
                      std::set<std::string>& visited, std::vector<std::string>& path) {
    if (from == to) return true;
    if (!visited.insert(from).second) return false;

    auto it = issues.find(from);
    if (it == issues.end()) return false;
    for (const auto& dep : it->second.deps) {
        path.push_back(dep);
        if (can_reach(dep, to, issues, visited, path)) return true;
        path.pop_back();
    }
    return false;
}

} // namespace detail

// Each cycle is the path closed by repeating its first id. A cycle may be
// reported more than once when several roots lead into it.
inline std::vector<std::vector<std::string>> find_cycles(const IssueMap& issues) {
    detail::CycleSearch search{issues, {}, {}, {}, {}};
    for (const auto& [id, issue] : issues) {
        if (!search.visited.count(id)) search.visit(id);
    }
    return std::move(search.cycles);
}

// Path child -> parent -> ... -> child if the edge child->parent would close a cycle
inline std::optional<std::vector<std::string>> would_create_cycle(const std::string& child,
                                                                  const std::string& parent,
                                                                  const IssueMap& issues) {
    std::set<std::string> visited;
    std::vector<std::string> path{child, parent};
    if (detail::can_reach(parent, child, issues, visited, path)) return path;
    return std::nullopt;
}

inline std::string format_cycle(const std::vector<std::string>& cycle) {
    return join(cycle, " -> ");
}

inline std::vector<const Issue*> ready_issues(const IssueMap& issues) {
    std::vector<const Issue*> ready;
    for (const Issue* issue : sorted_issues(issues)) {
        if (compute_derived(*issue, issues).is_ready) ready.push_back(issue);
    }
    return ready;
}

// First ready issue that is not a meta tracker
inline const Issue* next_issue(const IssueMap& issues) {
    for (const Issue* issue : ready_issues(issues)) {
        if (!issue->is_meta()) return issue;
    }
    return nullptr;
}

inline std::vector<std::string> dependents(const std::string& id, const IssueMap& issues) {
    std::vector<std::string> out;
    for (const auto& [other, issue] : issues) {
        if (issue.has_dep(id)) out.push_back(other);
    }
    return out;  // std::map iteration is already sorted
}

// Add child -> parent. Returns false when the edge already existed.
inline Result<bool> add_dep_checked(IssueMap& issues, const std::string& child,
                                    const std::string& parent) {
    if (child == parent) {
        return Error::invalid_graph("cannot add self-dependency: " + child);
    }
    auto it = issues.find(child);
    if (it == issues.end()) return Error::issue_not_found(child);
    if (it->second.has_dep(parent)) return false;

    if (auto cycle = would_create_cycle(child, parent, issues)) {
        return Error::invalid_graph("cannot add dependency: would create cycle: " +
                                    format_cycle(*cycle));
    }
    it->second.deps.push_back(parent);
    return true;
}

} // namespace braid
