#pragma once
// Issue migrations: explicit upgrade path between frontmatter schemas
//
// Principles:
// 1. Steps work on the loose YAML tree, never on the typed Issue
// 2. Sequential migrations (v1→v2→v3, not v1→v3)
// 3. Each step sets schema_version to its target on exit
// 4. Data already at the current version passes through untouched
// 5. A version newer than this build fails closed

#include "error.hpp"
#include "log.hpp"
#include "version.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <vector>

namespace braid {
namespace migrations {

constexpr int CURRENT_VERSION = version::CURRENT_SCHEMA;

struct MigrationResult {
    YAML::Node frontmatter;
    int from_version = 0;
    int to_version = 0;
    bool migrated = false;
};

inline bool has_key(const YAML::Node& map, const char* key) {
    const YAML::Node& view = map;
    return view.IsMap() && view[key].IsDefined();
}

// Versions past INT_MAX are still "newer than this build" and saturate.
inline Result<int> read_version(const YAML::Node& value, const char* key) {
    if (!value.IsScalar()) return Error::parse(key, "expected integer");
    const std::string& raw = value.Scalar();
    bool digits = !raw.empty() && std::all_of(raw.begin(), raw.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!digits) {
        try {
            long long v = value.as<long long>();
            if (v < 0) return Error::parse(key, "expected non-negative integer");
            if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
            return static_cast<int>(v);
        } catch (const YAML::Exception&) {
            return Error::parse(key, "expected integer");
        }
    }
    if (raw.size() > 10) return std::numeric_limits<int>::max();
    long long v = std::stoll(raw);
    if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(v);
}

// schema_version first, then the legacy `brd` key, else 0 (pre-versioning)
inline Result<int> get_schema_version(const YAML::Node& frontmatter) {
    const YAML::Node& fm = frontmatter;
    if (has_key(fm, "schema_version")) return read_version(fm["schema_version"], "schema_version");
    if (has_key(fm, "brd")) return read_version(fm["brd"], "brd");
    return 0;
}

inline bool needs_migration(int schema_version) {
    return schema_version < CURRENT_VERSION;
}

// v0 → v1: introduce a version field
inline void migrate_v0_to_v1(YAML::Node& fm) {
    if (!has_key(fm, "brd")) fm["brd"] = 1;
}

// v1 → v2: rename `brd` to `schema_version`
inline void migrate_v1_to_v2(YAML::Node& fm) {
    fm.remove("brd");
    fm["schema_version"] = 2;
}

// v2 → v3: owner becomes a required (nullable) field
inline void migrate_v2_to_v3(YAML::Node& fm) {
    if (!has_key(fm, "owner")) fm["owner"] = YAML::Node(YAML::NodeType::Null);
    fm["schema_version"] = 3;
}

// v3 → v4: rename `labels` to `tags`
inline void migrate_v3_to_v4(YAML::Node& fm) {
    if (has_key(fm, "labels")) {
        const YAML::Node& view = fm;
        YAML::Node labels = YAML::Clone(view["labels"]);
        fm.remove("labels");
        fm["tags"] = labels;
    }
    fm["schema_version"] = 4;
}

// v6 → v7: status `todo` is now `open`
inline void migrate_v6_to_v7(YAML::Node& fm) {
    const YAML::Node& view = fm;
    if (view["status"].IsScalar() && view["status"].Scalar() == "todo") {
        fm["status"] = "open";
    }
    fm["schema_version"] = 7;
}

// v7 → v8: updated_at replaced by started_at / completed_at keyed on status
inline void migrate_v7_to_v8(YAML::Node& fm) {
    const YAML::Node& view = fm;
    YAML::Node updated_at;
    if (has_key(fm, "updated_at")) {
        updated_at = YAML::Clone(view["updated_at"]);
        fm.remove("updated_at");
    }

    std::string status = view["status"].IsScalar() ? view["status"].Scalar() : "";
    if (updated_at.IsDefined() && !updated_at.IsNull()) {
        if (status == "doing") {
            fm["started_at"] = updated_at;
        } else if (status == "done" || status == "skip") {
            fm["started_at"] = YAML::Clone(updated_at);
            fm["completed_at"] = YAML::Clone(updated_at);
        }
    }
    fm["schema_version"] = 8;
}

// Version-only steps: the on-disk shape did not change
inline void bump_version(YAML::Node& fm, int to) {
    fm["schema_version"] = to;
}

inline void apply_migration(YAML::Node& fm, int from_version) {
    switch (from_version) {
        case 0: migrate_v0_to_v1(fm); break;
        case 1: migrate_v1_to_v2(fm); break;
        case 2: migrate_v2_to_v3(fm); break;
        case 3: migrate_v3_to_v4(fm); break;
        case 4: bump_version(fm, 5); break;  // external-repo config support
        case 5: bump_version(fm, 6); break;  // auto_pull / auto_push config support
        case 6: migrate_v6_to_v7(fm); break;
        case 7: migrate_v7_to_v8(fm); break;
        case 8: bump_version(fm, 9); break;  // scheduled_for field
        default: break;
    }
}

// Bring a frontmatter tree up to `target`. The input is never modified.
inline Result<MigrationResult> migrate_frontmatter(const YAML::Node& frontmatter,
                                                   int target = CURRENT_VERSION) {
    if (!frontmatter.IsMap()) {
        return Error::parse("issue frontmatter", "frontmatter is not a mapping");
    }

    auto current = get_schema_version(frontmatter);
    if (!current) return current.error();

    MigrationResult result;
    result.from_version = *current;
    result.to_version = *current;
    result.frontmatter = YAML::Clone(frontmatter);

    if (*current > CURRENT_VERSION) {
        return Error::parse("issue frontmatter",
                            "issue uses schema v" + std::to_string(*current) +
                            ", but this brd only supports up to v" +
                            std::to_string(CURRENT_VERSION));
    }
    if (*current >= target) return result;

    try {
        for (int v = *current; v < target; ++v) {
            apply_migration(result.frontmatter, v);
        }
    } catch (const YAML::Exception& e) {
        return Error::parse("issue frontmatter", std::string("migration failed: ") + e.what());
    }

    result.to_version = target;
    result.migrated = true;
    log::debug("migrate", "frontmatter v%d -> v%d", result.from_version, target);
    return result;
}

// One line per step that would run between the two versions
inline std::vector<std::string> migration_summary(int from_version, int to_version) {
    std::vector<std::string> summaries;
    for (int v = from_version; v < to_version; ++v) {
        switch (v) {
            case 0: summaries.push_back("v0→v1: add schema version field"); break;
            case 1: summaries.push_back("v1→v2: rename 'brd' to 'schema_version'"); break;
            case 2: summaries.push_back("v2→v3: add required 'owner' field"); break;
            case 3: summaries.push_back("v3→v4: rename 'labels' to 'tags'"); break;
            case 4: summaries.push_back("v4→v5: external-repo config support"); break;
            case 5: summaries.push_back("v5→v6: auto_pull/auto_push config support"); break;
            case 6: summaries.push_back("v6→v7: rename status 'todo' to 'open'"); break;
            case 7: summaries.push_back("v7→v8: replace updated_at with started_at/completed_at"); break;
            case 8: summaries.push_back("v8→v9: add scheduled_for field"); break;
            default: break;
        }
    }
    return summaries;
}

} // namespace migrations
} // namespace braid
