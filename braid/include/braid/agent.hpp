#pragma once
// Agent identity: who owns the issues this worktree starts
//
// Resolution: BRD_AGENT_ID, .braid/agent.toml agent_id, $USER, "default-user".

#include "error.hpp"
#include "fileio.hpp"
#include "log.hpp"
#include "toml.hpp"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace braid {

namespace fs = std::filesystem;

inline Result<std::optional<std::string>> read_agent_file(const fs::path& agent_path) {
    if (!path_exists(agent_path)) return std::optional<std::string>{};
    auto text = read_file(agent_path);
    if (!text) return text.error();
    auto table = toml::parse(*text, agent_path.string());
    if (!table) return table.error();
    return toml::get_string(*table, "agent_id", agent_path.string());
}

inline Result<void> write_agent_file(const fs::path& agent_path, const std::string& agent_id) {
    toml::Table table;
    table.set("agent_id", agent_id);
    return write_atomic(agent_path, toml::serialize(table));
}

inline std::string user_or_default() {
    const char* user = std::getenv("USER");
    if (user && *user) return user;
    log::warn("$USER not set, using 'default-user' as agent_id");
    return "default-user";
}

inline Result<std::string> resolve_agent_id(const fs::path& agent_path) {
    const char* env = std::getenv("BRD_AGENT_ID");
    if (env && *env) {
        log::debug("agent", "from BRD_AGENT_ID: %s", env);
        return std::string(env);
    }

    auto from_file = read_agent_file(agent_path);
    if (!from_file) return from_file.error();
    if (*from_file && !(*from_file)->empty()) {
        log::debug("agent", "from %s: %s", agent_path.c_str(), (*from_file)->c_str());
        return **from_file;
    }

    return user_or_default();
}

} // namespace braid
