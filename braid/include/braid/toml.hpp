#pragma once
// TOML: flat key/value documents (config.toml, agent.toml)
//
// Supports the subset those files use: bare keys, basic and literal
// strings, integers, booleans, comments. Tables and arrays are rejected.
// Key order is preserved so rewrites stay diff-friendly.

#include "error.hpp"
#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace braid::toml {

using Value = std::variant<std::string, int64_t, bool>;

class Table {
public:
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    const Value* find(const std::string& key) const {
        for (const auto& [k, v] : entries_) {
            if (k == key) return &v;
        }
        return nullptr;
    }

    void set(const std::string& key, Value value) {
        for (auto& [k, v] : entries_) {
            if (k == key) {
                v = std::move(value);
                return;
            }
        }
        entries_.emplace_back(key, std::move(value));
    }

    bool remove(const std::string& key) {
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->first == key) {
                entries_.erase(it);
                return true;
            }
        }
        return false;
    }

    const std::vector<std::pair<std::string, Value>>& entries() const { return entries_; }

private:
    std::vector<std::pair<std::string, Value>> entries_;
};

namespace detail {

inline bool is_bare_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

inline void skip_ws(const std::string& s, size_t& i) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
}

inline bool rest_is_comment(const std::string& s, size_t i) {
    skip_ws(s, i);
    return i >= s.size() || s[i] == '#';
}

inline bool parse_basic_string(const std::string& s, size_t& i, std::string& out,
                               std::string& err) {
    ++i;  // opening quote
    while (i < s.size()) {
        char c = s[i++];
        if (c == '"') return true;
        if (c != '\\') {
            out += c;
            continue;
        }
        if (i >= s.size()) break;
        char e = s[i++];
        switch (e) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            default:
                err = std::string("unsupported escape \\") + e;
                return false;
        }
    }
    err = "unterminated string";
    return false;
}

} // namespace detail

// Parse a document. `where` names the file in error messages.
inline Result<Table> parse(const std::string& text, const std::string& where) {
    Table table;
    std::istringstream in(text);
    std::string line;
    int lineno = 0;

    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto fail = [&](const std::string& msg) {
            return Error::parse(where, "line " + std::to_string(lineno) + ": " + msg);
        };

        size_t i = 0;
        detail::skip_ws(line, i);
        if (i >= line.size() || line[i] == '#') continue;
        if (line[i] == '[') return fail("tables are not supported");

        std::string key;
        if (line[i] == '"') {
            std::string err;
            if (!detail::parse_basic_string(line, i, key, err)) return fail(err);
        } else {
            while (i < line.size() && detail::is_bare_key_char(line[i])) key += line[i++];
        }
        if (key.empty()) return fail("expected key");

        detail::skip_ws(line, i);
        if (i >= line.size() || line[i] != '=') return fail("expected '=' after key '" + key + "'");
        ++i;
        detail::skip_ws(line, i);
        if (i >= line.size()) return fail("missing value for key '" + key + "'");
        if (table.contains(key)) return fail("duplicate key '" + key + "'");

        if (line[i] == '"') {
            std::string value, err;
            if (!detail::parse_basic_string(line, i, value, err)) return fail(err);
            if (!detail::rest_is_comment(line, i)) return fail("trailing characters after value");
            table.set(key, value);
        } else if (line[i] == '\'') {
            size_t end = line.find('\'', i + 1);
            if (end == std::string::npos) return fail("unterminated string");
            std::string value = line.substr(i + 1, end - i - 1);
            if (!detail::rest_is_comment(line, end + 1)) return fail("trailing characters after value");
            table.set(key, value);
        } else {
            size_t end = line.find('#', i);
            std::string raw = line.substr(i, end == std::string::npos ? std::string::npos : end - i);
            while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\t')) raw.pop_back();

            if (raw == "true") {
                table.set(key, true);
            } else if (raw == "false") {
                table.set(key, false);
            } else {
                std::string digits;
                for (char c : raw) {
                    if (c != '_') digits += c;
                }
                size_t pos = 0;
                int64_t n = 0;
                bool numeric = !digits.empty();
                try {
                    n = std::stoll(digits, &pos);
                } catch (const std::invalid_argument&) {
                    numeric = false;
                } catch (const std::out_of_range&) {
                    return fail("integer out of range for key '" + key + "'");
                }
                if (!numeric || pos != digits.size()) {
                    return fail("invalid value for key '" + key + "': " + raw);
                }
                table.set(key, n);
            }
        }
    }

    return table;
}

inline std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c;
        }
    }
    out += "\"";
    return out;
}

inline std::string serialize(const Table& table) {
    std::string out;
    for (const auto& [key, value] : table.entries()) {
        out += key + " = ";
        if (auto s = std::get_if<std::string>(&value)) {
            out += quote(*s);
        } else if (auto n = std::get_if<int64_t>(&value)) {
            out += std::to_string(*n);
        } else {
            out += std::get<bool>(value) ? "true" : "false";
        }
        out += "\n";
    }
    return out;
}

// Typed lookups. Absent keys yield nullopt; wrong types are parse errors.
inline Result<std::optional<std::string>> get_string(const Table& t, const std::string& key,
                                                     const std::string& where) {
    const Value* v = t.find(key);
    if (!v) return std::optional<std::string>{};
    if (auto s = std::get_if<std::string>(v)) return std::optional<std::string>{*s};
    return Error::parse(where, "'" + key + "' must be a string");
}

inline Result<std::optional<int64_t>> get_int(const Table& t, const std::string& key,
                                              const std::string& where) {
    const Value* v = t.find(key);
    if (!v) return std::optional<int64_t>{};
    if (auto n = std::get_if<int64_t>(v)) return std::optional<int64_t>{*n};
    return Error::parse(where, "'" + key + "' must be an integer");
}

inline Result<std::optional<bool>> get_bool(const Table& t, const std::string& key,
                                            const std::string& where) {
    const Value* v = t.find(key);
    if (!v) return std::optional<bool>{};
    if (auto b = std::get_if<bool>(v)) return std::optional<bool>{*b};
    return Error::parse(where, "'" + key + "' must be a boolean");
}

} // namespace braid::toml
