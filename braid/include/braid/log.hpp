#pragma once
// Logging: stderr diagnostics with component prefixes
//
// Debug lines only appear with --verbose (or BRD_VERBOSE=1).
// Warnings are user-facing and always printed.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

namespace braid::log {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{[] {
        const char* env = std::getenv("BRD_VERBOSE");
        return env && std::strcmp(env, "0") != 0 && *env != '\0';
    }()};
    return verbose;
}

inline void set_verbose(bool on) { verbose_flag() = on; }
inline bool verbose() { return verbose_flag(); }

inline void debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << component << "] ";
    std::cerr.flush();

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

inline void warn(const std::string& message) {
    std::cerr << "warning: " << message << "\n";
}

inline void note(const std::string& message) {
    std::cerr << message << "\n";
}

} // namespace braid::log
