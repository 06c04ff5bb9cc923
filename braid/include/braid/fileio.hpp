#pragma once
// File I/O: whole-file reads and atomic replacement
//
// Tracked files are never written in place: write temp, fsync, rename,
// fsync dir. An interrupted write leaves <path>.tmp.<pid> behind.

#include "error.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace braid {

namespace fs = std::filesystem;

inline Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error::io("cannot read " + path.string() + ": " + strerror(errno));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline std::string temp_path_for(const fs::path& path) {
    return path.string() + ".tmp." + std::to_string(::getpid());
}

// Fsync parent directory for durability
inline bool fsync_dir(const fs::path& path) {
    fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

inline Result<void> write_atomic(const fs::path& path, const std::string& content) {
    std::string tmp = temp_path_for(path);
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) {
        return Error::io("cannot create " + tmp + ": " + strerror(errno));
    }

    bool ok = ::fwrite(content.data(), 1, content.size(), f) == content.size();
    ok = ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;
    int saved_errno = errno;
    ::fclose(f);

    if (!ok) {
        ::remove(tmp.c_str());
        return Error::io("cannot write " + tmp + ": " + strerror(saved_errno));
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        saved_errno = errno;
        ::remove(tmp.c_str());
        return Error::io("cannot rename " + tmp + " to " + path.string() + ": " +
                         strerror(saved_errno));
    }

    fsync_dir(path);
    return {};
}

inline Result<void> ensure_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Error::io("cannot create " + dir.string() + ": " + ec.message());
    return {};
}

inline Result<void> remove_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::remove(path, ec) && ec) {
        return Error::io("cannot remove " + path.string() + ": " + ec.message());
    }
    return {};
}

inline bool path_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

} // namespace braid
