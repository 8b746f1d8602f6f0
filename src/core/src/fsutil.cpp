/**
 * @file fsutil.cpp
 * @brief Atomic file writes, no-clobber publication, advisory locks
 */

#include "../include/sgate_fsutil.hpp"
#include "../include/sgate_errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sgate {
namespace fs {

namespace {

std::string dir_of(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string base_of(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

void write_all(int fd, const std::string& data, const std::string& path) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t w = ::write(fd, data.data() + off, data.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw IOError("write " + path, errno);
        }
        off += static_cast<size_t>(w);
    }
}

void fsync_dir(const std::string& dir) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return;  // best effort, the rename itself already happened
    ::fsync(dfd);
    ::close(dfd);
}

// Writes content to a fresh temp file next to `path`; returns its name.
std::string write_temp(const std::string& path, const std::string& content, mode_t mode) {
    std::string tmpl = dir_of(path) + "/." + base_of(path) + ".tmp.XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        throw IOError("create temp for " + path, errno);
    }
    std::string tmp(buf.data());

    try {
        if (::fchmod(fd, mode) != 0) {
            throw IOError("chmod " + tmp, errno);
        }
        write_all(fd, content, tmp);
        if (::fsync(fd) != 0) {
            throw IOError("fsync " + tmp, errno);
        }
    } catch (const IOError&) {
        ::close(fd);
        ::unlink(tmp.c_str());
        throw;
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw IOError("close " + tmp, err);
    }
    return tmp;
}

} // anonymous namespace

std::string read_file(const std::string& path) {
    auto content = read_file_if_exists(path);
    if (!content) {
        throw IOError("open " + path, ENOENT);
    }
    return *content;
}

std::optional<std::string> read_file_if_exists(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) return std::nullopt;
        throw IOError("open " + path, errno);
    }

    std::string out;
    char buf[8192];
    while (true) {
        ssize_t r = ::read(fd, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw IOError("read " + path, err);
        }
        if (r == 0) break;
        out.append(buf, static_cast<size_t>(r));
    }
    ::close(fd);
    return out;
}

bool exists(const std::string& path) {
    struct stat st{};
    return ::lstat(path.c_str(), &st) == 0;
}

void ensure_dir(const std::string& path, mode_t mode) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw IOError("mkdir " + path + ": " + ec.message());
    }
    ::chmod(path.c_str(), mode);
}

void atomic_write(const std::string& path, const std::string& content, mode_t mode) {
    std::string tmp = write_temp(path, content, mode);
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw IOError("rename " + tmp + " -> " + path, err);
    }
    fsync_dir(dir_of(path));
}

bool publish_no_clobber(const std::string& path, const std::string& content, mode_t mode) {
    std::string tmp = write_temp(path, content, mode);
    int rc = ::link(tmp.c_str(), path.c_str());
    int err = errno;
    ::unlink(tmp.c_str());
    if (rc != 0) {
        if (err == EEXIST) return false;
        throw IOError("link " + path, err);
    }
    fsync_dir(dir_of(path));
    return true;
}

void append_line(const std::string& path, const std::string& line, mode_t mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, mode);
    if (fd < 0) {
        throw IOError("open " + path, errno);
    }
    std::string data = line;
    if (data.empty() || data.back() != '\n') data.push_back('\n');
    try {
        write_all(fd, data, path);
    } catch (const IOError&) {
        ::close(fd);
        throw;
    }
    ::close(fd);
}

void rename_file(const std::string& from, const std::string& to) {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        throw IOError("rename " + from + " -> " + to, errno);
    }
    fsync_dir(dir_of(to));
}

bool remove_file(const std::string& path) {
    if (::unlink(path.c_str()) == 0) return true;
    if (errno == ENOENT) return false;
    throw IOError("unlink " + path, errno);
}

// ==================== FileLock ====================

FileLock::FileLock(const std::string& path) : fd_(-1) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        throw IOError("open lock " + path, errno);
    }
    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw IOError("flock " + path, err);
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace fs
} // namespace sgate
