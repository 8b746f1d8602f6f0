#pragma once

/**
 * @file sgate_fsutil.hpp
 * @brief Crash-safe file primitives shared by every persisted artifact
 *
 * All writers go through atomic_write() or publish_no_clobber(): content
 * lands in a temp file in the target directory and becomes visible in one
 * rename()/link() step, so readers never observe a partial file.
 * Failures throw IOError.
 */

#include <string>
#include <optional>
#include <sys/types.h>

namespace sgate {
namespace fs {

/// Read a whole file. Throws IOError if it cannot be opened or read.
std::string read_file(const std::string& path);

/// Read a whole file, or nullopt if it does not exist.
std::optional<std::string> read_file_if_exists(const std::string& path);

bool exists(const std::string& path);

/// Create directory and parents. Throws IOError.
void ensure_dir(const std::string& path, mode_t mode = 0755);

/// Write temp file + fsync + rename over `path` + fsync directory.
void atomic_write(const std::string& path, const std::string& content,
                  mode_t mode = 0644);

/**
 * @brief Publish `content` at `path` only if `path` does not exist yet.
 *
 * Uses a hard link from a fully written temp file, which fails with EEXIST
 * instead of replacing an existing file.
 * @return false if `path` already exists
 */
bool publish_no_clobber(const std::string& path, const std::string& content,
                        mode_t mode = 0640);

/// Append with O_APPEND (single write call per line). Creates the file.
void append_line(const std::string& path, const std::string& line,
                 mode_t mode = 0640);

/// rename(2) wrapper. Throws IOError.
void rename_file(const std::string& from, const std::string& to);

/// unlink(2) wrapper; a missing file is not an error. Returns true if removed.
bool remove_file(const std::string& path);

/**
 * @brief RAII advisory lock (flock LOCK_EX) on a lock file
 *
 * The lock file is created if missing and left in place on release.
 */
class FileLock {
public:
    explicit FileLock(const std::string& path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_;
};

} // namespace fs
} // namespace sgate
