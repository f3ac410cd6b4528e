#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace warden {

// Filesystem helpers shared by the store, executor and disclosure gate.
// Errors are returned as strings; empty string means success.

// 2-phase atomic write: tmp -> (fsync) -> rename -> (fsync parent dir).
// Readers of `target` see either the old or the new content, never a mix.
std::string write_file_atomic(const std::filesystem::path& target, const std::string& bytes, bool fsync);

// Reads a whole file. Returns false (with *err) when it cannot be opened.
bool read_file(const std::filesystem::path& p, std::string* out, std::string* err = nullptr);

// Like read_file but stops after max_bytes; *truncated reports whether it did.
bool read_file_capped(const std::filesystem::path& p, size_t max_bytes, std::string* out, bool* truncated);

void fsync_dir(const std::filesystem::path& dir);

// Relative paths of regular files under dir, sorted. Symlinks and other
// non-regular entries are never followed or listed.
std::vector<std::string> list_files_rel(const std::filesystem::path& dir);

// Copies the regular files under src into dst (created if missing).
// Symlinks and special files are skipped and reported in *skipped.
std::string copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst,
                      std::vector<std::string>* skipped = nullptr);

// True if p resolves to base or somewhere beneath it.
bool is_path_under(const std::filesystem::path& p, const std::filesystem::path& base);

// Sum of regular file sizes under dir (symlinks not followed).
int64_t tree_size_bytes(const std::filesystem::path& dir);

// Last non-empty line of a text file, read backwards from the end.
// Empty when the file is missing or holds no line.
std::string read_last_line(const std::filesystem::path& p);

// Exclusive flock on a lock file (created if missing) for the lifetime of
// the guard. Serializes threads and processes alike. Check held().
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& p);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool held() const { return fd_ >= 0; }
    const std::string& error() const { return err_; }

private:
    int fd_ = -1;
    std::string err_;
};

} // namespace warden
