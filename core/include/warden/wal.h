#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace warden {

// Segment rotation and retention policy.
struct WalPolicy {
    int64_t max_segment_bytes{16 * 1024 * 1024};  // 16 MB per segment
    int max_segment_age_sec{0};                     // 0 = no age limit
    int max_segments{0};                            // 0 = keep everything
    int64_t max_total_bytes{0};                     // 0 = no total cap
};

// Wal: append-only JSONL log with segment rotation.
//
// Each append writes a single line: <json>\n
// When a segment exceeds the size or age limit, it is renamed to
// <stem>.<epoch_ms>.<seq>.jsonl and a fresh segment is opened at the base path.
//
// Thread-safe, with optional fsync per append. Errors are returned as
// strings; empty string means success.
class Wal {
public:
    explicit Wal(std::filesystem::path path);
    ~Wal();

    Wal(const Wal&) = delete;
    Wal& operator=(const Wal&) = delete;

    void set_fsync(bool enable);
    void set_policy(const WalPolicy& policy);

    // Opens the active segment (creates parent dirs if needed).
    std::string open();
    bool is_open() const;

    // For writers sharing the file across processes (under their own lock):
    // reopens the base path if the held segment was rotated away and picks
    // up the current size.
    std::string refresh();

    std::string append_line(const std::string& json);

    // Size of the active segment in bytes.
    long long size_bytes() const;

    std::string rotate_now();

    // Deletes the oldest rotated segments beyond max_segments / max_total_bytes.
    // Returns number of segments deleted.
    int enforce_retention();

    // All segment files, rotated ones first (oldest-first), active last.
    std::vector<std::filesystem::path> list_segments() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    bool fsync_ = false;
    mutable std::mutex mu_;
    WalPolicy policy_;
    int64_t segment_open_time_{0};     // epoch seconds when current segment opened
    int64_t current_size_{0};

    std::string open_locked();
    std::string rotate_locked();
    bool needs_rotation_locked() const;
    std::vector<std::filesystem::path> rotated_segments_locked() const;
};

} // namespace warden
