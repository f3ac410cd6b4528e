#include "warden/wal.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace warden {

static int64_t epoch_sec() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

static int64_t epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static void fsync_dir(const std::filesystem::path& dir) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd >= 0) { ::fsync(dfd); ::close(dfd); }
}

Wal::Wal(std::filesystem::path path) : path_(std::move(path)) {}

Wal::~Wal() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Wal::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

void Wal::set_policy(const WalPolicy& policy) {
    std::lock_guard<std::mutex> lk(mu_);
    policy_ = policy;
}

std::string Wal::open_locked() {
    if (fd_ >= 0) return "";

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }

    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        return std::string("open: ") + std::strerror(errno);
    }

    segment_open_time_ = epoch_sec();
    struct stat st{};
    current_size_ = (::fstat(fd_, &st) == 0) ? (int64_t)st.st_size : 0;
    return "";
}

std::string Wal::open() {
    std::lock_guard<std::mutex> lk(mu_);
    return open_locked();
}

std::string Wal::refresh() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) return open_locked();

    struct stat on_disk{};
    struct stat held{};
    if (::fstat(fd_, &held) != 0) return std::string("fstat: ") + std::strerror(errno);
    if (::stat(path_.c_str(), &on_disk) != 0 || on_disk.st_ino != held.st_ino || on_disk.st_dev != held.st_dev) {
        // Rotated away by another writer; follow the base path.
        ::close(fd_);
        fd_ = -1;
        return open_locked();
    }
    current_size_ = (int64_t)held.st_size;
    return "";
}

bool Wal::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return fd_ >= 0;
}

std::string Wal::append_line(const std::string& json) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;

    if (needs_rotation_locked()) {
        err = rotate_locked();
        if (!err.empty()) return err;
    }

    std::string line = json;
    if (line.empty() || line.back() != '\n') line.push_back('\n');

    const char* p = line.data();
    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, p + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }
    current_size_ += (int64_t)line.size();

    if (fsync_ && ::fsync(fd_) != 0) {
        return std::string("fsync: ") + std::strerror(errno);
    }
    return "";
}

long long Wal::size_bytes() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) return 0;
        return (long long)std::filesystem::file_size(path_, ec);
    }
    struct stat st{};
    if (::fstat(fd_, &st) != 0) return -1;
    return (long long)st.st_size;
}

bool Wal::needs_rotation_locked() const {
    if (policy_.max_segment_bytes > 0 && current_size_ >= policy_.max_segment_bytes) {
        return true;
    }
    if (policy_.max_segment_age_sec > 0 && segment_open_time_ > 0) {
        if (epoch_sec() - segment_open_time_ >= policy_.max_segment_age_sec) return true;
    }
    return false;
}

std::string Wal::rotate_locked() {
    if (fd_ < 0) return "";

    ::close(fd_);
    fd_ = -1;

    // <stem>.<epoch_ms>.<seq>.jsonl; seq keeps rotations within one millisecond
    // distinct and ordered.
    auto parent = path_.parent_path();
    std::error_code ec;
    std::filesystem::path rotated;
    for (int seq = 0;; seq++) {
        char suffix[48];
        std::snprintf(suffix, sizeof(suffix), ".%013lld.%04d.jsonl", (long long)epoch_ms(), seq);
        rotated = parent / (path_.stem().string() + suffix);
        if (!std::filesystem::exists(rotated, ec)) break;
    }

    std::filesystem::rename(path_, rotated, ec);
    if (ec) {
        std::string reopen = open_locked();
        return std::string("rotate rename: ") + ec.message() + (reopen.empty() ? "" : "; " + reopen);
    }
    fsync_dir(parent);

    return open_locked();
}

std::string Wal::rotate_now() {
    std::lock_guard<std::mutex> lk(mu_);
    return rotate_locked();
}

std::vector<std::filesystem::path> Wal::rotated_segments_locked() const {
    std::vector<std::filesystem::path> out;
    auto parent = path_.parent_path();
    if (parent.empty()) parent = ".";
    const std::string stem = path_.stem().string();
    const std::string active = path_.filename().string();

    std::error_code ec;
    if (!std::filesystem::exists(parent, ec)) return out;
    for (const auto& entry : std::filesystem::directory_iterator(parent, ec)) {
        if (!entry.is_regular_file()) continue;
        auto fname = entry.path().filename().string();
        if (fname == active) continue;
        if (fname.starts_with(stem + ".") && fname.ends_with(".jsonl")) {
            out.push_back(entry.path());
        }
    }
    // Timestamp in the name gives chronological order.
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::filesystem::path> Wal::list_segments() const {
    std::lock_guard<std::mutex> lk(mu_);
    auto segments = rotated_segments_locked();
    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) segments.push_back(path_);
    return segments;
}

int Wal::enforce_retention() {
    std::lock_guard<std::mutex> lk(mu_);
    auto rotated = rotated_segments_locked();
    int deleted = 0;
    std::error_code ec;

    // max_segments counts the active segment too.
    while (policy_.max_segments > 0 &&
           (int)(rotated.size() + 1) > policy_.max_segments &&
           !rotated.empty()) {
        std::filesystem::remove(rotated.front(), ec);
        rotated.erase(rotated.begin());
        deleted++;
    }

    if (policy_.max_total_bytes > 0) {
        int64_t total = current_size_;
        for (const auto& p : rotated) total += (int64_t)std::filesystem::file_size(p, ec);
        while (total > policy_.max_total_bytes && !rotated.empty()) {
            total -= (int64_t)std::filesystem::file_size(rotated.front(), ec);
            std::filesystem::remove(rotated.front(), ec);
            rotated.erase(rotated.begin());
            deleted++;
        }
    }
    return deleted;
}

} // namespace warden
