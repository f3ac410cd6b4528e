#include "warden/fs_util.h"
#include "warden/crypto.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace warden {

namespace fs = std::filesystem;

void fsync_dir(const fs::path& dir) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) { ::fsync(dfd); ::close(dfd); }
}

std::string write_file_atomic(const fs::path& target, const std::string& bytes, bool fsync) {
    const fs::path dir = target.parent_path();
    // Leading dot keeps temp files out of directory scans.
    const fs::path tmp = dir / ("." + target.filename().string() + ".tmp." + random_hex(6));

    int fd = ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) return "open " + tmp.string() + ": " + std::strerror(errno);

    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t w = ::write(fd, bytes.data() + off, bytes.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            std::error_code ec;
            fs::remove(tmp, ec);
            return err;
        }
        off += (size_t)w;
    }
    if (fsync && ::fsync(fd) != 0) {
        std::string err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        std::error_code ec;
        fs::remove(tmp, ec);
        return err;
    }
    ::close(fd);

    std::error_code rename_ec;
    fs::rename(tmp, target, rename_ec);
    if (rename_ec) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return "rename failed: " + rename_ec.message();
    }
    if (fsync) fsync_dir(dir);
    return "";
}

bool read_file(const fs::path& p, std::string* out, std::string* err) {
    std::ifstream f(p, std::ios::binary);
    if (!f) {
        if (err) *err = "cannot open " + p.string() + ": " + std::strerror(errno);
        return false;
    }
    std::ostringstream oss;
    oss << f.rdbuf();
    if (out) *out = oss.str();
    return true;
}

bool read_file_capped(const fs::path& p, size_t max_bytes, std::string* out, bool* truncated) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    std::string buf(max_bytes, '\0');
    f.read(buf.data(), (std::streamsize)max_bytes);
    buf.resize((size_t)f.gcount());
    bool more = (buf.size() == max_bytes) && (f.peek() != std::ifstream::traits_type::eof());
    if (truncated) *truncated = more;
    if (out) *out = std::move(buf);
    return true;
}

std::vector<std::string> list_files_rel(const fs::path& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto st = it->symlink_status(ec);
        if (ec) break;
        if (fs::is_regular_file(st)) {
            out.push_back(fs::relative(it->path(), dir, ec).generic_string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string copy_tree(const fs::path& src, const fs::path& dst, std::vector<std::string>* skipped) {
    std::error_code ec;
    fs::create_directories(dst, ec);
    if (ec) return "create_directories " + dst.string() + ": " + ec.message();
    if (!fs::is_directory(src, ec)) return "";

    for (auto it = fs::recursive_directory_iterator(src, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto st = it->symlink_status(ec);
        if (ec) return "stat " + it->path().string() + ": " + ec.message();
        const fs::path rel = fs::relative(it->path(), src, ec);
        if (fs::is_directory(st)) {
            fs::create_directories(dst / rel, ec);
            if (ec) return "mkdir " + (dst / rel).string() + ": " + ec.message();
            continue;
        }
        if (!fs::is_regular_file(st)) {
            if (fs::is_symlink(st)) it.disable_recursion_pending();
            if (skipped) skipped->push_back(rel.generic_string());
            continue;
        }
        fs::create_directories((dst / rel).parent_path(), ec);
        fs::copy_file(it->path(), dst / rel, fs::copy_options::overwrite_existing, ec);
        if (ec) return "copy " + rel.string() + ": " + ec.message();
    }
    if (ec) return "walk " + src.string() + ": " + ec.message();
    return "";
}

bool is_path_under(const fs::path& p, const fs::path& base) {
    std::error_code ec;
    fs::path cp = fs::weakly_canonical(p, ec);
    if (ec) return false;
    fs::path cb = fs::weakly_canonical(base, ec);
    if (ec) return false;
    auto it_b = cb.begin();
    auto it_p = cp.begin();
    for (; it_b != cb.end(); ++it_b, ++it_p) {
        if (it_p == cp.end() || *it_p != *it_b) return false;
    }
    return true;
}

int64_t tree_size_bytes(const fs::path& dir) {
    int64_t total = 0;
    std::error_code ec;
    for (const auto& rel : list_files_rel(dir)) {
        auto n = fs::file_size(dir / rel, ec);
        if (!ec) total += (int64_t)n;
    }
    return total;
}

std::string read_last_line(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return "";
    in.seekg(0, std::ios::end);
    const std::streamoff size = in.tellg();
    if (size <= 0) return "";

    // Grow the window from the end until it holds a complete last line.
    std::streamoff window = 4096;
    while (true) {
        const std::streamoff start = size > window ? size - window : 0;
        std::string buf((size_t)(size - start), '\0');
        in.clear();
        in.seekg(start);
        in.read(buf.data(), (std::streamsize)buf.size());
        if (!in) return "";

        size_t end = buf.size();
        while (end > 0 && (buf[end - 1] == '\n' || buf[end - 1] == '\r')) end--;
        if (end == 0 && start == 0) return "";
        if (end > 0) {
            const size_t nl = buf.rfind('\n', end - 1);
            if (nl != std::string::npos) return buf.substr(nl + 1, end - nl - 1);
            if (start == 0) return buf.substr(0, end);
        }
        window *= 2;
    }
}

FileLock::FileLock(const fs::path& p) {
    fd_ = ::open(p.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        err_ = "open " + p.string() + ": " + std::strerror(errno);
        return;
    }
    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        err_ = "flock " + p.string() + ": " + std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        return;
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace warden
