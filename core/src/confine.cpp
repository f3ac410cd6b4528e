#include "warden/confine.h"
#include "warden/crypto.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <linux/capability.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace warden {

namespace fs = std::filesystem;

static const char* const kSystemPaths[] = {
    "/usr", "/bin", "/sbin", "/lib", "/lib64", "/lib32", "/etc/alternatives", "/etc/ssl",
};

static const char* const kDevices[] = {
    "/dev/null", "/dev/zero", "/dev/full", "/dev/random", "/dev/urandom",
};

std::vector<std::string> confinement_system_paths() {
    std::vector<std::string> out;
    std::error_code ec;
    for (const char* p : kSystemPaths) {
        if (fs::exists(p, ec)) out.emplace_back(p);
    }
    return out;
}

// A read-only remount inside a user namespace must keep the locked flags of
// the source mount.
static unsigned long mount_flags_of(unsigned long st) {
    unsigned long f = 0;
    if (st & ST_NOSUID) f |= MS_NOSUID;
    if (st & ST_NODEV) f |= MS_NODEV;
    if (st & ST_NOEXEC) f |= MS_NOEXEC;
    if (st & ST_NOATIME) f |= MS_NOATIME;
    if (st & ST_NODIRATIME) f |= MS_NODIRATIME;
    if (st & ST_RELATIME) f |= MS_RELATIME;
    return f;
}

std::string prepare_confinement(const Confinement& c, PreparedConfinement* out) {
    *out = PreparedConfinement{};
    if (!c.enabled()) return "confinement root not set";

    std::error_code ec;
    fs::create_directories(c.root, ec);
    if (ec) return "create " + c.root.string() + ": " + ec.message();
    const fs::path root = fs::absolute(c.root, ec);
    if (ec) return "resolve " + c.root.string() + ": " + ec.message();
    out->root = root.lexically_normal().string();
    while (out->root.size() > 1 && out->root.back() == '/') out->root.pop_back();
    out->tmp = out->root + "/tmp";

    out->user_ns = ::geteuid() != 0;
    if (out->user_ns) {
        const std::string uid = std::to_string(::geteuid());
        const std::string gid = std::to_string(::getegid());
        out->uid_map = uid + " " + uid + " 1\n";
        out->gid_map = gid + " " + gid + " 1\n";
    }

    std::vector<Confinement::Bind> binds = c.binds;
    for (const char* dev : kDevices) {
        if (fs::exists(dev, ec)) binds.push_back({dev, dev, true});
    }
    // Parents before children.
    std::sort(binds.begin(), binds.end(),
              [](const Confinement::Bind& a, const Confinement::Bind& b) { return a.target < b.target; });

    for (size_t i = 0; i < binds.size(); i++) {
        const auto& b = binds[i];
        if (b.target.size() < 2 || b.target[0] != '/' || fs::path(b.target).lexically_normal().string() != b.target ||
            b.target == "/tmp" || b.target.rfind("/tmp/", 0) == 0) {
            return "invalid bind target '" + b.target + "'";
        }
        if (i > 0 && binds[i - 1].target == b.target) return "duplicate bind target '" + b.target + "'";

        struct stat st{};
        if (::stat(b.source.c_str(), &st) != 0) {
            return "bind source " + b.source.string() + ": " + std::strerror(errno);
        }

        PreparedConfinement::Mount m;
        m.source = b.source.string();
        m.target = out->root + b.target;
        m.is_dir = S_ISDIR(st.st_mode);
        m.read_only = !b.writable;
        struct statvfs vfs{};
        if (::statvfs(m.source.c_str(), &vfs) == 0) m.keep_flags = mount_flags_of(vfs.f_flag);
        for (fs::path p = fs::path(b.target).parent_path(); p != "/" && !p.empty(); p = p.parent_path()) {
            m.mkdirs.push_back(out->root + p.string());
        }
        std::reverse(m.mkdirs.begin(), m.mkdirs.end());
        out->mounts.push_back(std::move(m));
    }
    return "";
}

static bool write_proc_file(const char* path, const std::string& data) {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t w = ::write(fd, data.data(), data.size());
    ::close(fd);
    return w == (ssize_t)data.size();
}

static bool make_dir(const std::string& p) {
    return ::mkdir(p.c_str(), 0755) == 0 || errno == EEXIST;
}

const char* enter_confinement(const PreparedConfinement& p) {
    int flags = CLONE_NEWNS | CLONE_NEWNET;
    if (p.user_ns) flags |= CLONE_NEWUSER;
    if (::unshare(flags) != 0) return "unshare namespaces failed";

    if (p.user_ns) {
        int fd = ::open("/proc/self/setgroups", O_WRONLY | O_CLOEXEC);
        if (fd >= 0) {
            ssize_t w = ::write(fd, "deny", 4);
            ::close(fd);
            if (w != 4) return "setgroups deny failed";
        } else if (errno != ENOENT) {
            return "open /proc/self/setgroups failed";
        }
        if (!write_proc_file("/proc/self/uid_map", p.uid_map)) return "write uid_map failed";
        if (!write_proc_file("/proc/self/gid_map", p.gid_map)) return "write gid_map failed";
    }

    if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) return "make mounts private failed";
    if (::mount("tmpfs", p.root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "mode=0755") != 0) {
        return "mount root tmpfs failed";
    }

    for (const auto& m : p.mounts) {
        for (const auto& d : m.mkdirs) {
            if (!make_dir(d)) return "create mount point parent failed";
        }
        if (m.is_dir) {
            if (!make_dir(m.target)) return "create mount point failed";
        } else {
            int fd = ::open(m.target.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
            if (fd < 0) return "create file mount point failed";
            ::close(fd);
        }
        if (::mount(m.source.c_str(), m.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) {
            return "bind mount failed";
        }
        if (m.read_only &&
            ::mount(nullptr, m.target.c_str(), nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | m.keep_flags, nullptr) != 0) {
            return "read-only remount failed";
        }
    }

    if (!make_dir(p.tmp)) return "create /tmp failed";
    if (::mount("tmpfs", p.tmp.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "mode=1777") != 0) return "mount /tmp failed";

    if (::mount(nullptr, p.root.c_str(), nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0) {
        return "read-only root remount failed";
    }

    if (::chdir(p.root.c_str()) != 0) return "chdir new root failed";
    if (::syscall(SYS_pivot_root, ".", ".") != 0) return "pivot_root failed";
    if (::umount2(".", MNT_DETACH) != 0) return "detach old root failed";
    if (::chdir("/") != 0) return "chdir / failed";

    // A job that keeps root could otherwise undo the read-only binds.
    if (!p.user_ns) (void)prctl(PR_CAPBSET_DROP, CAP_SYS_ADMIN, 0, 0, 0);
    return nullptr;
}

static std::string trial_run() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    const fs::path dir = tmp / ("warden-confine-" + std::to_string(::getpid()) + "-" + random_hex(4));
    fs::create_directories(dir / "ro", ec);
    if (!ec) fs::create_directories(dir / "rw", ec);
    if (ec) return "create " + dir.string() + ": " + ec.message();

    ProcSpec spec;
    spec.argv = {"true"};
    spec.env = {{"PATH", "/usr/bin:/bin"}};
    spec.stdout_path = dir / "stdout.log";
    spec.stderr_path = dir / "stderr.log";
    spec.cwd = "/work";
    spec.confine.root = dir / "root";
    for (const auto& p : confinement_system_paths()) spec.confine.binds.push_back({p, p, false});
    spec.confine.binds.push_back({dir / "ro", "/data", false});
    spec.confine.binds.push_back({dir / "rw", "/work", true});

    ProcLimits lim;
    lim.timeout_ms = 10000;
    lim.unshare_net = false;

    ProcResult res;
    std::string why;
    if (!proc_run_logged(spec, lim, &res)) {
        why = res.error;
    } else if (res.exit_code != 0) {
        std::ifstream f(spec.stderr_path);
        std::stringstream ss;
        ss << f.rdbuf();
        why = ss.str();
        while (!why.empty() && (why.back() == '\n' || why.back() == '\r')) why.pop_back();
        if (why.empty()) why = "trial exited with code " + std::to_string(res.exit_code);
    }
    fs::remove_all(dir, ec);
    return why;
}

const std::string& confinement_status() {
    static const std::string status = trial_run();
    return status;
}

} // namespace warden
