#include "warden/proc.h"
#include "warden/confine.h"
#include "warden/sandbox.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace warden {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have = false;

    auto flush = [&]() {
        if (have) {
            out.push_back(cur);
            cur.clear();
            have = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; have = true; continue; }
            if (c == '"') { st = DQ; esc = false; have = true; continue; }
            cur.push_back(c);
            have = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::string resolve_executable(const std::string& name, const std::string& path_env) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) return name;
    size_t start = 0;
    while (start <= path_env.size()) {
        size_t end = path_env.find(':', start);
        if (end == std::string::npos) end = path_env.size();
        std::string dir = path_env.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        struct stat st{};
        if (::stat(cand.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(cand.c_str(), X_OK) == 0) {
            return cand;
        }
        start = end + 1;
    }
    return "";
}

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

// Only async-signal-safe calls between fork and exec.
static void child_fail(int fd, const char* what) {
    (void)!::write(fd, "warden: ", 8);
    (void)!::write(fd, what, std::strlen(what));
    (void)!::write(fd, "\n", 1);
    _exit(126);
}

// Appends to a log fd up to the cap; beyond it the bytes are dropped.
static void sink(int fd, const char* buf, size_t n, int64_t cap, int64_t* written, bool* truncated) {
    int64_t can = cap > *written ? cap - *written : 0;
    size_t take = (size_t)std::min<int64_t>(can, (int64_t)n);
    if (take < n) *truncated = true;
    size_t off = 0;
    while (off < take) {
        ssize_t w = ::write(fd, buf + off, take - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            *truncated = true;
            break;
        }
        off += (size_t)w;
    }
    *written += (int64_t)off;
}

// Reads whatever is available; returns false at EOF.
static bool drain(int rfd, int logfd, int64_t cap, int64_t* written, bool* truncated) {
    char buf[8192];
    while (true) {
        ssize_t n = ::read(rfd, buf, sizeof(buf));
        if (n > 0) {
            sink(logfd, buf, (size_t)n, cap, written, truncated);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return true;   // EAGAIN
    }
}

bool proc_run_logged(const ProcSpec& spec, const ProcLimits& lim, ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (spec.argv.empty() || spec.argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    // Everything the child needs is built before fork.
    std::string path_env = "/usr/local/bin:/usr/bin:/bin";
    for (const auto& kv : spec.env) {
        if (kv.first == "PATH") path_env = kv.second;
    }
    const std::string exe = resolve_executable(spec.argv[0], path_env);
    if (exe.empty()) {
        res->error = "executable not found: " + spec.argv[0];
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(spec.argv.size() + 1);
    for (const auto& s : spec.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    PreparedConfinement confine;
    const bool confined = spec.confine.enabled();
    if (confined) {
        std::string err = prepare_confinement(spec.confine, &confine);
        if (!err.empty()) {
            res->error = "confinement: " + err;
            return false;
        }
    }

    std::vector<std::string> env_storage;
    env_storage.reserve(spec.env.size());
    for (const auto& kv : spec.env) env_storage.push_back(kv.first + "=" + kv.second);
    std::vector<char*> cenv;
    cenv.reserve(env_storage.size() + 1);
    for (auto& s : env_storage) cenv.push_back(s.data());
    cenv.push_back(nullptr);

    const int out_fd = ::open(spec.stdout_path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0600);
    if (out_fd < 0) {
        res->error = "open " + spec.stdout_path.string() + ": " + std::strerror(errno);
        return false;
    }
    const int err_fd = ::open(spec.stderr_path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0600);
    if (err_fd < 0) {
        res->error = "open " + spec.stderr_path.string() + ": " + std::strerror(errno);
        ::close(out_fd);
        return false;
    }

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        ::close(out_fd); ::close(err_fd);
        return false;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(out_fd); ::close(err_fd);
        return false;
    }
    for (int fd : {out_pipe[0], err_pipe[0]}) {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    const bool is_root = (::geteuid() == 0);
    const bool switch_id = is_root && lim.run_as_uid >= 0 && lim.run_as_gid >= 0;
    const long maxfd_conf = sysconf(_SC_OPEN_MAX);
    const int maxfd = (int)std::max<long>(maxfd_conf, 256);
    const rlim_t cpu_sec = lim.rlimit_cpu_sec > 0
        ? (rlim_t)lim.rlimit_cpu_sec
        : (rlim_t)((lim.timeout_ms + lim.kill_grace_ms) / 1000 + 1);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        ::close(out_fd); ::close(err_fd);
        return false;
    }

    if (pid == 0) {
        // child
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // own process group so the whole subtree can be signalled
        (void)setpgid(0, 0);

        for (int fd = 3; fd < maxfd; fd++) (void)::close(fd);

        if (confined) {
            if (const char* why = enter_confinement(confine)) child_fail(STDERR_FILENO, why);
        }
        (void)umask(077);

        if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) child_fail(STDERR_FILENO, "chdir failed");

        if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);

        if (lim.unshare_net && is_root && !confined) (void)unshare(CLONE_NEWNET);

        set_rlimit(RLIMIT_CPU, cpu_sec);
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);

        if (switch_id) {
            // RLIMIT_NPROC counts per uid, so it is meaningful only for the sandbox uid.
            if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
            if (::setgroups(0, nullptr) != 0) child_fail(STDERR_FILENO, "setgroups failed");
            if (::setgid((gid_t)lim.run_as_gid) != 0) child_fail(STDERR_FILENO, "setgid failed");
            if (::setuid((uid_t)lim.run_as_uid) != 0) child_fail(STDERR_FILENO, "setuid failed");
        }

        // must come after no_new_privs
        if (lim.enable_seccomp && !install_seccomp_filter().empty()) {
            child_fail(STDERR_FILENO, "seccomp install failed");
        }

        ::execve(exe.c_str(), cargv.data(), cenv.data());
        child_fail(STDERR_FILENO, "exec failed");
    }

    // parent
    (void)setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    bool term_sent = false;
    std::chrono::steady_clock::time_point term_at;

    auto elapsed = [&]() {
        return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    while (!exited) {
        if (out_open) out_open = drain(out_pipe[0], out_fd, lim.log_max_bytes, &res->stdout_bytes, &res->stdout_truncated);
        if (err_open) err_open = drain(err_pipe[0], err_fd, lim.log_max_bytes, &res->stderr_bytes, &res->stderr_truncated);

        // Peek without reaping: the group id stays reserved while the leader is a zombie.
        siginfo_t info{};
        if (::waitid(P_PID, (id_t)pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
            exited = true;
            break;
        }

        const int64_t ms = elapsed();
        if (lim.timeout_ms > 0 && ms > lim.timeout_ms) {
            if (!term_sent) {
                res->timed_out = true;
                (void)kill(-pid, SIGTERM);
                term_sent = true;
                term_at = std::chrono::steady_clock::now();
            } else if (std::chrono::steady_clock::now() - term_at >= std::chrono::milliseconds(lim.kill_grace_ms)) {
                (void)kill(-pid, SIGKILL);
            }
        }

        struct pollfd pfds[2];
        int n = 0;
        if (out_open) { pfds[n].fd = out_pipe[0]; pfds[n].events = POLLIN; n++; }
        if (err_open) { pfds[n].fd = err_pipe[0]; pfds[n].events = POLLIN; n++; }
        int slice = 50;
        if (lim.timeout_ms > 0 && !term_sent) {
            int64_t remaining = lim.timeout_ms - ms;
            if (remaining < slice) slice = (int)std::max<int64_t>(1, remaining);
        }
        if (n > 0) (void)poll(pfds, (nfds_t)n, slice);
        else std::this_thread::sleep_for(std::chrono::milliseconds(slice));
    }

    // Leader is gone; anything left in its group is a stray background process.
    (void)kill(-pid, SIGKILL);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    res->elapsed_ms = elapsed();

    if (out_open) drain(out_pipe[0], out_fd, lim.log_max_bytes, &res->stdout_bytes, &res->stdout_truncated);
    if (err_open) drain(err_pipe[0], err_fd, lim.log_max_bytes, &res->stderr_bytes, &res->stderr_truncated);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    ::close(out_fd);
    ::close(err_fd);

    // Reparented strays are reaped by init; wait until the group is empty.
    for (int i = 0; i < 200; i++) {
        if (kill(-pid, 0) != 0 && errno == ESRCH) {
            res->group_terminated = true;
            break;
        }
        (void)kill(-pid, SIGKILL);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
}

} // namespace warden
