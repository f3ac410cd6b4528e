#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace warden {

struct ProcLimits {
    int timeout_ms{60000};
    int kill_grace_ms{2000};                    // SIGTERM -> SIGKILL delay on timeout
    int64_t log_max_bytes{8 * 1024 * 1024};     // per stream

    int rlimit_cpu_sec{0};          // 0 = derived from timeout
    size_t rlimit_as_mb{4096};      // virtual memory MB
    size_t rlimit_fsize_mb{1024};   // max file size MB
    int rlimit_nofile{256};         // max open fds
    int rlimit_nproc{256};          // max processes; only applied with a uid switch

    bool no_new_privs{true};
    bool unshare_net{true};         // best-effort, needs root

    // seccomp-BPF network/privileged syscall denylist (Linux only).
    // Opt-in: WARDEN_SECCOMP_ENABLE=1 or the prod profile.
    bool enable_seccomp{false};

    // Switch to this identity before exec when started as root (-1 = keep).
    int run_as_uid{-1};
    int run_as_gid{-1};
};

// Private filesystem view for the child: a fresh tmpfs becomes "/", only the
// listed binds are visible, and a private /tmp is mounted. Entered in new
// mount and network namespaces (plus a user namespace when not root).
struct Confinement {
    struct Bind {
        std::filesystem::path source;   // host path
        std::string target;             // absolute path inside the new root
        bool writable{false};
    };

    std::filesystem::path root;         // host directory the tmpfs is mounted on; empty = off
    std::vector<Bind> binds;

    bool enabled() const { return !root.empty(); }
};

struct ProcSpec {
    std::vector<std::string> argv;                              // argv[0] resolved via env PATH
    std::string cwd;
    std::vector<std::pair<std::string, std::string>> env;       // complete child environment
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
    Confinement confine;                                        // cwd is resolved inside it
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool group_terminated{false};   // kill(-pgid, 0) confirmed ESRCH after the run
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    int64_t stdout_bytes{0};
    int64_t stderr_bytes{0};
    int64_t elapsed_ms{0};
    std::string error;              // internal runner error, not child stderr
};

// Runs argv in its own process group with a scrubbed environment, rlimits and
// no_new_privs; streams stdout/stderr into the given files (capped per
// stream). On timeout the group gets SIGTERM, then SIGKILL after the grace
// period. Returns true if the process started.
bool proc_run_logged(const ProcSpec& spec, const ProcLimits& lim, ProcResult* res);

// Resolves a bare command name against a PATH string. Names containing '/'
// are returned unchanged. Empty string when not found.
std::string resolve_executable(const std::string& name, const std::string& path_env);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace warden
