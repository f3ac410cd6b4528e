#pragma once

// Mount/user/network namespace confinement for the local provider.
//
// The child mounts a tmpfs on Confinement::root, binds the listed host paths
// into it (read-only unless marked writable), adds /dev/{null,zero,full,
// random,urandom} and a private /tmp, remounts the root read-only and
// pivots into it. Nothing else of the host filesystem stays reachable.
// Unprivileged callers get a user namespace mapping only their own uid/gid;
// the capabilities it grants are gone after execve.

#include "proc.h"

#include <string>
#include <vector>

namespace warden {

// Everything the forked child needs, computed before fork so the child
// itself only issues syscalls.
struct PreparedConfinement {
    struct Mount {
        std::string source;
        std::string target;                 // host path under root
        std::vector<std::string> mkdirs;    // parents of target, outermost first
        bool is_dir{true};
        bool read_only{true};
        unsigned long keep_flags{0};        // nosuid/nodev/noexec/atime of the source mount
    };

    bool user_ns{false};
    std::string root;
    std::string tmp;
    std::string uid_map;
    std::string gid_map;
    std::vector<Mount> mounts;
};

// Validates the bind list and resolves it against the host. Returns empty
// string on success.
std::string prepare_confinement(const Confinement& c, PreparedConfinement* out);

// Runs in the forked child before exec. Only async-signal-safe calls.
// Returns nullptr on success, otherwise the step that failed.
const char* enter_confinement(const PreparedConfinement& p);

// Host directories a confined interpreter needs read-only (those that exist).
std::vector<std::string> confinement_system_paths();

// Empty when confinement works on this host, otherwise the reason it does
// not. The first call launches a trial child; the answer is cached.
const std::string& confinement_status();

inline bool confinement_available() { return confinement_status().empty(); }

} // namespace warden
