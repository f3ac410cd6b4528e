#pragma once

// seccomp-BPF syscall denylist for executed job code.
//
// Default-allow: interpreters need a wide syscall surface, so the filter only
// denies what a job never needs. Denied calls fail with EPERM:
//   network:    socket, socketpair, connect, bind, listen, accept, accept4
//   privileged: ptrace, mount, umount2, pivot_root, chroot, reboot, sethostname,
//               setdomainname, setns, unshare, kexec_load, init_module,
//               finit_module, delete_module, swapon, swapoff, bpf,
//               perf_event_open, keyctl, add_key, request_key,
//               process_vm_readv, process_vm_writev, open_by_handle_at
// A foreign architecture (or x32 ABI call) is killed.
//
// Opt-in via ProcLimits.enable_seccomp or WARDEN_SECCOMP_ENABLE=1.

#include <string>
#include <vector>

namespace warden {

// Install the filter on the calling process. Must be called AFTER
// prctl(PR_SET_NO_NEW_PRIVS, 1). Returns empty string on success.
std::string install_seccomp_filter();

// Syscall numbers the filter denies on this architecture.
std::vector<unsigned int> seccomp_denied_syscalls();

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace warden
