#include "warden/sandbox.h"

#include <cerrno>
#include <cstddef>
#include <cstring>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define WARDEN_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define WARDEN_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define WARDEN_AUDIT_ARCH 0
#endif

#define BPF_STMT_SC(code, k) sock_filter{ (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define BPF_JUMP_SC(code, k, jt, jf) sock_filter{ (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

namespace warden {

std::vector<unsigned int> seccomp_denied_syscalls() {
    std::vector<unsigned int> nrs = {
        // network
        __NR_socket, __NR_socketpair, __NR_connect, __NR_bind, __NR_listen,
        __NR_accept4,
        // privileged
        __NR_ptrace, __NR_mount, __NR_umount2, __NR_pivot_root, __NR_chroot,
        __NR_reboot, __NR_sethostname, __NR_setdomainname, __NR_setns,
        __NR_unshare, __NR_kexec_load, __NR_init_module, __NR_finit_module,
        __NR_delete_module, __NR_swapon, __NR_swapoff, __NR_bpf,
        __NR_perf_event_open, __NR_keyctl, __NR_add_key, __NR_request_key,
        __NR_process_vm_readv, __NR_process_vm_writev, __NR_open_by_handle_at,
    };
#ifdef __NR_accept
    nrs.push_back(__NR_accept);
#endif
    return nrs;
}

std::string install_seccomp_filter() {
#if WARDEN_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
    const std::vector<unsigned int> denied = seccomp_denied_syscalls();
    const size_t n = denied.size();

    // Layout:
    //   [0]       load arch
    //   [1]       arch ok -> skip kill
    //   [2]       KILL
    //   [3]       load syscall nr
    //   [4]       nr >= x32 bit -> ERRNO
    //   [5..5+n)  nr == denied[s] -> ERRNO
    //   [5+n]     ALLOW
    //   [5+n+1]   ERRNO(EPERM)
    std::vector<sock_filter> prog_insns;
    prog_insns.reserve(n + 7);

    prog_insns.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    prog_insns.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, WARDEN_AUDIT_ARCH, 1, 0));
    prog_insns.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog_insns.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
#if defined(__x86_64__)
    prog_insns.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JGE | BPF_K, 0x40000000u, (unsigned char)(n + 1), 0));
#else
    // No x32 ABI; keep the layout identical.
    prog_insns.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JA, 0, 0, 0));
#endif
    for (size_t s = 0; s < n; s++) {
        prog_insns.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, denied[s], (unsigned char)(n - s), 0));
    }
    prog_insns.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    prog_insns.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA)));

    struct sock_fprog prog = {};
    prog.len = (unsigned short)prog_insns.size();
    prog.filter = prog_insns.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available and not active, 2: filter mode active, -1/EINVAL: unsupported
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return ret >= 0;
}

} // namespace warden
