#include "warden/isolation.h"
#include "warden/confine.h"
#include "warden/crypto.h"
#include "warden/errors.h"

#include <cstdlib>
#include <iostream>

#include <unistd.h>

namespace warden {

static const char* kSandboxPath = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

std::vector<std::pair<std::string, std::string>> job_environment(const ExecutionContext& ctx,
                                                                  const std::string& code_path,
                                                                  const std::string& data_path,
                                                                  const std::string& output_path,
                                                                  const std::string& home) {
    std::vector<std::pair<std::string, std::string>> env = {
        {"PATH", kSandboxPath},
        {"LANG", "C.UTF-8"},
        {"HOME", home},
        {"TMPDIR", home},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONUNBUFFERED", "1"},
        {"CODE_DIR", code_path},
        {"DATA_DIR", data_path},
        {"OUTPUT_DIR", output_path},
        {"TIMEOUT", std::to_string(ctx.timeout_sec)},
        {"INPUT_FILE", code_path + "/" + ctx.entrypoint},
    };
    // Secrets never shadow the variables above.
    for (const auto& kv : ctx.secrets) {
        bool reserved = false;
        for (const auto& e : env) {
            if (e.first == kv.first) { reserved = true; break; }
        }
        if (!reserved) env.push_back(kv);
    }
    return env;
}

static std::vector<std::string> job_argv(const ExecutionContext& ctx, const std::string& code_path) {
    std::vector<std::string> argv = ctx.runtime_cmd;
    argv.push_back(code_path + "/" + ctx.entrypoint);
    return argv;
}

static void route_logs(const ExecutionContext& ctx, ProcSpec* spec) {
    spec->stdout_path = ctx.logs_dir / "stdout.log";
    spec->stderr_path = ctx.logs_dir / "stderr.log";
}

// --- local ---

void LocalIsolationProvider::check_admissible(bool private_data) const {
    if (!private_data || allow_unconfined_) return;
    const std::string& why = confinement_status();
    if (!why.empty()) {
        throw Error(ErrorKind::VALIDATION,
                    "local isolation is unavailable on this host (" + why +
                        "); use WARDEN_ISOLATION=bwrap or docker, or set WARDEN_ALLOW_UNCONFINED=1");
    }
}

LaunchPlan LocalIsolationProvider::plan(const ExecutionContext& ctx, const ProcLimits& base) const {
    check_admissible(ctx.private_data);

    LaunchPlan p;
    p.limits = base;

    if (!confinement_available()) {
        if (ctx.private_data) {
            std::cerr << "[warden] local isolation unavailable (" << confinement_status()
                      << "); running unconfined on private data\n";
        }
        p.code_path = ctx.code_dir.string();
        p.data_path = ctx.data_dir.string();
        p.output_path = ctx.output_dir.string();
        p.spec.argv = job_argv(ctx, p.code_path);
        p.spec.cwd = p.output_path;
        p.spec.env = job_environment(ctx, p.code_path, p.data_path, p.output_path, ctx.scratch_dir.string());
        route_logs(ctx, &p.spec);
        return p;
    }

    // The namespaces carry their own network isolation.
    p.limits.unshare_net = false;
    p.code_path = "/sandbox/code";
    p.data_path = ctx.data_mount_dir.empty() ? "/sandbox/data" : ctx.data_mount_dir;
    p.output_path = "/sandbox/output";

    Confinement& c = p.spec.confine;
    c.root = ctx.scratch_dir / "root";
    for (const auto& sys : confinement_system_paths()) c.binds.push_back({sys, sys, false});
    for (const auto& extra : extra_ro_paths_) c.binds.push_back({extra, extra, false});
    c.binds.push_back({ctx.code_dir, p.code_path, false});
    c.binds.push_back({ctx.data_dir, p.data_path, false});
    c.binds.push_back({ctx.output_dir, p.output_path, true});

    p.spec.argv = job_argv(ctx, p.code_path);
    p.spec.cwd = p.output_path;
    p.spec.env = job_environment(ctx, p.code_path, p.data_path, p.output_path, "/tmp");
    route_logs(ctx, &p.spec);
    return p;
}

// --- bwrap ---

LaunchPlan BwrapIsolationProvider::plan(const ExecutionContext& ctx, const ProcLimits& base) const {
    LaunchPlan p;
    p.limits = base;
    // bwrap does its own privilege handling and sets no_new_privs inside.
    p.limits.no_new_privs = false;
    p.limits.unshare_net = false;
    p.limits.enable_seccomp = false;
    p.limits.run_as_uid = -1;
    p.limits.run_as_gid = -1;

    p.code_path = "/sandbox/code";
    p.data_path = ctx.data_mount_dir.empty() ? "/sandbox/data" : ctx.data_mount_dir;
    p.output_path = "/sandbox/output";

    std::vector<std::string> argv = {
        bwrap_,
        "--unshare-all",
        "--die-with-parent",
        "--new-session",
        "--ro-bind", "/usr", "/usr",
        "--ro-bind-try", "/bin", "/bin",
        "--ro-bind-try", "/sbin", "/sbin",
        "--ro-bind-try", "/lib", "/lib",
        "--ro-bind-try", "/lib64", "/lib64",
        "--ro-bind-try", "/etc/alternatives", "/etc/alternatives",
        "--ro-bind-try", "/etc/ssl", "/etc/ssl",
        "--proc", "/proc",
        "--dev", "/dev",
        "--tmpfs", "/tmp",
        "--ro-bind", ctx.code_dir.string(), p.code_path,
        "--ro-bind", ctx.data_dir.string(), p.data_path,
        "--bind", ctx.output_dir.string(), p.output_path,
        "--chdir", p.output_path,
    };
    if (::geteuid() == 0 && base.run_as_uid >= 0 && base.run_as_gid >= 0) {
        argv.insert(argv.end(), {"--uid", std::to_string(base.run_as_uid), "--gid", std::to_string(base.run_as_gid)});
    }
    argv.push_back("--");
    for (const auto& a : job_argv(ctx, p.code_path)) argv.push_back(a);

    p.spec.argv = std::move(argv);
    p.spec.cwd = ctx.output_dir.string();
    // bwrap passes its environment through to the job.
    p.spec.env = job_environment(ctx, p.code_path, p.data_path, p.output_path, "/tmp");
    route_logs(ctx, &p.spec);
    return p;
}

// --- docker ---

LaunchPlan DockerIsolationProvider::plan(const ExecutionContext& ctx, const ProcLimits& base) const {
    LaunchPlan p;
    p.limits = base;
    p.limits.no_new_privs = false;
    p.limits.unshare_net = false;
    p.limits.enable_seccomp = false;
    p.limits.run_as_uid = -1;
    p.limits.run_as_gid = -1;

    p.code_path = "/app/code";
    p.data_path = ctx.data_mount_dir.empty() ? "/app/data" : ctx.data_mount_dir;
    p.output_path = "/app/output";

    const std::string container = "warden-" + random_hex(8);
    std::vector<std::string> argv = {
        docker_, "run", "--rm",
        "--name", container,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--network", "none",
        "--tmpfs", "/tmp:size=16m,noexec,nosuid,nodev",
        "--memory", "1G",
        "--cpus", "1",
        "--pids-limit", "100",
        "--ulimit", "nofile=64:64",
        "--ulimit", "fsize=" + std::to_string((unsigned long long)base.rlimit_fsize_mb * 1024ULL * 1024ULL),
        "--user", std::to_string(base.run_as_uid >= 0 ? base.run_as_uid : 65534) + ":" +
                  std::to_string(base.run_as_gid >= 0 ? base.run_as_gid : 65534),
        "-v", ctx.code_dir.string() + ":" + p.code_path + ":ro",
        "-v", ctx.data_dir.string() + ":" + p.data_path + ":ro",
        "-v", ctx.output_dir.string() + ":" + p.output_path + ":rw",
        "--workdir", p.output_path,
    };
    for (const auto& kv : job_environment(ctx, p.code_path, p.data_path, p.output_path, "/tmp")) {
        argv.push_back("-e");
        argv.push_back(kv.first + "=" + kv.second);
    }
    argv.push_back(image_);
    for (const auto& a : job_argv(ctx, p.code_path)) argv.push_back(a);

    p.spec.argv = std::move(argv);
    p.spec.cwd = ctx.output_dir.string();
    // The client needs only enough environment to find the daemon.
    p.spec.env = {{"PATH", kSandboxPath}, {"HOME", ctx.scratch_dir.string()}};
    if (const char* host = std::getenv("DOCKER_HOST")) p.spec.env.emplace_back("DOCKER_HOST", host);
    p.cleanup_argv = {docker_, "rm", "-f", container};
    route_logs(ctx, &p.spec);
    return p;
}

std::unique_ptr<ProcessIsolationProvider> make_isolation_provider(const std::string& name,
                                                                  const std::string& docker_image,
                                                                  bool allow_unconfined,
                                                                  std::vector<std::string> extra_ro_paths) {
    if (name == "local") return std::make_unique<LocalIsolationProvider>(allow_unconfined, std::move(extra_ro_paths));
    if (name == "bwrap") return std::make_unique<BwrapIsolationProvider>();
    if (name == "docker") return std::make_unique<DockerIsolationProvider>(docker_image);
    throw Error(ErrorKind::VALIDATION, "unknown isolation provider '" + name + "'");
}

} // namespace warden
