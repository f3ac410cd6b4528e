#include "test_common.h"

#include "warden/confine.h"
#include "warden/executor.h"
#include "warden/isolation.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

using namespace warden;
namespace fs = std::filesystem;

static bool has_seq(const std::vector<std::string>& v, const std::vector<std::string>& seq) {
    return std::search(v.begin(), v.end(), seq.begin(), seq.end()) != v.end();
}

static bool has_env(const std::vector<std::pair<std::string, std::string>>& env,
                    const std::string& k, const std::string& v) {
    for (const auto& kv : env) {
        if (kv.first == k) return kv.second == v;
    }
    return false;
}

int main() {
    const fs::path root = fresh_dir("warden_test_executor");
    const fs::path code = root / "code";
    const fs::path data = root / "data";
    write_text(data / "wine.csv", "cultivar,alcohol\nA,13.2\nB,12.1\n");

    ProcLimits base;
    base.kill_grace_ms = 500;
    base.run_as_uid = -1;
    base.run_as_gid = -1;
    Executor ex(std::make_unique<LocalIsolationProvider>(true), base);
    expect_eq_str(ex.provider().name(), "local", "provider name");

    // Paths as the job sees them.
    const bool confined = confinement_available();
    if (!confined) std::cerr << "test_executor: running unconfined: " << confinement_status() << "\n";
    const std::string code_in = confined ? "/sandbox/code" : code.string();
    const std::string data_in = confined ? "/sandbox/data" : data.string();

    auto request = [&](const std::string& entry, const std::string& results) {
        ExecutionRequest r;
        r.code_dir = code;
        r.entrypoint = entry;
        r.data_dir = data;
        r.results_dir = root / results;
        r.runtime_cmd = {"/bin/sh"};
        r.timeout_sec = 10;
        return r;
    };

    // Success: artifacts under output/, logs captured, injected environment.
    {
        write_text(code / "ok.sh",
                   "echo \"running $INPUT_FILE\"\n"
                   "cut -d, -f1 \"$DATA_DIR/wine.csv\" | tail -n +2 | tr -d '\\n' > \"$OUTPUT_DIR/output.txt\"\n"
                   "echo \"$CODE_DIR|$TIMEOUT\" > env.txt\n"
                   "echo \"$API_TOKEN|$DATA_DIR\" > secrets.txt\n"
                   "echo done >&2\n");
        ExecutionRequest req = request("ok.sh", "r_ok");
        req.secrets = {{"API_TOKEN", "s3cret"}, {"DATA_DIR", "/evil"}};
        ExecutionReport rep = ex.execute(req);
        expect_true(rep.ok(), "success run: " + rep.message);
        expect_eq_ll(rep.exit_code, 0, "exit 0");
        expect_eq_str(read_text(rep.output_dir / "output.txt"), "AB", "output computed from data");
        expect_eq_str(read_text(rep.output_dir / "env.txt"), code_in + "|10\n", "CODE_DIR and TIMEOUT set");
        expect_eq_str(read_text(rep.output_dir / "secrets.txt"), "s3cret|" + data_in + "\n",
                      "secrets injected but never shadow reserved variables");
        expect_eq_str(read_text(rep.logs_dir / "stdout.log"), "running " + code_in + "/ok.sh\n",
                      "stdout log with INPUT_FILE");
        expect_eq_str(read_text(rep.logs_dir / "stderr.log"), "done\n", "stderr log");
        expect_true(rep.artifacts == std::vector<std::string>({"env.txt", "output.txt", "secrets.txt"}),
                    "artifacts listed (cwd is the output dir)");
        expect_true(fs::exists(root / "r_ok" / "run.json"), "run.json written");
        expect_true(!fs::exists(root / "r_ok" / ".scratch"), "scratch removed");
        throw_if_failed(rep);
    }

    // A rerun starts from a fresh output directory.
    {
        write_text(code / "noop.sh", "true\n");
        ExecutionReport rep = ex.execute(request("noop.sh", "r_ok"));
        expect_true(rep.ok(), "noop ok");
        expect_true(rep.artifacts.empty(), "previous artifacts cleared");
    }

    // Nonzero exit: failure with code and stderr tail.
    {
        write_text(code / "fail.sh", "echo partial > \"$OUTPUT_DIR/p.txt\"\necho 'boom: bad column' >&2\nexit 2\n");
        ExecutionReport rep = ex.execute(request("fail.sh", "r_fail"));
        expect_true(rep.status == ExecutionStatus::FAILURE, "failure status");
        expect_eq_ll(rep.exit_code, 2, "exit code kept");
        expect_true(rep.message.find("exit code 2") != std::string::npos, "message has exit code: " + rep.message);
        expect_true(rep.message.find("boom: bad column") != std::string::npos, "message has stderr tail");
        expect_throws_kind(ErrorKind::EXECUTION_FAILURE, [&] { throw_if_failed(rep); }, "failure maps to ExecutionFailure");
    }

    // Timeout: reported distinctly with the group confirmed gone.
    {
        write_text(code / "slow.sh", "exec sleep 30\n");
        ExecutionRequest req = request("slow.sh", "r_slow");
        req.timeout_sec = 1;
        ExecutionReport rep = ex.execute(req);
        expect_true(rep.status == ExecutionStatus::TIMEOUT, "timeout status");
        expect_true(rep.group_terminated, "process group terminated");
        expect_true(rep.elapsed_ms < 1000 + 500 + 3000, "within timeout + grace: " + std::to_string(rep.elapsed_ms));
        expect_true(rep.message.find("timed out after 1s") != std::string::npos, "timeout message: " + rep.message);
        expect_throws_kind(ErrorKind::EXECUTION_TIMEOUT, [&] { throw_if_failed(rep); }, "timeout maps to ExecutionTimeout");
    }

    // Code and data are read-only to the job; writes either fail in the
    // sandbox or are caught by the fingerprint check.
    {
        write_text(code / "mutate.sh", "echo x > \"$DATA_DIR/injected.csv\"\n");
        ExecutionReport rep = ex.execute(request("mutate.sh", "r_mut"));
        expect_true(rep.status == ExecutionStatus::FAILURE, "dataset write fails the run");
        if (confined) {
            expect_true(!fs::exists(data / "injected.csv"), "read-only data bind");
        } else {
            expect_true(rep.message.find("dataset mutated") != std::string::npos, "mutation message: " + rep.message);
            fs::remove(data / "injected.csv");
        }

        write_text(code / "selfmod.sh", "echo x > \"$CODE_DIR/extra.py\"\n");
        rep = ex.execute(request("selfmod.sh", "r_mut2"));
        expect_true(rep.status == ExecutionStatus::FAILURE, "code write fails the run");
        if (confined) {
            expect_true(!fs::exists(code / "extra.py"), "read-only code bind");
        } else {
            expect_true(rep.message.find("code mutated") != std::string::npos, "code mutation message");
            fs::remove(code / "extra.py");
        }
    }

    // A job can neither delete private data nor copy host files into its output.
    {
        const fs::path secret = root / "host_secret.txt";
        write_text(secret, "host only");
        write_text(code / "escape.sh",
                   "rm -f \"$DATA_DIR/wine.csv\"\n"
                   "cp \"" + secret.string() + "\" \"$OUTPUT_DIR/leak.txt\"\n"
                   "true\n");
        if (confined) {
            Executor strict(std::make_unique<LocalIsolationProvider>(), base);
            ExecutionReport rep = strict.execute(request("escape.sh", "r_escape"));
            expect_true(rep.ok(), "escape attempt run completes: " + rep.message);
            expect_true(fs::exists(data / "wine.csv"), "private data survives rm");
            expect_true(!fs::exists(rep.output_dir / "leak.txt"), "host file not reachable from the job");
        } else {
            Executor strict(std::make_unique<LocalIsolationProvider>(), base);
            expect_throws_kind(ErrorKind::VALIDATION, [&] { strict.execute(request("escape.sh", "r_escape")); },
                               "unconfined private run refused");
            expect_true(!fs::exists(root / "r_escape" / "output"), "refused before any setup");
            expect_true(fs::exists(data / "wine.csv"), "private data untouched");

            // Mock data carries no private information.
            const fs::path mock = root / "mock";
            write_text(mock / "wine.csv", "cultivar,alcohol\nX,1.0\n");
            ExecutionRequest mreq = request("noop.sh", "r_mockonly");
            mreq.data_dir = mock;
            mreq.private_data = false;
            expect_true(strict.execute(mreq).ok(), "mock run allowed without confinement");
        }
    }

    // Log capture is capped.
    {
        ProcLimits small = base;
        small.log_max_bytes = 512;
        Executor capped(std::make_unique<LocalIsolationProvider>(true), small);
        write_text(code / "noisy.sh", "head -c 20000 /dev/zero | tr '\\0' 'a'\n");
        ExecutionReport rep = capped.execute(request("noisy.sh", "r_noisy"));
        expect_true(rep.ok(), "noisy run ok");
        expect_true(rep.stdout_truncated, "stdout truncated");
        expect_eq_ll((long long)fs::file_size(rep.logs_dir / "stdout.log"), 512, "stdout log capped");
    }

    // Setup errors throw before anything runs.
    {
        expect_throws_kind(ErrorKind::VALIDATION, [&] { ex.execute(request("missing.sh", "r_x")); }, "missing entrypoint");
        expect_throws_kind(ErrorKind::VALIDATION, [&] { ex.execute(request("../data/wine.csv", "r_x")); },
                           "entrypoint escaping the code dir");
        ExecutionRequest nodata = request("ok.sh", "r_x");
        nodata.data_dir = root / "nope";
        expect_throws_kind(ErrorKind::VALIDATION, [&] { ex.execute(nodata); }, "missing data dir");
        ExecutionRequest noruntime = request("ok.sh", "r_x");
        noruntime.runtime_cmd.clear();
        expect_throws_kind(ErrorKind::VALIDATION, [&] { ex.execute(noruntime); }, "empty runtime");
        expect_throws_kind(ErrorKind::VALIDATION, [] { Executor bad(nullptr, ProcLimits{}); }, "executor needs a provider");
    }

    // A runtime that cannot start is a failure, not an exception.
    {
        ExecutionRequest req = request("ok.sh", "r_nostart");
        req.runtime_cmd = {"no-such-interpreter-warden"};
        ExecutionReport rep = ex.execute(req);
        expect_true(rep.status == ExecutionStatus::FAILURE, "unstartable runtime fails");
        expect_true(rep.message.find("failed to start") != std::string::npos, "start failure message");
    }

    // Container providers: launch plans only.
    {
        ExecutionContext ctx;
        ctx.code_dir = code;
        ctx.data_dir = data;
        ctx.output_dir = root / "plan" / "output";
        ctx.scratch_dir = root / "plan" / ".scratch";
        ctx.logs_dir = root / "plan" / "logs";
        ctx.entrypoint = "ok.sh";
        ctx.runtime_cmd = {"python3"};
        ctx.timeout_sec = 5;

        BwrapIsolationProvider bw;
        LaunchPlan p = bw.plan(ctx, base);
        expect_eq_str(p.spec.argv[0], "bwrap", "bwrap binary");
        expect_true(has_seq(p.spec.argv, {"--unshare-all"}), "bwrap unshares everything");
        expect_true(has_seq(p.spec.argv, {"--die-with-parent"}), "bwrap dies with parent");
        expect_true(has_seq(p.spec.argv, {"--ro-bind", code.string(), "/sandbox/code"}), "code bound read-only");
        expect_true(has_seq(p.spec.argv, {"--ro-bind", data.string(), "/sandbox/data"}), "data bound read-only");
        expect_true(has_seq(p.spec.argv, {"--bind", ctx.output_dir.string(), "/sandbox/output"}), "output bound rw");
        expect_eq_str(p.spec.argv.back(), "/sandbox/code/ok.sh", "entrypoint inside the sandbox");
        expect_true(has_env(p.spec.env, "DATA_DIR", "/sandbox/data"), "DATA_DIR in sandbox terms");
        expect_true(has_env(p.spec.env, "OUTPUT_DIR", "/sandbox/output"), "OUTPUT_DIR in sandbox terms");
        expect_true(has_env(p.spec.env, "TIMEOUT", "5"), "TIMEOUT injected");

        ExecutionContext mounted = ctx;
        mounted.data_mount_dir = "/mnt/wine";
        p = bw.plan(mounted, base);
        expect_true(has_env(p.spec.env, "DATA_DIR", "/mnt/wine"), "runtime mount dir honoured");

        DockerIsolationProvider dk("python:3.12-slim");
        p = dk.plan(ctx, base);
        expect_eq_str(p.spec.argv[0], "docker", "docker binary");
        expect_true(has_seq(p.spec.argv, {"--network", "none"}), "docker without network");
        expect_true(has_seq(p.spec.argv, {"--cap-drop", "ALL"}), "docker drops capabilities");
        expect_true(has_seq(p.spec.argv, {"-v", code.string() + ":/app/code:ro"}), "code volume read-only");
        expect_true(has_seq(p.spec.argv, {"-v", data.string() + ":/app/data:ro"}), "data volume read-only");
        expect_true(has_seq(p.spec.argv, {"-v", ctx.output_dir.string() + ":/app/output:rw"}), "output volume rw");
        expect_true(has_seq(p.spec.argv, {"-e", "DATA_DIR=/app/data"}), "env passed to container");
        expect_eq_ll((long long)p.cleanup_argv.size(), 4, "container cleanup on timeout");
        expect_eq_str(p.cleanup_argv[1], "rm", "cleanup removes the container");

        LocalIsolationProvider local(true, {"/opt/models"});
        p = local.plan(ctx, base);
        expect_eq_str(p.spec.cwd, p.output_path, "local cwd is the output dir");
        if (confined) {
            expect_true(p.spec.confine.enabled(), "local plan confined");
            expect_eq_str(p.code_path, "/sandbox/code", "code inside the namespace");
            bool code_ro = false, data_ro = false, output_rw = false, extra_ro = false;
            for (const auto& b : p.spec.confine.binds) {
                if (b.target == "/sandbox/code") code_ro = !b.writable && b.source == code;
                if (b.target == "/sandbox/data") data_ro = !b.writable && b.source == data;
                if (b.target == "/sandbox/output") output_rw = b.writable;
                if (b.target == "/opt/models") extra_ro = !b.writable;
            }
            expect_true(code_ro && data_ro && output_rw && extra_ro, "bind modes");
            expect_true(has_env(p.spec.env, "HOME", "/tmp"), "private HOME");
        } else {
            expect_true(!p.spec.confine.enabled(), "unconfined plan");
            expect_eq_str(p.code_path, code.string(), "host code path");
        }

        expect_throws_kind(ErrorKind::VALIDATION, [] { make_isolation_provider("vm", "img"); }, "unknown provider");
        expect_eq_str(make_isolation_provider("docker", "img")->name(), "docker", "docker by name");
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_executor: ALL PASSED" << std::endl;
    return 0;
}
