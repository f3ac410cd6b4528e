#include "warden/executor.h"
#include "warden/crypto.h"
#include "warden/errors.h"
#include "warden/fs_util.h"
#include "warden/serialization.h"

#include <algorithm>
#include <fstream>
#include <iostream>

#include <unistd.h>

namespace warden {

namespace fs = std::filesystem;

static constexpr size_t kStderrTailBytes = 2048;

const char* execution_status_name(ExecutionStatus s) {
    switch (s) {
        case ExecutionStatus::SUCCESS: return "success";
        case ExecutionStatus::FAILURE: return "failure";
        case ExecutionStatus::TIMEOUT: return "timeout";
    }
    return "failure";
}

std::string tree_fingerprint(const fs::path& dir) {
    std::vector<std::string> lines;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code sec;
        const auto st = it->symlink_status(sec);
        std::string line = fs::relative(it->path(), dir, sec).generic_string();
        line += '\t' + std::to_string((int)st.type());
        if (fs::is_regular_file(st)) {
            line += '\t' + std::to_string((unsigned long long)it->file_size(sec));
            auto mt = fs::last_write_time(it->path(), sec);
            line += '\t' + std::to_string((long long)mt.time_since_epoch().count());
        } else if (fs::is_symlink(st)) {
            line += '\t' + fs::read_symlink(it->path(), sec).string();
        }
        lines.push_back(std::move(line));
    }
    std::sort(lines.begin(), lines.end());
    Sha256 h;
    for (const auto& l : lines) {
        h.update(l);
        h.update("\n");
    }
    return h.finish_hex();
}

static std::string read_tail(const fs::path& p, size_t max_bytes) {
    std::ifstream f(p, std::ios::binary | std::ios::ate);
    if (!f) return "";
    const std::streamoff size = f.tellg();
    const std::streamoff start = size > (std::streamoff)max_bytes ? size - (std::streamoff)max_bytes : 0;
    f.seekg(start);
    std::string out((size_t)(size - start), '\0');
    f.read(out.data(), (std::streamsize)out.size());
    out.resize((size_t)f.gcount());
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    return out;
}

static void reset_dir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) throw Error(ErrorKind::STORAGE, "clear " + dir.string() + ": " + ec.message());
    fs::create_directories(dir, ec);
    if (ec) throw Error(ErrorKind::STORAGE, "create " + dir.string() + ": " + ec.message());
}

static void write_run_meta(const fs::path& results_dir, const ExecutionReport& r) {
    JsonPtr o(json_object_new_object());
    json_object_object_add(o.get(), "status", json_object_new_string(execution_status_name(r.status)));
    json_object_object_add(o.get(), "exit_code", json_object_new_int(r.exit_code));
    json_object_object_add(o.get(), "elapsed_ms", json_object_new_int64(r.elapsed_ms));
    json_object_object_add(o.get(), "group_terminated", json_object_new_boolean(r.group_terminated));
    json_object_object_add(o.get(), "stdout_truncated", json_object_new_boolean(r.stdout_truncated));
    json_object_object_add(o.get(), "stderr_truncated", json_object_new_boolean(r.stderr_truncated));
    json_object_object_add(o.get(), "message", json_object_new_string(r.message.c_str()));
    json_object_object_add(o.get(), "artifacts", json_new_string_array(r.artifacts));
    std::string err = write_file_atomic(results_dir / "run.json", json_to_string_pretty(o.get()), false);
    if (!err.empty()) std::cerr << "[warden] run.json: " << err << "\n";
}

Executor::Executor(std::unique_ptr<ProcessIsolationProvider> provider, ProcLimits base)
    : provider_(std::move(provider)), base_(base) {
    if (!provider_) throw Error(ErrorKind::VALIDATION, "executor requires an isolation provider");
}

ExecutionReport Executor::execute(const ExecutionRequest& req) const {
    std::error_code ec;
    if (!fs::is_directory(req.code_dir, ec)) {
        throw Error(ErrorKind::VALIDATION, "code directory does not exist: " + req.code_dir.string());
    }
    if (!fs::is_directory(req.data_dir, ec)) {
        throw Error(ErrorKind::VALIDATION, "dataset directory does not exist: " + req.data_dir.string());
    }
    if (req.entrypoint.empty() || fs::path(req.entrypoint).is_absolute() ||
        !is_path_under(req.code_dir / req.entrypoint, req.code_dir) ||
        !fs::is_regular_file(req.code_dir / req.entrypoint, ec)) {
        throw Error(ErrorKind::VALIDATION, "entrypoint not found in code directory: " + req.entrypoint);
    }
    if (req.runtime_cmd.empty()) throw Error(ErrorKind::VALIDATION, "empty runtime command");
    if (req.timeout_sec <= 0) throw Error(ErrorKind::VALIDATION, "timeout must be positive");
    if (req.results_dir.empty()) throw Error(ErrorKind::VALIDATION, "results directory not set");
    provider_->check_admissible(req.private_data);

    ExecutionReport rep;
    rep.output_dir = req.results_dir / "output";
    rep.logs_dir = req.results_dir / "logs";
    const fs::path scratch = req.results_dir / ".scratch";
    reset_dir(rep.output_dir);
    reset_dir(rep.logs_dir);
    reset_dir(scratch);

    ProcLimits lim = base_;
    lim.timeout_ms = req.timeout_sec * 1000;

    // The sandbox identity must be able to write its output.
    if (::geteuid() == 0 && lim.run_as_uid >= 0 && lim.run_as_gid >= 0) {
        for (const auto& d : {rep.output_dir, scratch}) {
            if (::chown(d.c_str(), (uid_t)lim.run_as_uid, (gid_t)lim.run_as_gid) != 0) {
                throw Error(ErrorKind::STORAGE, "chown " + d.string() + " failed");
            }
        }
    }

    ExecutionContext ctx;
    ctx.code_dir = fs::absolute(req.code_dir);
    ctx.data_dir = fs::absolute(req.data_dir);
    ctx.output_dir = fs::absolute(rep.output_dir);
    ctx.scratch_dir = fs::absolute(scratch);
    ctx.logs_dir = fs::absolute(rep.logs_dir);
    ctx.entrypoint = req.entrypoint;
    ctx.runtime_cmd = req.runtime_cmd;
    ctx.data_mount_dir = req.data_mount_dir;
    ctx.secrets = req.secrets;
    ctx.timeout_sec = req.timeout_sec;
    ctx.private_data = req.private_data;

    LaunchPlan plan = provider_->plan(ctx, lim);

    const std::string data_before = tree_fingerprint(ctx.data_dir);
    const std::string code_before = tree_fingerprint(ctx.code_dir);

    ProcResult pr;
    const bool started = proc_run_logged(plan.spec, plan.limits, &pr);

    if (pr.timed_out && !plan.cleanup_argv.empty()) {
        ProcSpec cleanup;
        cleanup.argv = plan.cleanup_argv;
        cleanup.env = plan.spec.env;
        cleanup.stdout_path = "/dev/null";
        cleanup.stderr_path = "/dev/null";
        ProcLimits cl;
        cl.timeout_ms = 30000;
        cl.unshare_net = false;
        ProcResult cr;
        if (!proc_run_logged(cleanup, cl, &cr) || cr.exit_code != 0) {
            std::cerr << "[warden] cleanup after timeout failed: " << cr.error << "\n";
        }
    }

    rep.exit_code = pr.exit_code;
    rep.group_terminated = pr.group_terminated;
    rep.stdout_truncated = pr.stdout_truncated;
    rep.stderr_truncated = pr.stderr_truncated;
    rep.elapsed_ms = pr.elapsed_ms;

    if (!started) {
        rep.status = ExecutionStatus::FAILURE;
        rep.message = "failed to start: " + pr.error;
    } else if (pr.timed_out) {
        rep.status = ExecutionStatus::TIMEOUT;
        rep.message = "timed out after " + std::to_string(req.timeout_sec) + "s" +
                      (pr.group_terminated ? "; process group terminated" : "; process group still alive");
    } else if (pr.exit_code != 0) {
        rep.status = ExecutionStatus::FAILURE;
        rep.message = "exit code " + std::to_string(pr.exit_code);
        std::string tail = read_tail(rep.logs_dir / "stderr.log", kStderrTailBytes);
        if (!tail.empty()) rep.message += ": " + tail;
    } else {
        rep.status = ExecutionStatus::SUCCESS;
    }

    if (tree_fingerprint(ctx.data_dir) != data_before) {
        rep.status = ExecutionStatus::FAILURE;
        rep.message = "dataset mutated during execution" + (rep.message.empty() ? "" : "; " + rep.message);
    } else if (tree_fingerprint(ctx.code_dir) != code_before) {
        rep.status = ExecutionStatus::FAILURE;
        rep.message = "code mutated during execution" + (rep.message.empty() ? "" : "; " + rep.message);
    }

    fs::remove_all(scratch, ec);
    rep.artifacts = list_files_rel(rep.output_dir);
    write_run_meta(req.results_dir, rep);
    return rep;
}

void throw_if_failed(const ExecutionReport& r) {
    switch (r.status) {
    case ExecutionStatus::SUCCESS:
        return;
    case ExecutionStatus::TIMEOUT:
        throw Error(ErrorKind::EXECUTION_TIMEOUT, r.message);
    case ExecutionStatus::FAILURE:
        throw Error(ErrorKind::EXECUTION_FAILURE, r.message);
    }
}

} // namespace warden
