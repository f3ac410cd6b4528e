#include "warden/service.h"
#include "warden/crypto.h"
#include "warden/errors.h"
#include "warden/fs_util.h"
#include "warden/ids.h"
#include "warden/worker_pool.h"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <set>

namespace warden {

namespace fs = std::filesystem;

static ProcLimits limits_from(const Settings& s) {
    ProcLimits lim;
    lim.timeout_ms = (int64_t)s.exec_timeout_sec * 1000;
    lim.log_max_bytes = s.log_max_bytes;
    lim.enable_seccomp = s.seccomp;
    lim.run_as_uid = s.sandbox_uid;
    lim.run_as_gid = s.sandbox_gid;
    return lim;
}

static std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::vector<std::string> extension_set(const fs::path& dir) {
    std::set<std::string> exts;
    for (const auto& rel : list_files_rel(dir)) {
        exts.insert(lower(fs::path(rel).extension().string()));
    }
    return {exts.begin(), exts.end()};
}

std::string code_digest(const fs::path& dir, const std::vector<std::string>& files) {
    Sha256 h;
    for (const auto& rel : files) {
        std::string bytes;
        std::string err;
        if (!read_file(dir / rel, &bytes, &err)) {
            throw Error(ErrorKind::STORAGE, "digest " + rel + ": " + err);
        }
        h.update(rel);
        h.update(std::string(1, '\0'));
        h.update(std::to_string(bytes.size()));
        h.update(std::string(1, '\0'));
        h.update(bytes);
    }
    return h.finish_hex();
}

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (const auto& s : v) {
        if (!out.empty()) out += ",";
        out += s.empty() ? "(none)" : s;
    }
    return out;
}

static void check_readme(const fs::path& p) {
    if (p.empty()) return;
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        throw Error(ErrorKind::VALIDATION, "readme does not exist: " + p.string());
    }
    if (lower(p.extension().string()) != ".md") {
        throw Error(ErrorKind::VALIDATION, "readme must be a markdown (.md) file: " + p.string());
    }
}

static fs::path absolute_dir(const fs::path& p, const char* what) {
    std::error_code ec;
    if (p.empty() || !fs::is_directory(p, ec)) {
        throw Error(ErrorKind::VALIDATION, std::string(what) + " must be an existing directory: " + p.string());
    }
    fs::path c = fs::canonical(p, ec);
    if (ec) throw Error(ErrorKind::VALIDATION, std::string(what) + ": " + ec.message());
    return c;
}

Datasite::Datasite(const Settings& settings)
    : settings_(settings),
      audit_(settings.root / "audit" / "audit.jsonl", settings.store_fsync),
      datasets_(settings.root / "store", settings.store_fsync, &audit_),
      codes_(settings.root / "store", settings.store_fsync, &audit_),
      jobs_(settings.root / "store", settings.store_fsync, &audit_),
      machine_(&jobs_, &audit_, settings.owner, settings.max_retries, settings.conflict_retries),
      executor_(make_isolation_provider(settings.isolation, settings.docker_image, settings.allow_unconfined,
                                        settings.sandbox_ro_paths),
                limits_from(settings)),
      gate_(&machine_, &jobs_, &audit_, settings.root / "shared", settings.owner,
            10 * 1024 * 1024, settings.store_fsync) {}

void Datasite::require_owner(const Actor& actor, const char* what) const {
    if (actor.role != Role::OWNER || (!settings_.owner.empty() && actor.id != settings_.owner)) {
        throw Error(ErrorKind::AUTHORIZATION, "actor '" + actor.id + "' may not " + what);
    }
}

// --- datasets ---

Dataset Datasite::create_dataset(const Actor& actor, const DatasetSpec& spec) {
    require_owner(actor, "create datasets");
    if (spec.name.empty()) throw Error(ErrorKind::VALIDATION, "dataset name is empty");
    const fs::path priv = absolute_dir(spec.path, "dataset path");
    const fs::path mock = absolute_dir(spec.mock_path, "mock path");
    if (priv == mock) throw Error(ErrorKind::VALIDATION, "dataset path and mock path must differ");

    const auto priv_ext = extension_set(priv);
    const auto mock_ext = extension_set(mock);
    if (priv_ext != mock_ext) {
        throw Error(ErrorKind::VALIDATION, "mock and private data have different file types: private=[" +
                                               join(priv_ext) + "] mock=[" + join(mock_ext) + "]");
    }
    check_readme(spec.description_path);
    if (spec.runtime && spec.runtime->cmd.empty()) {
        throw Error(ErrorKind::VALIDATION, "dataset runtime command is empty");
    }

    Dataset d;
    d.owner = actor.id;
    d.name = spec.name;
    d.private_path = priv.string();
    d.mock_path = mock.string();
    d.summary = spec.summary;
    if (!spec.description_path.empty()) d.readme_path = fs::absolute(spec.description_path).string();
    d.runtime = spec.runtime;
    return datasets_.create(d);
}

Dataset Datasite::get_dataset(const std::string& name_or_id) const {
    // Names are unique per owner; scope the lookup to this site's owner.
    Query q;
    q.filters.push_back(filter_eq("name", name_or_id));
    if (!settings_.owner.empty()) q.filters.push_back(filter_eq("owner", settings_.owner));
    q.limit = 2;
    auto rows = datasets_.query(q);
    if (rows.size() == 1) return rows.front();
    if (rows.size() > 1) {
        throw Error(ErrorKind::VALIDATION, "dataset name '" + name_or_id + "' is ambiguous; use the id");
    }
    if (is_valid_record_id(name_or_id)) return datasets_.read(name_or_id);
    throw Error(ErrorKind::NOT_FOUND, "dataset '" + name_or_id + "' not found");
}

std::vector<Dataset> Datasite::list_datasets(const Query& q) const {
    return datasets_.query(q);
}

bool Datasite::remove_dataset(const Actor& actor, const std::string& name_or_id) {
    require_owner(actor, "delete datasets");
    Dataset d;
    try {
        d = get_dataset(name_or_id);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::NOT_FOUND) return false;
        throw;
    }
    // Only the record goes; the owner's data directories are never touched.
    return datasets_.remove(d.hdr.id);
}

// --- user code ---

UserCode Datasite::submit_user_code(const Actor& actor, const fs::path& code_path,
                                    const std::string& entrypoint, const fs::path& readme_path) {
    if (actor.role == Role::SYSTEM) throw Error(ErrorKind::AUTHORIZATION, "system may not submit code");
    std::error_code ec;
    const auto st = fs::symlink_status(code_path, ec);
    if (ec || !fs::exists(st)) throw Error(ErrorKind::VALIDATION, "code path does not exist: " + code_path.string());
    if (fs::is_symlink(st)) throw Error(ErrorKind::VALIDATION, "code path must not be a symlink: " + code_path.string());
    check_readme(readme_path);

    UserCode uc;
    uc.hdr.id = new_record_id();
    uc.owner = actor.id;
    uc.name = code_path.filename().string();
    if (uc.name.empty()) uc.name = code_path.parent_path().filename().string();
    const fs::path dst = settings_.root / "user_code_files" / uc.hdr.id;

    if (fs::is_regular_file(st)) {
        uc.code_type = CodeType::FILE;
        uc.entrypoint = entrypoint.empty() ? code_path.filename().string() : entrypoint;
        if (uc.entrypoint != code_path.filename().string()) {
            throw Error(ErrorKind::VALIDATION, "entrypoint of a single-file submission must be the file itself");
        }
        if ((int64_t)fs::file_size(code_path, ec) > settings_.max_code_bytes) {
            throw Error(ErrorKind::VALIDATION, "code exceeds " + std::to_string(settings_.max_code_bytes) + " bytes");
        }
        fs::create_directories(dst, ec);
        if (ec) throw Error(ErrorKind::STORAGE, "create " + dst.string() + ": " + ec.message());
        fs::copy_file(code_path, dst / uc.entrypoint, ec);
        if (ec) {
            std::error_code ec2;
            fs::remove_all(dst, ec2);
            throw Error(ErrorKind::STORAGE, "copy code: " + ec.message());
        }
    } else if (fs::is_directory(st)) {
        uc.code_type = CodeType::FOLDER;
        if (entrypoint.empty()) throw Error(ErrorKind::VALIDATION, "entrypoint is required for a code folder");
        uc.entrypoint = entrypoint;
        if (fs::path(entrypoint).is_absolute() || !is_path_under(code_path / entrypoint, code_path) ||
            !fs::is_regular_file(fs::symlink_status(code_path / entrypoint, ec))) {
            throw Error(ErrorKind::VALIDATION, "entrypoint not found in code folder: " + entrypoint);
        }
        if (tree_size_bytes(code_path) > settings_.max_code_bytes) {
            throw Error(ErrorKind::VALIDATION, "code exceeds " + std::to_string(settings_.max_code_bytes) + " bytes");
        }
        std::vector<std::string> skipped;
        std::string err = copy_tree(code_path, dst, &skipped);
        if (err.empty() && !skipped.empty()) err = "code folder contains non-regular file " + skipped.front();
        if (!err.empty()) {
            fs::remove_all(dst, ec);
            throw Error(ErrorKind::VALIDATION, "copy code: " + err);
        }
    } else {
        throw Error(ErrorKind::VALIDATION, "code path is neither a file nor a folder: " + code_path.string());
    }

    try {
        uc.code_dir = dst.string();
        uc.files = list_files_rel(dst);
        uc.digest = code_digest(dst, uc.files);
        if (!readme_path.empty()) uc.readme_path = fs::absolute(readme_path).string();
        return codes_.create(uc);
    } catch (const Error&) {
        fs::remove_all(dst, ec);
        throw;
    }
}

UserCode Datasite::get_user_code(const std::string& id) const {
    return codes_.read(id);
}

// --- jobs ---

Job Datasite::submit_job(const Actor& actor, const JobSpec& spec) {
    if (actor.role == Role::SYSTEM) throw Error(ErrorKind::AUTHORIZATION, "system may not submit jobs");
    const Dataset ds = get_dataset(spec.dataset_name);
    if (!spec.name.empty() && jobs_.find_one({filter_eq("name", spec.name)})) {
        throw Error(ErrorKind::ALREADY_EXISTS, "job name '" + spec.name + "' is taken");
    }
    UserCode uc = submit_user_code(actor, spec.code_path, spec.entrypoint, spec.readme_path);

    Job j;
    j.name = spec.name.empty() ? new_job_name() : spec.name;
    j.description = spec.description;
    j.tags = spec.tags;
    j.dataset_id = ds.hdr.id;
    j.dataset_name = ds.name;
    j.user_code_id = uc.hdr.id;
    j.requester = actor.id;
    j.status = JobStatus::CODE_REVIEW;
    try {
        return jobs_.create(j);
    } catch (const Error&) {
        // The job never existed; its code must not linger.
        codes_.remove(uc.hdr.id);
        std::error_code ec;
        fs::remove_all(uc.code_dir, ec);
        throw;
    }
}

Job Datasite::get_job(const std::string& id_or_name) const {
    if (is_valid_record_id(id_or_name)) {
        try {
            return jobs_.read(id_or_name);
        } catch (const Error& e) {
            if (e.kind() != ErrorKind::NOT_FOUND) throw;
        }
    }
    if (auto j = jobs_.find_one({filter_eq("name", id_or_name)})) return *j;
    throw Error(ErrorKind::NOT_FOUND, "job '" + id_or_name + "' not found");
}

std::vector<Job> Datasite::list_jobs(const JobListOptions& opts) const {
    Query q;
    if (opts.status) q.filters.push_back(filter_eq("status", job_status_name(*opts.status)));
    q.order_by = opts.order_by;
    q.sort_order = opts.sort_order;
    q.limit = opts.limit;
    return jobs_.query(q);
}

std::vector<Job> Datasite::search_jobs(const std::string& term) const {
    return jobs_.search(term, {"name", "description", "dataset_name", "requester"});
}

Job Datasite::approve(const Actor& actor, const std::string& job) {
    return machine_.transition(get_job(job), JobStatus::QUEUED, actor);
}

Job Datasite::reject(const Actor& actor, const std::string& job, const std::string& reason) {
    TransitionInput in;
    in.message = reason;
    return machine_.transition(get_job(job), JobStatus::REJECTED, actor, in);
}

Job Datasite::retry(const Actor& actor, const std::string& job) {
    return machine_.transition(get_job(job), JobStatus::QUEUED, actor);
}

Job Datasite::close(const Actor& actor, const std::string& job) {
    return machine_.close(get_job(job), actor);
}

Job Datasite::reject_output(const Actor& actor, const std::string& job, const std::string& reason) {
    TransitionInput in;
    in.message = reason;
    return machine_.transition(get_job(job), JobStatus::FAILED, actor, in);
}

std::vector<std::pair<std::string, std::string>> Datasite::secrets() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& name : settings_.secret_names) {
        if (const char* v = std::getenv(name.c_str())) out.emplace_back(name, v);
    }
    return out;
}

ExecutionRequest Datasite::build_request(const Job& job, bool mock) const {
    const Dataset ds = datasets_.read(job.dataset_id);
    const UserCode uc = codes_.read(job.user_code_id);
    ExecutionRequest req;
    req.code_dir = uc.code_dir;
    req.entrypoint = uc.entrypoint;
    req.data_dir = mock ? ds.mock_path : ds.private_path;
    req.private_data = !mock;
    req.runtime_cmd = ds.runtime ? ds.runtime->cmd : settings_.runtime_cmd;
    if (ds.runtime) req.data_mount_dir = ds.runtime->mount_dir;
    req.secrets = secrets();
    req.timeout_sec = settings_.exec_timeout_sec;
    return req;
}

Job Datasite::run(const Actor& actor, const std::string& job) {
    const Job cur = get_job(job);
    TransitionInput in;
    in.results_dir = (settings_.root / "results" / cur.hdr.id).string();
    // A provider that refuses private data leaves the job Queued.
    executor_.provider().check_admissible(true);
    const Job running = machine_.transition(cur, JobStatus::RUNNING, actor, in);
    return execute_running(running);
}

Job Datasite::execute_running(const Job& running) {
    ExecutionReport rep;
    try {
        ExecutionRequest req = build_request(running, false);
        req.results_dir = running.results_dir;
        rep = executor_.execute(req);
    } catch (const std::exception& e) {
        TransitionInput f;
        f.failure = FailureKind::EXECUTION_FAILURE;
        f.message = std::string("execution setup failed: ") + e.what();
        try {
            machine_.transition(jobs_.read(running.hdr.id), JobStatus::FAILED, Actor::system(), f);
        } catch (const Error& te) {
            std::cerr << "[warden] job " << running.name << ": could not record setup failure: " << te.what() << "\n";
        }
        throw;
    }

    json_object* p = json_object_new_object();
    json_object_object_add(p, "job_id", json_object_new_string(running.hdr.id.c_str()));
    json_object_object_add(p, "status", json_object_new_string(execution_status_name(rep.status)));
    json_object_object_add(p, "exit_code", json_object_new_int(rep.exit_code));
    json_object_object_add(p, "elapsed_ms", json_object_new_int64(rep.elapsed_ms));
    json_object_object_add(p, "isolation", json_object_new_string(executor_.provider().name()));
    std::string err = audit_.event("job.execute", "system/system", p);
    if (!err.empty()) std::cerr << "[warden] " << err << "\n";

    TransitionInput t;
    t.exit_code = rep.exit_code;
    if (rep.ok()) {
        return machine_.transition(running, JobStatus::PENDING_OUTPUT_REVIEW, Actor::system(), t);
    }
    t.failure = rep.status == ExecutionStatus::TIMEOUT ? FailureKind::EXECUTION_TIMEOUT : FailureKind::EXECUTION_FAILURE;
    t.message = rep.message;
    return machine_.transition(running, JobStatus::FAILED, Actor::system(), t);
}

JobResults Datasite::review_results(const Actor& actor, const std::string& job) const {
    return gate_.review_results(get_job(job), actor);
}

Job Datasite::share_results(const Actor& actor, const std::string& job) {
    return gate_.share_results(get_job(job), actor);
}

JobResults Datasite::get_results(const Actor& actor, const std::string& job) const {
    return gate_.get_results(get_job(job), actor);
}

ExecutionReport Datasite::run_mock(const Actor& actor, const std::string& job, const fs::path& scratch_dir) {
    const Job j = get_job(job);
    const bool is_owner = actor.role == Role::OWNER && (settings_.owner.empty() || actor.id == settings_.owner);
    if (!is_owner && !(actor.role == Role::REQUESTER && actor.id == j.requester)) {
        throw Error(ErrorKind::AUTHORIZATION, "actor '" + actor.id + "' may not run job " + j.name);
    }
    ExecutionRequest req = build_request(j, true);
    req.results_dir = scratch_dir.empty() ? settings_.root / "mock_runs" / j.hdr.id : scratch_dir;
    ExecutionReport rep = executor_.execute(req);
    throw_if_failed(rep);
    return rep;
}

size_t Datasite::serve(const Actor& actor, int workers) {
    require_owner(actor, "run jobs");
    JobListOptions opts;
    opts.status = JobStatus::QUEUED;
    opts.sort_order = SortOrder::ASC;
    const auto queued = list_jobs(opts);

    WorkerPool pool(workers, [this, &actor](const std::string& id) {
        Job done = run(actor, id);
        std::cerr << "[warden] job " << done.name << " -> " << job_status_name(done.status) << "\n";
    });
    for (const auto& j : queued) {
        if (!pool.submit(j.hdr.id, j.retry_count)) {
            throw Error(ErrorKind::STORAGE, "worker pool refused job " + j.name);
        }
    }
    pool.drain();
    pool.shutdown();
    if (pool.failed() > 0) {
        std::cerr << "[warden] serve: " << pool.failed() << " of " << queued.size() << " jobs raised errors\n";
    }
    return queued.size();
}

} // namespace warden
