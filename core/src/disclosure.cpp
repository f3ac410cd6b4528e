#include "warden/disclosure.h"
#include "warden/audit_log.h"
#include "warden/crypto.h"
#include "warden/errors.h"
#include "warden/fs_util.h"

#include <iostream>

namespace warden {

namespace fs = std::filesystem;

DisclosureGate::DisclosureGate(JobStateMachine* machine, RecordStore<Job>* jobs, AuditLog* audit,
                               fs::path shared_root, std::string owner_id,
                               int64_t max_file_bytes, bool fsync)
    : machine_(machine),
      jobs_(jobs),
      audit_(audit),
      shared_root_(std::move(shared_root)),
      owner_id_(std::move(owner_id)),
      max_file_bytes_(max_file_bytes),
      fsync_(fsync) {}

void DisclosureGate::require_owner(const Actor& actor) const {
    if (actor.role != Role::OWNER || (!owner_id_.empty() && actor.id != owner_id_)) {
        throw Error(ErrorKind::AUTHORIZATION, "actor '" + actor.id + "' may not review or share results");
    }
}

JobResults DisclosureGate::load(const Job& job, const fs::path& dir) const {
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) {
        throw Error(ErrorKind::DISCLOSURE, "job " + job.name + " has no results");
    }
    JobResults r;
    r.job = job;
    r.results_dir = dir;

    const fs::path out = dir / "output";
    for (const auto& rel : list_files_rel(out)) {
        std::string bytes;
        bool cut = false;
        if (!read_file_capped(out / rel, (size_t)max_file_bytes_, &bytes, &cut)) {
            throw Error(ErrorKind::STORAGE, "cannot read result file " + rel);
        }
        if (cut) r.truncated.push_back(rel);
        r.outputs.emplace(rel, std::move(bytes));
    }
    bool cut = false;
    read_file_capped(dir / "logs" / "stdout.log", (size_t)max_file_bytes_, &r.stdout_text, &cut);
    read_file_capped(dir / "logs" / "stderr.log", (size_t)max_file_bytes_, &r.stderr_text, &cut);
    return r;
}

JobResults DisclosureGate::review_results(const Job& job, const Actor& actor) const {
    require_owner(actor);
    Job cur = jobs_->read(job.hdr.id);
    if (cur.status != JobStatus::PENDING_OUTPUT_REVIEW && cur.status != JobStatus::FAILED &&
        cur.status != JobStatus::OUTPUT_SHARED) {
        throw Error(ErrorKind::DISCLOSURE,
                    "job " + cur.name + " has no results to review (status " + job_status_name(cur.status) + ")");
    }
    return load(cur, cur.results_dir);
}

Job DisclosureGate::share_results(const Job& job, const Actor& actor) {
    require_owner(actor);
    Job cur = jobs_->read(job.hdr.id);
    if (cur.status == JobStatus::OUTPUT_SHARED) return cur;

    std::error_code ec;
    fs::create_directories(shared_root_, ec);
    if (ec) throw Error(ErrorKind::STORAGE, "create " + shared_root_.string() + ": " + ec.message());

    // One share per job at a time, across threads and processes.
    FileLock share_lock(shared_root_ / ("." + cur.hdr.id + ".lock"));
    if (!share_lock.held()) throw Error(ErrorKind::STORAGE, "share lock: " + share_lock.error());
    cur = jobs_->read(job.hdr.id);
    if (cur.status == JobStatus::OUTPUT_SHARED) return cur;

    const fs::path final_dir = shared_root_ / cur.hdr.id;
    TransitionInput in;
    in.output_path = final_dir.string();
    machine_->validate(cur, JobStatus::OUTPUT_SHARED, actor, in);

    if (cur.results_dir.empty() || !fs::is_directory(cur.results_dir, ec)) {
        throw Error(ErrorKind::DISCLOSURE, "job " + cur.name + " has no results to share");
    }

    // Stage next to the final location, then publish with one rename.
    const fs::path staging = shared_root_ / (".staging-" + cur.hdr.id + "-" + random_hex(4));
    std::vector<std::string> skipped;
    std::string err = copy_tree(fs::path(cur.results_dir) / "output", staging / "output", &skipped);
    if (err.empty()) err = copy_tree(fs::path(cur.results_dir) / "logs", staging / "logs", &skipped);
    if (!err.empty()) {
        fs::remove_all(staging, ec);
        throw Error(ErrorKind::STORAGE, "stage shared results: " + err);
    }
    for (const auto& s : skipped) {
        std::cerr << "[warden] share " << cur.name << ": skipped non-regular file " << s << "\n";
    }

    // The job is not shared, so anything at final_dir is a leftover of an
    // interrupted share.
    fs::remove_all(final_dir, ec);
    fs::rename(staging, final_dir, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove_all(staging, ec2);
        throw Error(ErrorKind::STORAGE, "publish shared results: " + ec.message());
    }
    if (fsync_) fsync_dir(shared_root_);

    Job shared;
    try {
        shared = machine_->transition(cur, JobStatus::OUTPUT_SHARED, actor, in);
    } catch (const Error&) {
        Job now = jobs_->read(cur.hdr.id);
        if (now.status == JobStatus::OUTPUT_SHARED) return now;
        fs::remove_all(final_dir, ec);
        throw;
    }

    if (audit_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "job_id", json_object_new_string(shared.hdr.id.c_str()));
        json_object_object_add(p, "output_path", json_object_new_string(shared.output_path.c_str()));
        json_object_object_add(p, "requester", json_object_new_string(shared.requester.c_str()));
        err = audit_->event("results.share", actor.id + "/" + role_name(actor.role), p);
        if (!err.empty()) std::cerr << "[warden] " << err << "\n";
    }
    return shared;
}

JobResults DisclosureGate::get_results(const Job& job, const Actor& actor) const {
    Job cur = jobs_->read(job.hdr.id);
    if (actor.role != Role::REQUESTER || actor.id != cur.requester) {
        throw Error(ErrorKind::AUTHORIZATION, "actor '" + actor.id + "' is not the requester of job " + cur.name);
    }
    if (cur.status != JobStatus::OUTPUT_SHARED) {
        throw Error(ErrorKind::DISCLOSURE,
                    "results of job " + cur.name + " have not been shared (status " + job_status_name(cur.status) + ")");
    }
    return load(cur, cur.output_path);
}

} // namespace warden
