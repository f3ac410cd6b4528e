#include "warden/job_state.h"
#include "warden/audit_log.h"
#include "warden/errors.h"
#include "warden/ids.h"

#include <iostream>

namespace warden {

const std::vector<TransitionRule>& transition_table() {
    static const std::vector<TransitionRule> table = {
        {JobStatus::CODE_REVIEW,           JobStatus::QUEUED,                Role::OWNER,  "approve"},
        {JobStatus::CODE_REVIEW,           JobStatus::REJECTED,              Role::OWNER,  "reject"},
        {JobStatus::QUEUED,                JobStatus::RUNNING,               Role::OWNER,  "run"},
        {JobStatus::RUNNING,               JobStatus::FAILED,                Role::SYSTEM, "fail"},
        {JobStatus::RUNNING,               JobStatus::PENDING_OUTPUT_REVIEW, Role::SYSTEM, "finish"},
        {JobStatus::FAILED,                JobStatus::QUEUED,                Role::OWNER,  "retry"},
        {JobStatus::FAILED,                JobStatus::FAILED,                Role::OWNER,  "close"},
        {JobStatus::PENDING_OUTPUT_REVIEW, JobStatus::OUTPUT_SHARED,         Role::OWNER,  "share"},
        {JobStatus::PENDING_OUTPUT_REVIEW, JobStatus::FAILED,                Role::OWNER,  "reject_output"},
    };
    return table;
}

const TransitionRule* find_transition(JobStatus from, JobStatus to) {
    for (const auto& r : transition_table()) {
        if (r.from == from && r.to == to) return &r;
    }
    return nullptr;
}

JobStateMachine::JobStateMachine(RecordStore<Job>* jobs, AuditLog* audit, std::string owner_id,
                                 int max_retries, int conflict_retries)
    : jobs_(jobs),
      audit_(audit),
      owner_id_(std::move(owner_id)),
      max_retries_(max_retries),
      conflict_retries_(conflict_retries) {}

static std::string edge_str(JobStatus from, JobStatus to) {
    return std::string(job_status_name(from)) + " -> " + job_status_name(to);
}

void JobStateMachine::validate(const Job& job, JobStatus target, const Actor& actor,
                               const TransitionInput& in) const {
    const TransitionRule* rule = find_transition(job.status, target);
    if (!rule) {
        throw Error(ErrorKind::INVALID_TRANSITION, "job " + job.name + ": " + edge_str(job.status, target) + " is not a declared transition");
    }

    if (actor.role != rule->role) {
        throw Error(ErrorKind::AUTHORIZATION,
                    std::string(rule->action) + " requires role " + role_name(rule->role) +
                    ", actor '" + actor.id + "' has role " + role_name(actor.role));
    }
    if (rule->role == Role::OWNER && !owner_id_.empty() && actor.id != owner_id_) {
        throw Error(ErrorKind::AUTHORIZATION, "actor '" + actor.id + "' is not the owner of this datasite");
    }

    if (job.is_terminal()) {
        throw Error(ErrorKind::INVALID_TRANSITION, "job " + job.name + " is closed");
    }

    switch (target) {
    case JobStatus::FAILED:
        if (job.status == JobStatus::RUNNING &&
            in.failure != FailureKind::EXECUTION_TIMEOUT && in.failure != FailureKind::EXECUTION_FAILURE) {
            throw Error(ErrorKind::INVALID_TRANSITION, "Running -> Failed requires an execution failure kind");
        }
        break;
    case JobStatus::QUEUED:
        if (job.status == JobStatus::FAILED && job.retry_count >= max_retries_) {
            throw Error(ErrorKind::INVALID_TRANSITION,
                        "job " + job.name + ": retries exhausted (" + std::to_string(job.retry_count) +
                        "/" + std::to_string(max_retries_) + ")");
        }
        break;
    case JobStatus::OUTPUT_SHARED:
        if (in.output_path.empty()) {
            throw Error(ErrorKind::INVALID_TRANSITION, "job " + job.name + ": share requires a shared output path");
        }
        break;
    default:
        break;
    }
}

Job JobStateMachine::apply(const Job& job, JobStatus target, const TransitionInput& in) const {
    Job next = job;
    const JobStatus from = job.status;
    next.status = target;

    switch (target) {
    case JobStatus::QUEUED:
        if (from == JobStatus::FAILED) {
            next.retry_count++;
            next.failure = FailureKind::NONE;
            next.failure_message.clear();
            next.exit_code = -1;
            next.started_at = 0;
            next.finished_at = 0;
        }
        break;
    case JobStatus::RUNNING:
        next.started_at = now_ms();
        next.finished_at = 0;
        if (!in.results_dir.empty()) next.results_dir = in.results_dir;
        break;
    case JobStatus::PENDING_OUTPUT_REVIEW:
        next.finished_at = now_ms();
        if (in.exit_code) next.exit_code = *in.exit_code;
        break;
    case JobStatus::FAILED:
        if (from == JobStatus::FAILED) {
            next.closed = true;
        } else if (from == JobStatus::PENDING_OUTPUT_REVIEW) {
            next.failure = FailureKind::OUTPUT_REJECTED;
            next.failure_message = in.message.empty() ? "output rejected by owner" : in.message;
        } else {
            next.failure = in.failure;
            next.failure_message = in.message;
            next.finished_at = now_ms();
            if (in.exit_code) next.exit_code = *in.exit_code;
        }
        break;
    case JobStatus::REJECTED:
        next.failure = FailureKind::CODE_REJECTED;
        next.failure_message = in.message.empty() ? "code rejected by owner" : in.message;
        break;
    case JobStatus::OUTPUT_SHARED:
        next.output_path = in.output_path;
        break;
    case JobStatus::CODE_REVIEW:
        break;
    }
    return next;
}

Job JobStateMachine::transition(const Job& job, JobStatus target, const Actor& actor,
                                const TransitionInput& in) {
    Job snap = job;
    for (int attempt = 0;; attempt++) {
        validate(snap, target, actor, in);
        Job next = apply(snap, target, in);
        try {
            Job stored = jobs_->update(next, snap.hdr.version);
            if (audit_) {
                json_object* p = json_object_new_object();
                json_object_object_add(p, "job_id", json_object_new_string(stored.hdr.id.c_str()));
                json_object_object_add(p, "job_name", json_object_new_string(stored.name.c_str()));
                json_object_object_add(p, "from", json_object_new_string(job_status_name(snap.status)));
                json_object_object_add(p, "to", json_object_new_string(job_status_name(stored.status)));
                json_object_object_add(p, "action", json_object_new_string(find_transition(snap.status, target)->action));
                json_object_object_add(p, "failure", json_object_new_string(failure_kind_name(stored.failure)));
                json_object_object_add(p, "version", json_object_new_int64(stored.hdr.version));
                // The record is already committed; an audit failure is reported, not rolled back.
                std::string err = audit_->event("job.transition", actor.id + "/" + role_name(actor.role), p);
                if (!err.empty()) std::cerr << "[warden] " << err << "\n";
            }
            return stored;
        } catch (const Error& e) {
            if (e.kind() != ErrorKind::CONFLICT || attempt >= conflict_retries_) throw;
            snap = jobs_->read(job.hdr.id);
        }
    }
}

Job JobStateMachine::close(const Job& job, const Actor& actor) {
    return transition(job, JobStatus::FAILED, actor);
}

} // namespace warden
