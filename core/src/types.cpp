#include "warden/types.h"

namespace warden {

const char* record_kind_name(RecordKind k) {
    switch (k) {
        case RecordKind::DATASET:   return "dataset";
        case RecordKind::USER_CODE: return "user_code";
        case RecordKind::JOB:       return "job";
    }
    return "unknown";
}

std::optional<RecordKind> record_kind_from_str(const std::string& s) {
    if (s == "dataset") return RecordKind::DATASET;
    if (s == "user_code") return RecordKind::USER_CODE;
    if (s == "job") return RecordKind::JOB;
    return std::nullopt;
}

const char* job_status_name(JobStatus s) {
    switch (s) {
        case JobStatus::CODE_REVIEW:           return "CodeReview";
        case JobStatus::QUEUED:                return "Queued";
        case JobStatus::RUNNING:               return "Running";
        case JobStatus::FAILED:                return "Failed";
        case JobStatus::PENDING_OUTPUT_REVIEW: return "PendingOutputReview";
        case JobStatus::OUTPUT_SHARED:         return "OutputShared";
        case JobStatus::REJECTED:              return "Rejected";
    }
    return "Unknown";
}

std::optional<JobStatus> job_status_from_str(const std::string& s) {
    static const JobStatus all[] = {
        JobStatus::CODE_REVIEW, JobStatus::QUEUED, JobStatus::RUNNING, JobStatus::FAILED,
        JobStatus::PENDING_OUTPUT_REVIEW, JobStatus::OUTPUT_SHARED, JobStatus::REJECTED,
    };
    for (JobStatus st : all) {
        if (s == job_status_name(st)) return st;
    }
    return std::nullopt;
}

const char* failure_kind_name(FailureKind k) {
    switch (k) {
        case FailureKind::NONE:              return "none";
        case FailureKind::EXECUTION_TIMEOUT: return "execution_timeout";
        case FailureKind::EXECUTION_FAILURE: return "execution_failure";
        case FailureKind::CODE_REJECTED:     return "code_rejected";
        case FailureKind::OUTPUT_REJECTED:   return "output_rejected";
    }
    return "none";
}

std::optional<FailureKind> failure_kind_from_str(const std::string& s) {
    if (s == "none") return FailureKind::NONE;
    if (s == "execution_timeout") return FailureKind::EXECUTION_TIMEOUT;
    if (s == "execution_failure") return FailureKind::EXECUTION_FAILURE;
    if (s == "code_rejected") return FailureKind::CODE_REJECTED;
    if (s == "output_rejected") return FailureKind::OUTPUT_REJECTED;
    return std::nullopt;
}

const char* role_name(Role r) {
    switch (r) {
        case Role::OWNER:     return "owner";
        case Role::REQUESTER: return "requester";
        case Role::SYSTEM:    return "system";
    }
    return "unknown";
}

} // namespace warden
