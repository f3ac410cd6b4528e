#pragma once

#include "job_state.h"
#include "record_store.h"
#include "types.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace warden {

class AuditLog;

struct JobResults {
    Job job;
    std::filesystem::path results_dir;
    std::map<std::string, std::string> outputs;   // relative path under output/ -> bytes
    std::string stdout_text;
    std::string stderr_text;
    std::vector<std::string> truncated;           // outputs cut at the per-file cap
};

// Mediates who sees execution artifacts. Every call re-reads the job from
// the store; the snapshot argument only names it.
//
//   review_results  owner only; PendingOutputReview, Failed or OutputShared
//   share_results   owner only; copies output/ and logs/ to <shared_root>/<job_id>
//                   and moves the job to OutputShared (idempotent)
//   get_results     the job's requester only; OutputShared only
class DisclosureGate {
public:
    DisclosureGate(JobStateMachine* machine, RecordStore<Job>* jobs, AuditLog* audit,
                   std::filesystem::path shared_root, std::string owner_id,
                   int64_t max_file_bytes = 10 * 1024 * 1024, bool fsync = false);

    JobResults review_results(const Job& job, const Actor& actor) const;
    Job share_results(const Job& job, const Actor& actor);
    JobResults get_results(const Job& job, const Actor& actor) const;

    const std::filesystem::path& shared_root() const { return shared_root_; }

private:
    JobStateMachine* machine_;
    RecordStore<Job>* jobs_;
    AuditLog* audit_;
    std::filesystem::path shared_root_;
    std::string owner_id_;
    int64_t max_file_bytes_;
    bool fsync_;

    void require_owner(const Actor& actor) const;
    JobResults load(const Job& job, const std::filesystem::path& dir) const;
};

} // namespace warden
