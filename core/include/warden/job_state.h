#pragma once

#include "record_store.h"
#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace warden {

class AuditLog;

// One declared edge of the job lifecycle. The Failed -> Failed edge is
// "close": status stays Failed and the job becomes terminal.
struct TransitionRule {
    JobStatus from;
    JobStatus to;
    Role role;
    const char* action;
};

const std::vector<TransitionRule>& transition_table();

// Looks up the declared edge, nullptr when the pair is absent.
const TransitionRule* find_transition(JobStatus from, JobStatus to);

// Extra data carried by a transition. Which fields matter depends on the edge.
struct TransitionInput {
    FailureKind failure{FailureKind::NONE};   // -> Failed
    std::string message;                      // failure / rejection reason
    std::optional<int> exit_code;             // Running -> *
    std::string results_dir;                  // Queued -> Running
    std::string output_path;                  // -> OutputShared
};

// Validates and applies lifecycle transitions on Job records.
//
// Checks run in order: the edge is declared (else INVALID_TRANSITION), the
// actor holds the edge's role and, for owner edges, is the datasite owner
// (else AUTHORIZATION), the guard holds (else INVALID_TRANSITION). A stale
// snapshot surfaces CONFLICT from the store; the job is reloaded, re-checked
// and retried up to conflict_retries times. Failures never touch the record.
class JobStateMachine {
public:
    JobStateMachine(RecordStore<Job>* jobs, AuditLog* audit, std::string owner_id,
                    int max_retries, int conflict_retries);

    // job is the caller's last snapshot; its version is the CAS expectation.
    Job transition(const Job& job, JobStatus target, const Actor& actor,
                   const TransitionInput& in = {});

    // Failed -> (terminal).
    Job close(const Job& job, const Actor& actor);

    // Pure check; throws like transition() would, without I/O.
    void validate(const Job& job, JobStatus target, const Actor& actor,
                  const TransitionInput& in) const;

    // Returns the job with the edge's effects applied (status, failure,
    // counters, timestamps). Does not persist.
    Job apply(const Job& job, JobStatus target, const TransitionInput& in) const;

    int max_retries() const { return max_retries_; }
    const std::string& owner_id() const { return owner_id_; }

private:
    RecordStore<Job>* jobs_;
    AuditLog* audit_;
    std::string owner_id_;
    int max_retries_;
    int conflict_retries_;
};

} // namespace warden
