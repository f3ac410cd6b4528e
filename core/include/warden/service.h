#pragma once

#include "audit_log.h"
#include "config.h"
#include "disclosure.h"
#include "executor.h"
#include "job_state.h"
#include "record_store.h"
#include "types.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden {

struct DatasetSpec {
    std::string name;
    std::filesystem::path path;              // private data, never copied
    std::filesystem::path mock_path;
    std::string summary;
    std::filesystem::path description_path;  // optional README (.md)
    std::optional<RuntimeSpec> runtime;
};

struct JobSpec {
    std::filesystem::path code_path;         // file or folder
    std::string entrypoint;                  // required for folders
    std::string dataset_name;
    std::string name;                        // empty: generated
    std::string description;
    std::vector<std::string> tags;
    std::filesystem::path readme_path;
};

struct JobListOptions {
    std::optional<JobStatus> status;
    size_t limit{0};
    std::string order_by{"created_at"};
    SortOrder sort_order{SortOrder::DESC};
};

// One owner's datasite: the store root plus the services operating on it.
//
// Layout under settings.root:
//   store/<kind>/<id>.json       records
//   audit/audit.jsonl            hash-chained audit trail
//   user_code_files/<id>/        managed copies of submitted code
//   results/<job_id>/            owner-side execution output
//   shared/<job_id>/             requester-visible copies
//   mock_runs/<job_id>/          requester-side mock executions
//
// Every operation takes the acting identity explicitly. Failures throw
// warden::Error.
class Datasite {
public:
    explicit Datasite(const Settings& settings);

    Datasite(const Datasite&) = delete;
    Datasite& operator=(const Datasite&) = delete;

    // --- datasets (owner) ---
    Dataset create_dataset(const Actor& actor, const DatasetSpec& spec);
    Dataset get_dataset(const std::string& name_or_id) const;
    std::vector<Dataset> list_datasets(const Query& q = {}) const;
    bool remove_dataset(const Actor& actor, const std::string& name_or_id);

    // --- user code ---
    UserCode submit_user_code(const Actor& actor, const std::filesystem::path& code_path,
                              const std::string& entrypoint,
                              const std::filesystem::path& readme_path = {});
    UserCode get_user_code(const std::string& id) const;

    // --- jobs ---
    // Creates the UserCode and a Job in CodeReview.
    Job submit_job(const Actor& actor, const JobSpec& spec);
    Job get_job(const std::string& id_or_name) const;
    std::vector<Job> list_jobs(const JobListOptions& opts = {}) const;
    std::vector<Job> search_jobs(const std::string& term) const;

    Job approve(const Actor& actor, const std::string& job);
    Job reject(const Actor& actor, const std::string& job, const std::string& reason);
    // Queued -> Running, executes against the private data, then Running ->
    // PendingOutputReview or Failed. Execution failures are recorded on the
    // returned job; setup errors are recorded as Failed and rethrown.
    Job run(const Actor& actor, const std::string& job);
    Job retry(const Actor& actor, const std::string& job);
    Job close(const Actor& actor, const std::string& job);
    Job reject_output(const Actor& actor, const std::string& job, const std::string& reason);

    JobResults review_results(const Actor& actor, const std::string& job) const;
    Job share_results(const Actor& actor, const std::string& job);
    JobResults get_results(const Actor& actor, const std::string& job) const;

    // Runs the job's code against the mock data without touching its status.
    // Throws EXECUTION_FAILURE / EXECUTION_TIMEOUT when the run does not succeed.
    ExecutionReport run_mock(const Actor& actor, const std::string& job,
                             const std::filesystem::path& scratch_dir = {});

    // Runs every Queued job through a pool of `workers` threads, lower retry
    // count first. Returns the number of jobs handed to the pool.
    size_t serve(const Actor& actor, int workers);

    const Settings& settings() const { return settings_; }
    AuditLog& audit() { return audit_; }
    RecordStore<Job>& jobs() { return jobs_; }
    JobStateMachine& machine() { return machine_; }

private:
    Settings settings_;
    AuditLog audit_;
    RecordStore<Dataset> datasets_;
    RecordStore<UserCode> codes_;
    RecordStore<Job> jobs_;
    JobStateMachine machine_;
    Executor executor_;
    DisclosureGate gate_;

    void require_owner(const Actor& actor, const char* what) const;
    Job execute_running(const Job& running);
    ExecutionRequest build_request(const Job& job, bool mock) const;
    std::vector<std::pair<std::string, std::string>> secrets() const;
};

// Sorted set of file extensions (".csv", "" for none) under dir.
std::vector<std::string> extension_set(const std::filesystem::path& dir);

// SHA-256 over (relative path, size, bytes) of every file, in path order.
std::string code_digest(const std::filesystem::path& dir, const std::vector<std::string>& files);

} // namespace warden
