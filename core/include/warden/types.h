#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden {

// Record kinds: closed set, one storage directory per kind.
enum class RecordKind {
    DATASET,
    USER_CODE,
    JOB,
};

const char* record_kind_name(RecordKind k);            // "dataset", "user_code", "job"
std::optional<RecordKind> record_kind_from_str(const std::string& s);

// Header common to every persisted record. Server-assigned on create.
struct RecordHeader {
    std::string id;            // 32 hex chars
    int64_t created_at{0};     // epoch ms
    int64_t updated_at{0};     // epoch ms
    int64_t version{0};        // 1 after create, +1 per update
};

// How a dataset wants its code executed. Resolved by the isolation provider.
struct RuntimeSpec {
    std::vector<std::string> cmd;   // interpreter argv prefix, e.g. {"python3"}
    std::string mount_dir;          // in-sandbox data mount; empty = provider default
};

struct Dataset {
    RecordHeader hdr;
    std::string owner;
    std::string name;
    std::string private_path;
    std::string mock_path;
    std::string summary;
    std::string readme_path;
    std::optional<RuntimeSpec> runtime;
};

enum class CodeType {
    FILE,
    FOLDER,
};

struct UserCode {
    RecordHeader hdr;
    std::string owner;               // requester who submitted it
    std::string name;
    std::string entrypoint;          // relative to code_dir
    CodeType code_type{CodeType::FILE};
    std::string code_dir;            // managed copy under the store root
    std::vector<std::string> files;  // relative paths, sorted
    std::string digest;              // sha256 hex over files + contents
    std::string readme_path;
};

enum class JobStatus {
    CODE_REVIEW,
    QUEUED,
    RUNNING,
    FAILED,
    PENDING_OUTPUT_REVIEW,
    OUTPUT_SHARED,
    REJECTED,
};

const char* job_status_name(JobStatus s);
std::optional<JobStatus> job_status_from_str(const std::string& s);

enum class FailureKind {
    NONE,
    EXECUTION_TIMEOUT,
    EXECUTION_FAILURE,
    CODE_REJECTED,
    OUTPUT_REJECTED,
};

const char* failure_kind_name(FailureKind k);
std::optional<FailureKind> failure_kind_from_str(const std::string& s);

struct Job {
    RecordHeader hdr;
    std::string name;
    std::string description;
    std::vector<std::string> tags;
    std::string dataset_id;
    std::string dataset_name;
    std::string user_code_id;
    std::string requester;
    JobStatus status{JobStatus::CODE_REVIEW};
    FailureKind failure{FailureKind::NONE};
    std::string failure_message;
    std::string results_dir;   // owner-side executor output root
    std::string output_path;   // requester-visible copy, set on share
    int exit_code{-1};
    int retry_count{0};
    bool closed{false};        // Failed and declined for retry: terminal
    int64_t started_at{0};
    int64_t finished_at{0};

    bool is_terminal() const {
        return status == JobStatus::REJECTED ||
               status == JobStatus::OUTPUT_SHARED ||
               (status == JobStatus::FAILED && closed);
    }
};

enum class Role {
    OWNER,
    REQUESTER,
    SYSTEM,
};

const char* role_name(Role r);

// Explicit identity of whoever triggers an operation. Nothing in the core
// consults ambient process identity.
struct Actor {
    std::string id;
    Role role{Role::REQUESTER};

    static Actor owner(const std::string& id) { return Actor{id, Role::OWNER}; }
    static Actor requester(const std::string& id) { return Actor{id, Role::REQUESTER}; }
    static Actor system() { return Actor{"system", Role::SYSTEM}; }
};

} // namespace warden
