#pragma once

#include "isolation.h"
#include "proc.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace warden {

struct ExecutionRequest {
    std::filesystem::path code_dir;
    std::string entrypoint;                 // relative to code_dir
    std::filesystem::path data_dir;         // private or mock; chosen by the caller
    std::filesystem::path results_dir;      // receives output/ and logs/
    std::vector<std::string> runtime_cmd;
    std::string data_mount_dir;
    std::vector<std::pair<std::string, std::string>> secrets;
    int timeout_sec{60};
    bool private_data{true};                // false when data_dir holds mock data
};

enum class ExecutionStatus { SUCCESS, FAILURE, TIMEOUT };

const char* execution_status_name(ExecutionStatus s);

struct ExecutionReport {
    ExecutionStatus status{ExecutionStatus::FAILURE};
    int exit_code{-1};
    bool group_terminated{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    int64_t elapsed_ms{0};
    std::string message;                    // diagnostic, includes the stderr tail on failure
    std::filesystem::path output_dir;
    std::filesystem::path logs_dir;
    std::vector<std::string> artifacts;     // relative paths under output_dir

    bool ok() const { return status == ExecutionStatus::SUCCESS; }
};

// Sandboxed runtime executor. Blocks until the job process is gone.
//
// Layout under results_dir:
//   output/        fresh, the only place the job may write
//   logs/stdout.log, logs/stderr.log
//   run.json       exit code, timing and truncation flags
//
// Code and data directories are fingerprinted (path, type, size, mtime)
// before and after the run; any change turns the run into a failure.
class Executor {
public:
    Executor(std::unique_ptr<ProcessIsolationProvider> provider, ProcLimits base);

    // Setup problems (missing paths, bad entrypoint, unwritable results dir)
    // throw warden::Error. Anything that happens to the job process itself is
    // reported in the returned ExecutionReport.
    ExecutionReport execute(const ExecutionRequest& req) const;

    const ProcessIsolationProvider& provider() const { return *provider_; }
    const ProcLimits& limits() const { return base_; }

private:
    std::unique_ptr<ProcessIsolationProvider> provider_;
    ProcLimits base_;
};

// Throws Error(EXECUTION_TIMEOUT / EXECUTION_FAILURE) for a non-successful report.
void throw_if_failed(const ExecutionReport& r);

// Metadata-only digest of a directory tree (relative path, type, size, mtime).
std::string tree_fingerprint(const std::filesystem::path& dir);

} // namespace warden
