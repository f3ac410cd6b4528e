#pragma once

#include "proc.h"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace warden {

// Host-side description of one execution.
struct ExecutionContext {
    std::filesystem::path code_dir;
    std::filesystem::path data_dir;
    std::filesystem::path output_dir;        // fresh, writable
    std::filesystem::path scratch_dir;       // HOME / TMPDIR for the local provider
    std::filesystem::path logs_dir;
    std::string entrypoint;                  // relative to code_dir
    std::vector<std::string> runtime_cmd;    // interpreter argv prefix
    std::string data_mount_dir;              // in-sandbox DATA_DIR override
    std::vector<std::pair<std::string, std::string>> secrets;
    int timeout_sec{60};
    bool private_data{true};                 // false for mock runs
};

// What the executor actually launches.
struct LaunchPlan {
    ProcSpec spec;
    ProcLimits limits;
    // Run after a timeout when killing the launched process is not enough
    // (e.g. a container outlives its client). Empty = nothing to do.
    std::vector<std::string> cleanup_argv;
    // Paths as the job sees them.
    std::string code_path;
    std::string data_path;
    std::string output_path;
};

// Materializes an isolated execution context: code and data read-only,
// output writable, no network, unprivileged identity.
class ProcessIsolationProvider {
public:
    virtual ~ProcessIsolationProvider() = default;

    virtual const char* name() const = 0;

    // Throws warden::Error(VALIDATION) when this provider may not run the job
    // on this host. Checked before any state changes.
    virtual void check_admissible(bool private_data) const { (void)private_data; }

    // base carries timeout, log caps and security switches from settings.
    virtual LaunchPlan plan(const ExecutionContext& ctx, const ProcLimits& base) const = 0;
};

// Direct fork/exec into a private mount/network namespace: system paths,
// code and data bound read-only at /sandbox/{code,data}, output bound
// writable at /sandbox/output, a private /tmp. Hosts that cannot create the
// namespaces only run mock data, unless allow_unconfined is set.
class LocalIsolationProvider : public ProcessIsolationProvider {
public:
    explicit LocalIsolationProvider(bool allow_unconfined = false, std::vector<std::string> extra_ro_paths = {})
        : allow_unconfined_(allow_unconfined), extra_ro_paths_(std::move(extra_ro_paths)) {}

    const char* name() const override { return "local"; }
    void check_admissible(bool private_data) const override;
    LaunchPlan plan(const ExecutionContext& ctx, const ProcLimits& base) const override;

private:
    bool allow_unconfined_;
    std::vector<std::string> extra_ro_paths_;   // more host paths visible read-only
};

// bubblewrap: ro binds for code/data, rw bind for output, every namespace unshared.
class BwrapIsolationProvider : public ProcessIsolationProvider {
public:
    explicit BwrapIsolationProvider(std::string bwrap = "bwrap") : bwrap_(std::move(bwrap)) {}
    const char* name() const override { return "bwrap"; }
    LaunchPlan plan(const ExecutionContext& ctx, const ProcLimits& base) const override;

private:
    std::string bwrap_;
};

// docker run --rm --network none --cap-drop ALL with ro/rw volumes.
class DockerIsolationProvider : public ProcessIsolationProvider {
public:
    explicit DockerIsolationProvider(std::string image, std::string docker = "docker")
        : image_(std::move(image)), docker_(std::move(docker)) {}
    const char* name() const override { return "docker"; }
    LaunchPlan plan(const ExecutionContext& ctx, const ProcLimits& base) const override;

private:
    std::string image_;
    std::string docker_;
};

// "local" | "bwrap" | "docker"; throws warden::Error(VALIDATION) otherwise.
// allow_unconfined and extra_ro_paths apply to "local" only.
std::unique_ptr<ProcessIsolationProvider> make_isolation_provider(const std::string& name,
                                                                  const std::string& docker_image,
                                                                  bool allow_unconfined = false,
                                                                  std::vector<std::string> extra_ro_paths = {});

// Environment injected into every job: DATA_DIR, OUTPUT_DIR, CODE_DIR, TIMEOUT,
// INPUT_FILE and the declared secrets, plus a minimal PATH/LANG.
std::vector<std::pair<std::string, std::string>> job_environment(const ExecutionContext& ctx,
                                                                  const std::string& code_path,
                                                                  const std::string& data_path,
                                                                  const std::string& output_path,
                                                                  const std::string& home);

} // namespace warden
