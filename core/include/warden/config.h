#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace warden {

enum class Profile { DEV, PROD };

// Detect profile from WARDEN_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no fsync, no seccomp, local isolation)
// PROD: strict (fsync on, seccomp on, bwrap isolation, timeout pinned to the 60 s default)
void apply_profile_defaults(Profile p);

// Effective datasite settings, read from the environment.
struct Settings {
    std::filesystem::path root;          // WARDEN_ROOT
    std::string owner;                   // WARDEN_OWNER
    int exec_timeout_sec{60};
    int max_retries{3};
    int conflict_retries{1};
    bool store_fsync{false};
    bool seccomp{false};
    std::string isolation{"local"};      // local | bwrap | docker
    std::string docker_image{"python:3.12-slim"};
    std::vector<std::string> runtime_cmd{"python3"};
    int workers{2};
    int64_t max_code_bytes{1024 * 1024};
    int64_t log_max_bytes{8 * 1024 * 1024};
    int sandbox_uid{65534};
    int sandbox_gid{65534};
    std::vector<std::string> secret_names;   // host env vars forwarded to jobs
    bool allow_unconfined{false};            // WARDEN_ALLOW_UNCONFINED: local provider without namespaces
    std::vector<std::string> sandbox_ro_paths;   // WARDEN_SANDBOX_RO_PATHS, colon-separated
};

// Reads every WARDEN_* variable; unset or unparsable values keep the defaults.
// Throws warden::Error(VALIDATION) for out-of-range values.
Settings load_settings();

int64_t getenv_i64(const char* k, int64_t defv);
bool getenv_bool(const char* k, bool defv);

} // namespace warden
