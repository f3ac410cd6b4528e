#include "test_common.h"
#include "warden/config.h"
#include <cstdlib>

static void clear_env() {
    for (const char* k : {"WARDEN_PROFILE", "WARDEN_ROOT", "WARDEN_OWNER", "WARDEN_EXEC_TIMEOUT_SEC",
                          "WARDEN_MAX_RETRIES", "WARDEN_CONFLICT_RETRIES", "WARDEN_STORE_FSYNC",
                          "WARDEN_SECCOMP_ENABLE", "WARDEN_ISOLATION", "WARDEN_DOCKER_IMAGE",
                          "WARDEN_RUNTIME_CMD", "WARDEN_WORKERS", "WARDEN_MAX_CODE_BYTES",
                          "WARDEN_LOG_MAX_BYTES", "WARDEN_SANDBOX_UID", "WARDEN_SANDBOX_GID",
                          "WARDEN_SECRETS", "WARDEN_ALLOW_UNCONFINED", "WARDEN_SANDBOX_RO_PATHS"}) {
        unsetenv(k);
    }
}

static std::string env_or_empty(const char* k) {
    const char* v = std::getenv(k);
    return v ? v : "";
}

int main() {
    using warden::ErrorKind;
    clear_env();

    // Test 1: Default profile is DEV
    auto p = warden::detect_profile();
    expect_true(p == warden::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("WARDEN_PROFILE", "prod", 1);
    expect_true(warden::detect_profile() == warden::Profile::PROD, "should detect PROD");
    setenv("WARDEN_PROFILE", "PROD", 1);
    expect_true(warden::detect_profile() == warden::Profile::PROD, "should detect PROD case-insensitive");

    // Test 3: Apply defaults (won't override existing)
    setenv("WARDEN_STORE_FSYNC", "0", 1);
    warden::apply_profile_defaults(warden::Profile::PROD);
    expect_eq_str(env_or_empty("WARDEN_STORE_FSYNC"), "0", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    expect_eq_str(env_or_empty("WARDEN_SECCOMP_ENABLE"), "1", "PROD enables seccomp");
    expect_eq_str(env_or_empty("WARDEN_ISOLATION"), "bwrap", "PROD isolates with bwrap");
    expect_eq_str(env_or_empty("WARDEN_EXEC_TIMEOUT_SEC"), "60", "PROD timeout matches the default");

    // Test 5: Profile name
    expect_eq_str(warden::profile_name(warden::Profile::DEV), "dev", "dev name");
    expect_eq_str(warden::profile_name(warden::Profile::PROD), "prod", "prod name");

    // Test 6: load_settings defaults under DEV
    clear_env();
    setenv("HOME", "/home/tester", 1);
    warden::apply_profile_defaults(warden::Profile::DEV);
    warden::Settings s = warden::load_settings();
    expect_eq_str(s.root.string(), "/home/tester/.warden", "root defaults under HOME");
    expect_eq_ll(s.exec_timeout_sec, 60, "DEV timeout");
    expect_eq_ll(s.max_retries, 3, "default retry cap");
    expect_eq_ll(s.conflict_retries, 1, "default conflict retries");
    expect_true(!s.store_fsync && !s.seccomp, "DEV is lenient");
    expect_eq_str(s.isolation, "local", "DEV isolation");
    expect_true(s.runtime_cmd == std::vector<std::string>({"python3"}), "default runtime");
    expect_eq_ll(s.max_code_bytes, 1024 * 1024, "default code cap");
    expect_true(!s.allow_unconfined, "unconfined local runs need an explicit opt-in");
    expect_true(s.sandbox_ro_paths.empty(), "no extra sandbox paths by default");

    // Test 7: explicit values
    setenv("WARDEN_ROOT", "/srv/warden", 1);
    setenv("WARDEN_OWNER", "do@example.org", 1);
    setenv("WARDEN_RUNTIME_CMD", "uv run --python '3.12'", 1);
    setenv("WARDEN_WORKERS", "8", 1);
    setenv("WARDEN_ISOLATION", "Docker", 1);
    setenv("WARDEN_SECRETS", "API_TOKEN,,DB_URL", 1);
    setenv("WARDEN_SANDBOX_UID", "-1", 1);
    setenv("WARDEN_ALLOW_UNCONFINED", "1", 1);
    setenv("WARDEN_SANDBOX_RO_PATHS", "/opt/conda::/srv/models", 1);
    s = warden::load_settings();
    expect_eq_str(s.root.string(), "/srv/warden", "explicit root");
    expect_eq_str(s.owner, "do@example.org", "owner");
    expect_true(s.runtime_cmd == std::vector<std::string>({"uv", "run", "--python", "3.12"}), "quoted runtime");
    expect_eq_ll(s.workers, 8, "workers");
    expect_eq_str(s.isolation, "docker", "isolation lower-cased");
    expect_true(s.secret_names == std::vector<std::string>({"API_TOKEN", "DB_URL"}), "secret names");
    expect_eq_ll(s.sandbox_uid, -1, "identity switch disabled");
    expect_true(s.allow_unconfined, "unconfined opt-in");
    expect_true(s.sandbox_ro_paths == std::vector<std::string>({"/opt/conda", "/srv/models"}), "extra sandbox paths");

    // Test 8: invalid values
    setenv("WARDEN_ISOLATION", "vm", 1);
    expect_throws_kind(ErrorKind::VALIDATION, [] { warden::load_settings(); }, "unknown isolation");
    setenv("WARDEN_ISOLATION", "local", 1);
    setenv("WARDEN_WORKERS", "0", 1);
    expect_throws_kind(ErrorKind::VALIDATION, [] { warden::load_settings(); }, "zero workers");
    setenv("WARDEN_WORKERS", "2", 1);
    setenv("WARDEN_MAX_RETRIES", "-1", 1);
    expect_throws_kind(ErrorKind::VALIDATION, [] { warden::load_settings(); }, "negative retries");
    setenv("WARDEN_MAX_RETRIES", "3", 1);
    setenv("WARDEN_RUNTIME_CMD", "\"unterminated", 1);
    expect_throws_kind(ErrorKind::VALIDATION, [] { warden::load_settings(); }, "unparsable runtime");
    setenv("WARDEN_RUNTIME_CMD", "python3", 1);
    setenv("WARDEN_SANDBOX_RO_PATHS", "opt/conda", 1);
    expect_throws_kind(ErrorKind::VALIDATION, [] { warden::load_settings(); }, "relative sandbox path");

    // Test 9: helpers
    setenv("WARDEN_TEST_NUM", "abc", 1);
    expect_eq_ll(warden::getenv_i64("WARDEN_TEST_NUM", 7), 7, "unparsable int keeps default");
    setenv("WARDEN_TEST_NUM", "yes", 1);
    expect_true(warden::getenv_bool("WARDEN_TEST_NUM", false), "yes is true");
    unsetenv("WARDEN_TEST_NUM");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
