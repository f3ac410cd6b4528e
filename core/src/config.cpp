#include "warden/config.h"
#include "warden/errors.h"
#include "warden/proc.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace warden {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

Profile detect_profile() {
    const char* env = std::getenv("WARDEN_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must be called before any worker threads are created.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("WARDEN_STORE_FSYNC",      "0",     NO_OVERWRITE);
            setenv("WARDEN_SECCOMP_ENABLE",   "0",     NO_OVERWRITE);
            setenv("WARDEN_ISOLATION",        "local", NO_OVERWRITE);
            setenv("WARDEN_EXEC_TIMEOUT_SEC", "60",    NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("WARDEN_STORE_FSYNC",      "1",     NO_OVERWRITE);
            setenv("WARDEN_SECCOMP_ENABLE",   "1",     NO_OVERWRITE);
            setenv("WARDEN_ISOLATION",        "bwrap", NO_OVERWRITE);
            setenv("WARDEN_EXEC_TIMEOUT_SEC", "60",    NO_OVERWRITE);
            break;
    }
}

int64_t getenv_i64(const char* k, int64_t defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoll(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

bool getenv_bool(const char* k, bool defv) {
    const char* v = std::getenv(k);
    if (!v) return defv;
    std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

Settings load_settings() {
    Settings s;

    if (const char* r = std::getenv("WARDEN_ROOT")) {
        s.root = r;
    } else if (const char* home = std::getenv("HOME")) {
        s.root = std::filesystem::path(home) / ".warden";
    } else {
        s.root = std::filesystem::current_path() / ".warden";
    }
    if (const char* o = std::getenv("WARDEN_OWNER")) s.owner = o;

    s.exec_timeout_sec = (int)getenv_i64("WARDEN_EXEC_TIMEOUT_SEC", s.exec_timeout_sec);
    s.max_retries = (int)getenv_i64("WARDEN_MAX_RETRIES", s.max_retries);
    s.conflict_retries = (int)getenv_i64("WARDEN_CONFLICT_RETRIES", s.conflict_retries);
    s.store_fsync = getenv_bool("WARDEN_STORE_FSYNC", s.store_fsync);
    s.seccomp = getenv_bool("WARDEN_SECCOMP_ENABLE", s.seccomp);
    if (const char* iso = std::getenv("WARDEN_ISOLATION")) s.isolation = lower(iso);
    if (const char* img = std::getenv("WARDEN_DOCKER_IMAGE")) s.docker_image = img;
    if (const char* cmd = std::getenv("WARDEN_RUNTIME_CMD")) {
        auto toks = split_argv_quoted(cmd);
        if (toks.empty()) throw Error(ErrorKind::VALIDATION, "WARDEN_RUNTIME_CMD: cannot parse '" + std::string(cmd) + "'");
        s.runtime_cmd = toks;
    }
    s.workers = (int)getenv_i64("WARDEN_WORKERS", s.workers);
    s.max_code_bytes = getenv_i64("WARDEN_MAX_CODE_BYTES", s.max_code_bytes);
    s.log_max_bytes = getenv_i64("WARDEN_LOG_MAX_BYTES", s.log_max_bytes);
    s.sandbox_uid = (int)getenv_i64("WARDEN_SANDBOX_UID", s.sandbox_uid);
    s.sandbox_gid = (int)getenv_i64("WARDEN_SANDBOX_GID", s.sandbox_gid);
    if (const char* sec = std::getenv("WARDEN_SECRETS")) {
        std::string list = sec;
        size_t start = 0;
        while (start <= list.size()) {
            size_t end = list.find(',', start);
            if (end == std::string::npos) end = list.size();
            std::string name = list.substr(start, end - start);
            if (!name.empty()) s.secret_names.push_back(name);
            start = end + 1;
        }
    }

    s.allow_unconfined = getenv_bool("WARDEN_ALLOW_UNCONFINED", s.allow_unconfined);
    if (const char* ro = std::getenv("WARDEN_SANDBOX_RO_PATHS")) {
        std::string list = ro;
        size_t start = 0;
        while (start <= list.size()) {
            size_t end = list.find(':', start);
            if (end == std::string::npos) end = list.size();
            std::string path = list.substr(start, end - start);
            if (!path.empty()) {
                if (path[0] != '/') {
                    throw Error(ErrorKind::VALIDATION, "WARDEN_SANDBOX_RO_PATHS: '" + path + "' is not absolute");
                }
                s.sandbox_ro_paths.push_back(path);
            }
            start = end + 1;
        }
    }

    if (s.exec_timeout_sec <= 0) throw Error(ErrorKind::VALIDATION, "WARDEN_EXEC_TIMEOUT_SEC must be positive");
    if (s.max_retries < 0) throw Error(ErrorKind::VALIDATION, "WARDEN_MAX_RETRIES must be >= 0");
    if (s.conflict_retries < 0) throw Error(ErrorKind::VALIDATION, "WARDEN_CONFLICT_RETRIES must be >= 0");
    if (s.workers <= 0) throw Error(ErrorKind::VALIDATION, "WARDEN_WORKERS must be positive");
    if (s.max_code_bytes <= 0) throw Error(ErrorKind::VALIDATION, "WARDEN_MAX_CODE_BYTES must be positive");
    if (s.log_max_bytes <= 0) throw Error(ErrorKind::VALIDATION, "WARDEN_LOG_MAX_BYTES must be positive");
    if (s.isolation != "local" && s.isolation != "bwrap" && s.isolation != "docker") {
        throw Error(ErrorKind::VALIDATION, "WARDEN_ISOLATION: unknown provider '" + s.isolation + "'");
    }
    return s;
}

} // namespace warden
