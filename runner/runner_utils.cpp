#include "runner_utils.h"

#include "warden/serialization.h"

#include <cstring>
#include <iostream>

namespace warden {

// Flags that take no value.
static bool is_bool_flag(const std::string& a) {
    return a == "--desc" || a == "--asc" || a == "--verify";
}

Settings cli_settings() {
    apply_profile_defaults(detect_profile());
    return load_settings();
}

std::string arg_value(int argc, char** argv, int from, const char* flag, const std::string& defv) {
    for (int i = from; i < argc; i++) {
        if (std::strcmp(argv[i], flag) == 0 && i + 1 < argc) return argv[i + 1];
    }
    return defv;
}

bool has_flag(int argc, char** argv, int from, const char* flag) {
    for (int i = from; i < argc; i++) {
        if (std::strcmp(argv[i], flag) == 0) return true;
    }
    return false;
}

std::vector<std::string> positionals(int argc, char** argv, int from) {
    std::vector<std::string> out;
    for (int i = from; i < argc; i++) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            if (!is_bool_flag(a)) i++;
            continue;
        }
        out.push_back(a);
    }
    return out;
}

bool parse_actor(int argc, char** argv, const Settings& s, Actor* out, std::string* err) {
    const std::string role = arg_value(argc, argv, 2, "--as", "owner");
    std::string id = arg_value(argc, argv, 2, "--id");
    if (role == "owner") {
        if (id.empty()) id = s.owner;
        if (id.empty()) {
            *err = "owner identity unknown: pass --id or set WARDEN_OWNER";
            return false;
        }
        *out = Actor::owner(id);
        return true;
    }
    if (role == "requester") {
        if (id.empty()) {
            *err = "requester identity required: pass --id";
            return false;
        }
        *out = Actor::requester(id);
        return true;
    }
    *err = "--as must be owner or requester";
    return false;
}

void print_json(json_object* obj) {
    JsonPtr p(obj);
    std::cout << json_to_string_pretty(p.get()) << "\n";
}

json_object* results_to_json(const JobResults& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "job", job_to_json(r.job));
    json_object_object_add(o, "results_dir", json_object_new_string(r.results_dir.string().c_str()));
    json_object* outputs = json_object_new_object();
    for (const auto& kv : r.outputs) {
        json_object_object_add(outputs, kv.first.c_str(),
                               json_object_new_string_len(kv.second.data(), (int)kv.second.size()));
    }
    json_object_object_add(o, "outputs", outputs);
    json_object_object_add(o, "stdout", json_object_new_string_len(r.stdout_text.data(), (int)r.stdout_text.size()));
    json_object_object_add(o, "stderr", json_object_new_string_len(r.stderr_text.data(), (int)r.stderr_text.size()));
    json_object_object_add(o, "truncated", json_new_string_array(r.truncated));
    return o;
}

int run_guarded(const char* cmd, const std::function<int()>& fn) {
    try {
        return fn();
    } catch (const Error& e) {
        std::cerr << "[warden] " << cmd << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[warden] " << cmd << ": storage: " << e.what() << "\n";
        return 1;
    }
}

} // namespace warden
