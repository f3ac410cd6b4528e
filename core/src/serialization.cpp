#include "warden/serialization.h"

namespace warden {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

std::string json_to_string(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
}

std::string json_to_string_pretty(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED);
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_boolean)) { *out = (json_object_get_boolean(v) != 0); return true; }
    return false;
}

bool json_get_int64(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (!json_object_is_type(v, json_type_int)) return false;
    *out = json_object_get_int64(v);
    return true;
}

std::vector<std::string> json_get_string_array(json_object* o, const char* k) {
    std::vector<std::string> out;
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_array)) return out;
    const int n = (int)json_object_array_length(v);
    out.reserve((size_t)n);
    for (int i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(v, i);
        if (it && json_object_is_type(it, json_type_string)) out.push_back(json_object_get_string(it));
    }
    return out;
}

json_object* json_new_string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) {
        json_object_array_add(arr, json_object_new_string_len(s.c_str(), (int)s.size()));
    }
    return arr;
}

// --- header ---

static void add_str(json_object* o, const char* k, const std::string& v) {
    json_object_object_add(o, k, json_object_new_string_len(v.c_str(), (int)v.size()));
}

void header_into_json(json_object* o, const RecordHeader& h) {
    add_str(o, "id", h.id);
    json_object_object_add(o, "created_at", json_object_new_int64(h.created_at));
    json_object_object_add(o, "updated_at", json_object_new_int64(h.updated_at));
    json_object_object_add(o, "version", json_object_new_int64(h.version));
}

bool header_from_json(json_object* o, RecordHeader* out) {
    if (!o || !out) return false;
    RecordHeader h;
    if (!json_get_string(o, "id", &h.id)) return false;
    json_get_int64(o, "created_at", &h.created_at);
    json_get_int64(o, "updated_at", &h.updated_at);
    json_get_int64(o, "version", &h.version);
    *out = std::move(h);
    return true;
}

// Checks the kind tag and pulls the header. Shared prologue of *_from_json.
static bool begin_record(json_object* o, RecordKind kind, RecordHeader* hdr, std::string* err) {
    auto fail = [&](const std::string& why) {
        if (err) *err = std::string(record_kind_name(kind)) + ": " + why;
        return false;
    };
    if (!o || !json_object_is_type(o, json_type_object)) return fail("document is not an object");
    std::string tag;
    if (!json_get_string(o, "kind", &tag)) return fail("missing kind tag");
    if (tag != record_kind_name(kind)) return fail("kind tag mismatch: " + tag);
    if (!header_from_json(o, hdr)) return fail("missing id");
    return true;
}

static bool require_str(json_object* o, const char* k, std::string* out, RecordKind kind, std::string* err) {
    if (json_get_string(o, k, out)) return true;
    if (err) *err = std::string(record_kind_name(kind)) + ": missing or non-string field '" + k + "'";
    return false;
}

// --- Dataset ---

json_object* dataset_to_json(const Dataset& d) {
    json_object* o = json_object_new_object();
    add_str(o, "kind", record_kind_name(RecordKind::DATASET));
    header_into_json(o, d.hdr);
    add_str(o, "owner", d.owner);
    add_str(o, "name", d.name);
    add_str(o, "private_path", d.private_path);
    add_str(o, "mock_path", d.mock_path);
    add_str(o, "summary", d.summary);
    add_str(o, "readme_path", d.readme_path);
    if (d.runtime) {
        json_object* rt = json_object_new_object();
        json_object_object_add(rt, "cmd", json_new_string_array(d.runtime->cmd));
        add_str(rt, "mount_dir", d.runtime->mount_dir);
        json_object_object_add(o, "runtime", rt);
    } else {
        json_object_object_add(o, "runtime", nullptr);
    }
    return o;
}

bool dataset_from_json(json_object* o, Dataset* out, std::string* err) {
    if (!out) return false;
    const RecordKind kind = RecordKind::DATASET;
    Dataset d;
    if (!begin_record(o, kind, &d.hdr, err)) return false;
    if (!require_str(o, "owner", &d.owner, kind, err)) return false;
    if (!require_str(o, "name", &d.name, kind, err)) return false;
    if (!require_str(o, "private_path", &d.private_path, kind, err)) return false;
    if (!require_str(o, "mock_path", &d.mock_path, kind, err)) return false;
    json_get_string(o, "summary", &d.summary);
    json_get_string(o, "readme_path", &d.readme_path);

    json_object* rt = nullptr;
    if (json_object_object_get_ex(o, "runtime", &rt) && rt && json_object_is_type(rt, json_type_object)) {
        RuntimeSpec spec;
        spec.cmd = json_get_string_array(rt, "cmd");
        json_get_string(rt, "mount_dir", &spec.mount_dir);
        d.runtime = std::move(spec);
    }
    *out = std::move(d);
    return true;
}

// --- UserCode ---

json_object* user_code_to_json(const UserCode& c) {
    json_object* o = json_object_new_object();
    add_str(o, "kind", record_kind_name(RecordKind::USER_CODE));
    header_into_json(o, c.hdr);
    add_str(o, "owner", c.owner);
    add_str(o, "name", c.name);
    add_str(o, "entrypoint", c.entrypoint);
    add_str(o, "code_type", c.code_type == CodeType::FOLDER ? "folder" : "file");
    add_str(o, "code_dir", c.code_dir);
    json_object_object_add(o, "files", json_new_string_array(c.files));
    add_str(o, "digest", c.digest);
    add_str(o, "readme_path", c.readme_path);
    return o;
}

bool user_code_from_json(json_object* o, UserCode* out, std::string* err) {
    if (!out) return false;
    const RecordKind kind = RecordKind::USER_CODE;
    UserCode c;
    if (!begin_record(o, kind, &c.hdr, err)) return false;
    if (!require_str(o, "owner", &c.owner, kind, err)) return false;
    if (!require_str(o, "entrypoint", &c.entrypoint, kind, err)) return false;
    if (!require_str(o, "code_dir", &c.code_dir, kind, err)) return false;
    json_get_string(o, "name", &c.name);
    std::string ct;
    json_get_string(o, "code_type", &ct);
    if (ct == "folder") c.code_type = CodeType::FOLDER;
    else if (ct.empty() || ct == "file") c.code_type = CodeType::FILE;
    else {
        if (err) *err = "user_code: unknown code_type '" + ct + "'";
        return false;
    }
    c.files = json_get_string_array(o, "files");
    json_get_string(o, "digest", &c.digest);
    json_get_string(o, "readme_path", &c.readme_path);
    *out = std::move(c);
    return true;
}

// --- Job ---

json_object* job_to_json(const Job& j) {
    json_object* o = json_object_new_object();
    add_str(o, "kind", record_kind_name(RecordKind::JOB));
    header_into_json(o, j.hdr);
    add_str(o, "name", j.name);
    add_str(o, "description", j.description);
    json_object_object_add(o, "tags", json_new_string_array(j.tags));
    add_str(o, "dataset_id", j.dataset_id);
    add_str(o, "dataset_name", j.dataset_name);
    add_str(o, "user_code_id", j.user_code_id);
    add_str(o, "requester", j.requester);
    add_str(o, "status", job_status_name(j.status));
    add_str(o, "failure", failure_kind_name(j.failure));
    add_str(o, "failure_message", j.failure_message);
    add_str(o, "results_dir", j.results_dir);
    add_str(o, "output_path", j.output_path);
    json_object_object_add(o, "exit_code", json_object_new_int(j.exit_code));
    json_object_object_add(o, "retry_count", json_object_new_int(j.retry_count));
    json_object_object_add(o, "closed", json_object_new_boolean(j.closed ? 1 : 0));
    json_object_object_add(o, "started_at", json_object_new_int64(j.started_at));
    json_object_object_add(o, "finished_at", json_object_new_int64(j.finished_at));
    return o;
}

bool job_from_json(json_object* o, Job* out, std::string* err) {
    if (!out) return false;
    const RecordKind kind = RecordKind::JOB;
    Job j;
    if (!begin_record(o, kind, &j.hdr, err)) return false;
    if (!require_str(o, "name", &j.name, kind, err)) return false;
    if (!require_str(o, "dataset_id", &j.dataset_id, kind, err)) return false;
    if (!require_str(o, "user_code_id", &j.user_code_id, kind, err)) return false;
    if (!require_str(o, "requester", &j.requester, kind, err)) return false;

    std::string st;
    if (!require_str(o, "status", &st, kind, err)) return false;
    auto status = job_status_from_str(st);
    if (!status) {
        if (err) *err = "job: unknown status '" + st + "'";
        return false;
    }
    j.status = *status;

    std::string fk = "none";
    json_get_string(o, "failure", &fk);
    auto failure = failure_kind_from_str(fk);
    if (!failure) {
        if (err) *err = "job: unknown failure kind '" + fk + "'";
        return false;
    }
    j.failure = *failure;
    if (j.status == JobStatus::FAILED && j.failure == FailureKind::NONE) {
        if (err) *err = "job: Failed status requires a failure kind";
        return false;
    }

    json_get_string(o, "description", &j.description);
    j.tags = json_get_string_array(o, "tags");
    json_get_string(o, "dataset_name", &j.dataset_name);
    json_get_string(o, "failure_message", &j.failure_message);
    json_get_string(o, "results_dir", &j.results_dir);
    json_get_string(o, "output_path", &j.output_path);

    int64_t v = 0;
    if (json_get_int64(o, "exit_code", &v)) j.exit_code = (int)v;
    if (json_get_int64(o, "retry_count", &v)) j.retry_count = (int)v;
    json_get_bool(o, "closed", &j.closed);
    json_get_int64(o, "started_at", &j.started_at);
    json_get_int64(o, "finished_at", &j.finished_at);

    *out = std::move(j);
    return true;
}

} // namespace warden
