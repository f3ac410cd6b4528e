#pragma once

#include "types.h"

#include <json-c/json.h>

#include <memory>
#include <string>
#include <vector>

namespace warden {

// Owning handle for a json-c object (drops one reference on destruction).
struct JsonPut {
    void operator()(json_object* o) const { if (o) json_object_put(o); }
};
using JsonPtr = std::unique_ptr<json_object, JsonPut>;

// --- JSON helpers (json-c wrappers) ---

std::string json_quote(const std::string& s);
std::string json_to_string(json_object* o);          // plain, compact
std::string json_to_string_pretty(json_object* o);

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_bool(json_object* o, const char* k, bool* out);
bool json_get_int64(json_object* o, const char* k, int64_t* out);
std::vector<std::string> json_get_string_array(json_object* o, const char* k);
json_object* json_new_string_array(const std::vector<std::string>& items);

// --- Record serialization ---
//
// Each record kind has a fixed schema. *_to_json always emits every field,
// including the header ("id", "kind", "created_at", "updated_at", "version").
// *_from_json validates the schema: wrong kind tag, missing required fields or
// wrongly typed values fail with a reason in *err.

json_object* dataset_to_json(const Dataset& d);
bool dataset_from_json(json_object* o, Dataset* out, std::string* err);

json_object* user_code_to_json(const UserCode& c);
bool user_code_from_json(json_object* o, UserCode* out, std::string* err);

json_object* job_to_json(const Job& j);
bool job_from_json(json_object* o, Job* out, std::string* err);

// Header access on an already-serialized document.
bool header_from_json(json_object* o, RecordHeader* out);
void header_into_json(json_object* o, const RecordHeader& h);

// Overloads so templated callers can dispatch on record type.
inline json_object* record_to_json(const Dataset& r) { return dataset_to_json(r); }
inline json_object* record_to_json(const UserCode& r) { return user_code_to_json(r); }
inline json_object* record_to_json(const Job& r) { return job_to_json(r); }
inline bool record_from_json(json_object* o, Dataset* out, std::string* err) { return dataset_from_json(o, out, err); }
inline bool record_from_json(json_object* o, UserCode* out, std::string* err) { return user_code_from_json(o, out, err); }
inline bool record_from_json(json_object* o, Job* out, std::string* err) { return job_from_json(o, out, err); }

} // namespace warden
