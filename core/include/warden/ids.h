#pragma once
#include <cstdint>
#include <string>

namespace warden {

// 128-bit random record id, 32 lowercase hex chars.
std::string new_record_id();

// True for a well-formed record id. Ids double as file names, so anything
// else (path separators, dots) is rejected at the store boundary.
bool is_valid_record_id(const std::string& id);

// Generated job name: "job-" + 8 hex chars.
std::string new_job_name();

int64_t now_ms();

// "2026-10-19T12:34:56.789Z"
std::string iso_from_ms(int64_t ms);

} // namespace warden
