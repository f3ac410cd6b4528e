#pragma once
#include "wal.h"

#include <json-c/json.h>

#include <filesystem>
#include <mutex>
#include <string>

namespace warden {

// Tamper-evident audit trail of store mutations and job transitions.
//
// Every event is one canonical JSON line (sorted keys) carrying
//   chain_prev = chain_hash of the previous line (64 '0' for the first)
//   chain_hash = SHA256(chain_prev || canonical record without chain fields)
// so editing or dropping a line breaks verification of everything after it.
//
// Several processes may append to one log: each append takes an exclusive
// flock on <path>.lock and re-reads the chain head from the newest segment.
class AuditLog {
public:
    explicit AuditLog(const std::filesystem::path& path, bool fsync = false);

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void set_policy(const WalPolicy& policy) { wal_.set_policy(policy); }

    // Appends one event. payload must be a JSON object (ownership is taken).
    // Returns empty string on success.
    std::string event(const std::string& name, const std::string& actor, json_object* payload);

    // Recomputes the chain across all segments. Returns empty string when the
    // chain is intact, otherwise a description of the first broken line.
    std::string verify_chain() const;

    // Hash of the newest line on disk (genesis for an empty log).
    std::string last_hash() const;
    const std::filesystem::path& path() const { return wal_.path(); }

private:
    mutable std::mutex mu_;
    Wal wal_;
    std::filesystem::path lock_path_;
    std::string chain_prev_;
    long long seq_{0};
};

// Canonical serialization with sorted object keys (RFC 8785 subset).
std::string canonical_json(json_object* obj);

} // namespace warden
