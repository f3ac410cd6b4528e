#include "warden/audit_log.h"
#include "warden/crypto.h"
#include "warden/fs_util.h"
#include "warden/ids.h"
#include "warden/serialization.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace warden {

static const std::string kGenesis(64, '0');

// Recursively serialize JSON with sorted keys.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const int len = (int)json_object_array_length(obj);
        for (int i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

// The hashed record is the line minus its chain fields.
static std::string record_without_chain(json_object* line) {
    JsonPtr rec(json_object_new_object());
    json_object_object_foreach(line, k, v) {
        std::string key(k);
        if (key == "chain_prev" || key == "chain_hash") continue;
        json_object_object_add(rec.get(), k, json_object_get(v));
    }
    return canonical_json(rec.get());
}

// Head of the chain as stored: hash and seq of the newest line.
static void read_tail(const Wal& wal, std::string* hash, long long* seq) {
    *hash = kGenesis;
    *seq = 0;
    auto segments = wal.list_segments();
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        const std::string last = read_last_line(*it);
        if (last.empty()) continue;
        JsonPtr o(json_tokener_parse(last.c_str()));
        std::string h;
        int64_t n = 0;
        if (o && json_get_string(o.get(), "chain_hash", &h)) *hash = h;
        if (o && json_get_int64(o.get(), "seq", &n)) *seq = n;
        return;
    }
}

AuditLog::AuditLog(const std::filesystem::path& path, bool fsync)
    : wal_(path), lock_path_(path.string() + ".lock"), chain_prev_(kGenesis) {
    wal_.set_fsync(fsync);
    read_tail(wal_, &chain_prev_, &seq_);
}

std::string AuditLog::event(const std::string& name, const std::string& actor, json_object* payload) {
    JsonPtr owned(payload ? payload : json_object_new_object());

    std::lock_guard<std::mutex> lk(mu_);
    // Creates the directory that holds the lock file.
    std::string err = wal_.open();
    if (!err.empty()) return "audit open: " + err;

    // Other processes append to the same chain; the head is re-read under the lock.
    FileLock flk(lock_path_);
    if (!flk.held()) return "audit lock: " + flk.error();
    err = wal_.refresh();
    if (!err.empty()) return "audit reopen: " + err;
    read_tail(wal_, &chain_prev_, &seq_);

    const long long seq = seq_ + 1;

    JsonPtr line(json_object_new_object());
    json_object_object_add(line.get(), "actor", json_object_new_string(actor.c_str()));
    json_object_object_add(line.get(), "event", json_object_new_string(name.c_str()));
    json_object_object_add(line.get(), "payload", owned.release());
    json_object_object_add(line.get(), "seq", json_object_new_int64(seq));
    json_object_object_add(line.get(), "ts", json_object_new_string(iso_from_ms(now_ms()).c_str()));

    // chain_hash = SHA256(chain_prev || canonical record)
    const std::string record = canonical_json(line.get());
    const std::string chain_hash = sha256_hex(chain_prev_ + record);

    json_object_object_add(line.get(), "chain_hash", json_object_new_string(chain_hash.c_str()));
    json_object_object_add(line.get(), "chain_prev", json_object_new_string(chain_prev_.c_str()));

    err = wal_.append_line(canonical_json(line.get()));
    if (!err.empty()) return "audit append: " + err;

    chain_prev_ = chain_hash;
    seq_ = seq;
    return "";
}

std::string AuditLog::verify_chain() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::error_code ec;
    if (!std::filesystem::is_directory(lock_path_.parent_path(), ec)) return "";
    FileLock flk(lock_path_);
    if (!flk.held()) return "audit lock: " + flk.error();

    std::string prev = kGenesis;
    bool first = true;

    for (const auto& seg : wal_.list_segments()) {
        std::ifstream in(seg);
        if (!in) return "cannot open " + seg.string();
        std::string raw;
        long long lineno = 0;
        while (std::getline(in, raw)) {
            lineno++;
            if (raw.empty()) continue;
            const std::string where = seg.filename().string() + ":" + std::to_string(lineno);

            JsonPtr o(json_tokener_parse(raw.c_str()));
            if (!o || !json_object_is_type(o.get(), json_type_object)) return where + ": malformed line";

            std::string chain_prev, chain_hash;
            if (!json_get_string(o.get(), "chain_prev", &chain_prev) ||
                !json_get_string(o.get(), "chain_hash", &chain_hash)) {
                return where + ": missing chain fields";
            }
            // Retention may have dropped older segments; the oldest surviving
            // line anchors the chain.
            if (!first && chain_prev != prev) return where + ": chain_prev does not link to previous line";
            if (sha256_hex(chain_prev + record_without_chain(o.get())) != chain_hash) {
                return where + ": chain_hash mismatch";
            }
            prev = chain_hash;
            first = false;
        }
    }
    return "";
}

std::string AuditLog::last_hash() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::string hash;
    long long seq = 0;
    read_tail(wal_, &hash, &seq);
    return hash;
}

} // namespace warden
