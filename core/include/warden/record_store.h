#pragma once

#include "errors.h"
#include "ids.h"
#include "serialization.h"
#include "types.h"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

class AuditLog;

// --- Query model ---

enum class FilterOp { EQ, NE, LT, LE, GT, GE };

// A filter operand: string or integer. Comparing a string field against an
// integer operand (or vice versa) never matches.
struct FieldValue {
    bool is_int{false};
    std::string str;
    int64_t num{0};

    static FieldValue of(const std::string& s) { FieldValue v; v.str = s; return v; }
    static FieldValue of(const char* s) { return of(std::string(s)); }
    static FieldValue of(int64_t n) { FieldValue v; v.is_int = true; v.num = n; return v; }
};

struct Filter {
    std::string field;
    FilterOp op{FilterOp::EQ};
    FieldValue value;
};

inline Filter filter_eq(const std::string& field, const std::string& v) { return Filter{field, FilterOp::EQ, FieldValue::of(v)}; }
inline Filter filter_eq(const std::string& field, int64_t v) { return Filter{field, FilterOp::EQ, FieldValue::of(v)}; }

enum class SortOrder { ASC, DESC };

std::optional<SortOrder> sort_order_from_str(const std::string& s);   // "asc" | "desc"
std::optional<FilterOp> filter_op_from_str(const std::string& s);     // "eq", "ne", "lt", ...

struct Query {
    std::vector<Filter> filters;
    std::string order_by{"created_at"};
    SortOrder sort_order{SortOrder::DESC};
    size_t limit{0};     // 0 = unlimited
    size_t offset{0};
};

// --- Untyped document store ---
//
// Layout: <root>/<kind>/<id>.json, one canonical JSON document per record.
// Mutations are serialized per kind by an in-process mutex plus flock on
// <root>/<kind>/.lock, so several processes may share one root. Reads take no
// lock: documents are replaced by atomic rename only.
class DocumentStore {
public:
    using UniqueKey = std::vector<std::string>;

    DocumentStore(const std::filesystem::path& root, RecordKind kind,
                  std::vector<UniqueKey> unique_keys, bool fsync, AuditLog* audit);

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    // doc must carry an "id"; header timestamps and version are stamped here.
    JsonPtr create(json_object* doc);
    JsonPtr read(const std::string& id) const;
    JsonPtr update(const std::string& id, json_object* doc, int64_t expected_version);
    bool remove(const std::string& id);

    std::vector<JsonPtr> query(const Query& q) const;
    std::vector<JsonPtr> search(const std::string& term, const std::vector<std::string>& fields) const;
    size_t count(const std::vector<Filter>& filters) const;

    RecordKind kind() const { return kind_; }
    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    RecordKind kind_;
    std::vector<UniqueKey> unique_keys_;
    bool fsync_;
    AuditLog* audit_;
    mutable std::mutex mu_;

    std::filesystem::path doc_path(const std::string& id) const;
    std::vector<JsonPtr> load_all() const;
    // Throws ALREADY_EXISTS if doc collides with another record on a unique key.
    void check_unique_locked(json_object* doc, const std::string& self_id) const;
    void write_locked(const std::string& id, json_object* doc) const;
    void audit(const char* event, const std::string& id, int64_t version) const;
};

// --- Typed facade ---

template <typename T> struct RecordTraits;

template <> struct RecordTraits<Dataset> {
    static constexpr RecordKind kind = RecordKind::DATASET;
    static std::vector<DocumentStore::UniqueKey> unique_keys() { return {{"owner", "name"}}; }
};

template <> struct RecordTraits<UserCode> {
    static constexpr RecordKind kind = RecordKind::USER_CODE;
    static std::vector<DocumentStore::UniqueKey> unique_keys() { return {}; }
};

template <> struct RecordTraits<Job> {
    static constexpr RecordKind kind = RecordKind::JOB;
    static std::vector<DocumentStore::UniqueKey> unique_keys() { return {{"name"}}; }
};

// RecordStore<T>: typed CRUD over DocumentStore. Values in and out are
// snapshots; the store owns the persisted bytes.
template <typename T>
class RecordStore {
public:
    RecordStore(const std::filesystem::path& root, bool fsync, AuditLog* audit)
        : docs_(root, RecordTraits<T>::kind, RecordTraits<T>::unique_keys(), fsync, audit) {}

    // Assigns an id when r.hdr.id is empty. Returns the stored record.
    T create(const T& r) {
        T rec = r;
        if (rec.hdr.id.empty()) rec.hdr.id = new_record_id();
        JsonPtr doc = encode(rec);
        return decode(docs_.create(doc.get()).get());
    }

    T read(const std::string& id) const { return decode(docs_.read(id).get()); }

    // Compare-and-swap on r.hdr.id: Conflict unless the stored version equals
    // expected_version.
    T update(const T& r, int64_t expected_version) {
        JsonPtr doc = encode(r);
        return decode(docs_.update(r.hdr.id, doc.get(), expected_version).get());
    }

    bool remove(const std::string& id) { return docs_.remove(id); }

    std::vector<T> query(const Query& q) const { return decode_all(docs_.query(q)); }

    std::vector<T> search(const std::string& term, const std::vector<std::string>& fields) const {
        return decode_all(docs_.search(term, fields));
    }

    size_t count(const std::vector<Filter>& filters = {}) const { return docs_.count(filters); }

    std::optional<T> find_one(const std::vector<Filter>& filters) const {
        Query q;
        q.filters = filters;
        q.limit = 1;
        auto rows = query(q);
        if (rows.empty()) return std::nullopt;
        return rows.front();
    }

    DocumentStore& documents() { return docs_; }

private:
    DocumentStore docs_;

    static JsonPtr encode(const T& r) {
        JsonPtr doc(record_to_json(r));
        T decoded;
        std::string err;
        if (!record_from_json(doc.get(), &decoded, &err)) throw Error(ErrorKind::VALIDATION, err);
        return doc;
    }

    static T decode(json_object* doc) {
        T out;
        std::string err;
        if (!record_from_json(doc, &out, &err)) {
            throw Error(ErrorKind::STORAGE, "corrupt document: " + err);
        }
        return out;
    }

    static std::vector<T> decode_all(const std::vector<JsonPtr>& docs) {
        std::vector<T> out;
        out.reserve(docs.size());
        for (const auto& d : docs) out.push_back(decode(d.get()));
        return out;
    }
};

} // namespace warden
