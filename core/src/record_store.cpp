#include "warden/record_store.h"
#include "warden/audit_log.h"
#include "warden/fs_util.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace warden {

namespace fs = std::filesystem;

std::optional<SortOrder> sort_order_from_str(const std::string& s) {
    if (s == "asc" || s == "ascending") return SortOrder::ASC;
    if (s == "desc" || s == "descending") return SortOrder::DESC;
    return std::nullopt;
}

std::optional<FilterOp> filter_op_from_str(const std::string& s) {
    if (s == "eq") return FilterOp::EQ;
    if (s == "ne") return FilterOp::NE;
    if (s == "lt") return FilterOp::LT;
    if (s == "le") return FilterOp::LE;
    if (s == "gt") return FilterOp::GT;
    if (s == "ge") return FilterOp::GE;
    return std::nullopt;
}

namespace {

// Exclusive flock on <dir>/.lock for the lifetime of the guard.
class KindLock {
public:
    explicit KindLock(const fs::path& dir) : lock_(dir / ".lock") {
        if (!lock_.held()) throw Error(ErrorKind::STORAGE, lock_.error());
    }

private:
    FileLock lock_;
};

// Field value as seen by filters and ordering. Booleans compare as 0/1.
struct Scalar {
    enum { MISSING, INT, STR } type{MISSING};
    int64_t num{0};
    std::string str;
};

Scalar field_scalar(json_object* doc, const std::string& field) {
    Scalar s;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(doc, field.c_str(), &v) || !v) return s;
    switch (json_object_get_type(v)) {
    case json_type_int:
        s.type = Scalar::INT;
        s.num = json_object_get_int64(v);
        break;
    case json_type_boolean:
        s.type = Scalar::INT;
        s.num = json_object_get_boolean(v) ? 1 : 0;
        break;
    case json_type_string:
        s.type = Scalar::STR;
        s.str.assign(json_object_get_string(v), (size_t)json_object_get_string_len(v));
        break;
    default:
        break;
    }
    return s;
}

// Three-way compare; MISSING < INT < STR across types.
int compare_scalar(const Scalar& a, const Scalar& b) {
    if (a.type != b.type) return a.type < b.type ? -1 : 1;
    if (a.type == Scalar::INT) return a.num < b.num ? -1 : (a.num > b.num ? 1 : 0);
    if (a.type == Scalar::STR) return a.str.compare(b.str) < 0 ? -1 : (a.str == b.str ? 0 : 1);
    return 0;
}

bool matches(json_object* doc, const Filter& f) {
    Scalar s = field_scalar(doc, f.field);
    if (s.type == Scalar::MISSING) return false;
    if ((s.type == Scalar::INT) != f.value.is_int) return false;

    int c = 0;
    if (s.type == Scalar::INT) c = s.num < f.value.num ? -1 : (s.num > f.value.num ? 1 : 0);
    else c = s.str.compare(f.value.str);

    switch (f.op) {
    case FilterOp::EQ: return c == 0;
    case FilterOp::NE: return c != 0;
    case FilterOp::LT: return c < 0;
    case FilterOp::LE: return c <= 0;
    case FilterOp::GT: return c > 0;
    case FilterOp::GE: return c >= 0;
    }
    return false;
}

bool matches_all(json_object* doc, const std::vector<Filter>& filters) {
    for (const auto& f : filters) {
        if (!matches(doc, f)) return false;
    }
    return true;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

bool contains_ci(json_object* v, const std::string& needle) {
    if (!v) return false;
    if (json_object_is_type(v, json_type_string)) {
        return lower(json_object_get_string(v)).find(needle) != std::string::npos;
    }
    if (json_object_is_type(v, json_type_array)) {
        const int n = (int)json_object_array_length(v);
        for (int i = 0; i < n; i++) {
            json_object* it = json_object_array_get_idx(v, i);
            if (it && json_object_is_type(it, json_type_string) &&
                lower(json_object_get_string(it)).find(needle) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

std::string doc_id(json_object* doc) {
    std::string id;
    json_get_string(doc, "id", &id);
    return id;
}

int64_t doc_version(json_object* doc) {
    int64_t v = 0;
    json_get_int64(doc, "version", &v);
    return v;
}

void set_int64(json_object* doc, const char* k, int64_t v) {
    json_object_object_add(doc, k, json_object_new_int64(v));
}

} // namespace

DocumentStore::DocumentStore(const fs::path& root, RecordKind kind,
                             std::vector<UniqueKey> unique_keys, bool fsync, AuditLog* audit)
    : dir_(root / record_kind_name(kind)),
      kind_(kind),
      unique_keys_(std::move(unique_keys)),
      fsync_(fsync),
      audit_(audit) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw Error(ErrorKind::STORAGE, "create_directories " + dir_.string() + ": " + ec.message());
}

fs::path DocumentStore::doc_path(const std::string& id) const {
    return dir_ / (id + ".json");
}

void DocumentStore::audit(const char* event, const std::string& id, int64_t version) const {
    if (!audit_) return;
    json_object* p = json_object_new_object();
    json_object_object_add(p, "kind", json_object_new_string(record_kind_name(kind_)));
    json_object_object_add(p, "id", json_object_new_string(id.c_str()));
    json_object_object_add(p, "version", json_object_new_int64(version));
    std::string err = audit_->event(event, "store", p);
    if (!err.empty()) std::cerr << "[warden] " << err << "\n";
}

JsonPtr DocumentStore::read(const std::string& id) const {
    if (!is_valid_record_id(id)) throw Error(ErrorKind::VALIDATION, "invalid record id: '" + id + "'");
    const fs::path p = doc_path(id);
    std::string body, err;
    if (!read_file(p, &body, &err)) {
        std::error_code ec;
        if (!fs::exists(p, ec)) {
            throw Error(ErrorKind::NOT_FOUND, std::string(record_kind_name(kind_)) + " " + id + " not found");
        }
        throw Error(ErrorKind::STORAGE, err);
    }
    JsonPtr doc(json_tokener_parse(body.c_str()));
    if (!doc || !json_object_is_type(doc.get(), json_type_object)) {
        throw Error(ErrorKind::STORAGE, "corrupt document: " + p.string());
    }
    return doc;
}

std::vector<JsonPtr> DocumentStore::load_all() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        const std::string fname = entry.path().filename().string();
        if (fname.starts_with(".") || !fname.ends_with(".json")) continue;
        if (!entry.is_regular_file(ec)) continue;
        ids.push_back(fname.substr(0, fname.size() - 5));
    }
    if (ec) throw Error(ErrorKind::STORAGE, "scan " + dir_.string() + ": " + ec.message());
    std::sort(ids.begin(), ids.end());

    std::vector<JsonPtr> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        if (!is_valid_record_id(id)) continue;
        try {
            out.push_back(read(id));
        } catch (const Error& e) {
            // Deleted between listing and reading.
            if (e.kind() == ErrorKind::NOT_FOUND) continue;
            throw;
        }
    }
    return out;
}

void DocumentStore::check_unique_locked(json_object* doc, const std::string& self_id) const {
    if (unique_keys_.empty()) return;
    auto all = load_all();
    for (const auto& key : unique_keys_) {
        std::vector<Filter> same;
        for (const auto& field : key) {
            Scalar s = field_scalar(doc, field);
            if (s.type == Scalar::MISSING) { same.clear(); break; }
            Filter f;
            f.field = field;
            f.value = s.type == Scalar::INT ? FieldValue::of(s.num) : FieldValue::of(s.str);
            same.push_back(std::move(f));
        }
        if (same.empty()) continue;
        for (const auto& other : all) {
            if (doc_id(other.get()) == self_id) continue;
            if (matches_all(other.get(), same)) {
                std::string desc;
                for (const auto& f : same) desc += (desc.empty() ? "" : ", ") + f.field + "=" + (f.value.is_int ? std::to_string(f.value.num) : f.value.str);
                throw Error(ErrorKind::ALREADY_EXISTS,
                            std::string(record_kind_name(kind_)) + " with " + desc + " already exists");
            }
        }
    }
}

void DocumentStore::write_locked(const std::string& id, json_object* doc) const {
    std::string err = write_file_atomic(doc_path(id), json_to_string_pretty(doc), fsync_);
    if (!err.empty()) throw Error(ErrorKind::STORAGE, "write " + id + ": " + err);
}

JsonPtr DocumentStore::create(json_object* in) {
    if (!in || !json_object_is_type(in, json_type_object)) {
        throw Error(ErrorKind::VALIDATION, "document is not an object");
    }
    std::string tag;
    if (!json_get_string(in, "kind", &tag) || tag != record_kind_name(kind_)) {
        throw Error(ErrorKind::VALIDATION, "kind tag mismatch: expected " + std::string(record_kind_name(kind_)));
    }
    const std::string id = doc_id(in);
    if (!is_valid_record_id(id)) throw Error(ErrorKind::VALIDATION, "invalid record id: '" + id + "'");

    JsonPtr doc;
    {
        json_object* copy = nullptr;
        if (json_object_deep_copy(in, &copy, nullptr) != 0 || !copy) {
            throw Error(ErrorKind::STORAGE, "json deep copy failed");
        }
        doc.reset(copy);
    }
    const int64_t ts = now_ms();
    set_int64(doc.get(), "created_at", ts);
    set_int64(doc.get(), "updated_at", ts);
    set_int64(doc.get(), "version", 1);

    {
        std::lock_guard<std::mutex> lk(mu_);
        KindLock flk(dir_);
        std::error_code ec;
        if (fs::exists(doc_path(id), ec)) {
            throw Error(ErrorKind::ALREADY_EXISTS, std::string(record_kind_name(kind_)) + " id " + id + " already exists");
        }
        check_unique_locked(doc.get(), id);
        write_locked(id, doc.get());
    }
    audit("record.create", id, 1);
    return doc;
}

JsonPtr DocumentStore::update(const std::string& id, json_object* in, int64_t expected_version) {
    if (!in || !json_object_is_type(in, json_type_object)) {
        throw Error(ErrorKind::VALIDATION, "document is not an object");
    }
    std::string tag;
    if (!json_get_string(in, "kind", &tag) || tag != record_kind_name(kind_)) {
        throw Error(ErrorKind::VALIDATION, "kind tag mismatch: expected " + std::string(record_kind_name(kind_)));
    }
    if (!doc_id(in).empty() && doc_id(in) != id) {
        throw Error(ErrorKind::VALIDATION, "record id cannot change on update");
    }

    JsonPtr doc;
    int64_t version = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        KindLock flk(dir_);
        JsonPtr current = read(id);
        const int64_t stored = doc_version(current.get());
        if (stored != expected_version) {
            throw Error(ErrorKind::CONFLICT,
                        std::string(record_kind_name(kind_)) + " " + id + ": expected version " +
                        std::to_string(expected_version) + ", stored " + std::to_string(stored));
        }

        json_object* copy = nullptr;
        if (json_object_deep_copy(in, &copy, nullptr) != 0 || !copy) {
            throw Error(ErrorKind::STORAGE, "json deep copy failed");
        }
        doc.reset(copy);

        int64_t created_at = 0;
        int64_t prev_updated = 0;
        json_get_int64(current.get(), "created_at", &created_at);
        json_get_int64(current.get(), "updated_at", &prev_updated);
        version = stored + 1;
        json_object_object_add(doc.get(), "id", json_object_new_string(id.c_str()));
        set_int64(doc.get(), "created_at", created_at);
        set_int64(doc.get(), "updated_at", std::max(now_ms(), prev_updated));
        set_int64(doc.get(), "version", version);

        check_unique_locked(doc.get(), id);
        write_locked(id, doc.get());
    }
    audit("record.update", id, version);
    return doc;
}

bool DocumentStore::remove(const std::string& id) {
    if (!is_valid_record_id(id)) throw Error(ErrorKind::VALIDATION, "invalid record id: '" + id + "'");
    bool removed = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        KindLock flk(dir_);
        std::error_code ec;
        removed = fs::remove(doc_path(id), ec);
        if (ec) throw Error(ErrorKind::STORAGE, "remove " + id + ": " + ec.message());
        if (removed && fsync_) fsync_dir(dir_);
    }
    if (removed) audit("record.delete", id, 0);
    return removed;
}

std::vector<JsonPtr> DocumentStore::query(const Query& q) const {
    std::vector<JsonPtr> rows;
    for (auto& doc : load_all()) {
        if (matches_all(doc.get(), q.filters)) rows.push_back(std::move(doc));
    }

    const bool asc = q.sort_order == SortOrder::ASC;
    const std::string order_by = q.order_by.empty() ? "created_at" : q.order_by;
    std::stable_sort(rows.begin(), rows.end(), [&](const JsonPtr& a, const JsonPtr& b) {
        int c = compare_scalar(field_scalar(a.get(), order_by), field_scalar(b.get(), order_by));
        if (c == 0) c = doc_id(a.get()).compare(doc_id(b.get()));
        return asc ? c < 0 : c > 0;
    });

    if (q.offset >= rows.size()) return {};
    if (q.offset > 0) rows.erase(rows.begin(), rows.begin() + (std::ptrdiff_t)q.offset);
    if (q.limit > 0 && rows.size() > q.limit) rows.resize(q.limit);
    return rows;
}

std::vector<JsonPtr> DocumentStore::search(const std::string& term, const std::vector<std::string>& fields) const {
    if (fields.empty()) throw Error(ErrorKind::VALIDATION, "search requires at least one field");
    const std::string needle = lower(term);
    std::vector<JsonPtr> rows;
    // load_all is id-ascending already.
    for (auto& doc : load_all()) {
        for (const auto& f : fields) {
            json_object* v = nullptr;
            if (json_object_object_get_ex(doc.get(), f.c_str(), &v) && contains_ci(v, needle)) {
                rows.push_back(std::move(doc));
                break;
            }
        }
    }
    return rows;
}

size_t DocumentStore::count(const std::vector<Filter>& filters) const {
    size_t n = 0;
    for (const auto& doc : load_all()) {
        if (matches_all(doc.get(), filters)) n++;
    }
    return n;
}

} // namespace warden
