#include "database/database.h"
#include <sqlite3.h>
#include <mutex>

namespace stakerep {
namespace database {

struct WriteBatch::Impl {
    std::vector<std::pair<std::string, std::vector<uint8_t>>> puts;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::vector<uint8_t>& value) {
    impl_->puts.emplace_back(key, value);
}

void WriteBatch::clear() {
    impl_->puts.clear();
}

size_t WriteBatch::size() const {
    return impl_->puts.size();
}

bool WriteBatch::empty() const {
    return size() == 0;
}

static const char* UPSERT_SQL =
    "INSERT INTO kv (key, value, version) VALUES (?, ?, 1) "
    "ON CONFLICT(key) DO UPDATE SET value = excluded.value, version = kv.version + 1;";

static const char* DELETE_SQL = "DELETE FROM kv WHERE key = ?;";

static std::vector<uint8_t> columnBlob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int blobSize = sqlite3_column_bytes(stmt, col);
    if (!blob || blobSize <= 0) return {};
    return std::vector<uint8_t>(static_cast<const uint8_t*>(blob),
                                static_cast<const uint8_t*>(blob) + blobSize);
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string path;
    std::string lastError;
    mutable std::mutex mtx;
    bool isOpen = false;

    bool exec(const char* sql);
    bool upsert(const std::string& key, const std::vector<uint8_t>& value);
    bool remove(const std::string& key);
    uint64_t versionOf(const std::string& key, bool& ok) const;
    bool applyBatch(WriteBatch& batch);
};

bool Database::Impl::exec(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        lastError = errMsg ? errMsg : sqlite3_errmsg(db);
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool Database::Impl::upsert(const std::string& key, const std::vector<uint8_t>& value) {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, UPSERT_SQL, -1, &stmt, nullptr) != SQLITE_OK) {
        lastError = sqlite3_errmsg(db);
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_STATIC);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) lastError = sqlite3_errmsg(db);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool Database::Impl::remove(const std::string& key) {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, DELETE_SQL, -1, &stmt, nullptr) != SQLITE_OK) {
        lastError = sqlite3_errmsg(db);
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) lastError = sqlite3_errmsg(db);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

uint64_t Database::Impl::versionOf(const std::string& key, bool& ok) const {
    ok = false;
    sqlite3_stmt* stmt;
    const char* sql = "SELECT version FROM kv WHERE key = ?;";
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return 0;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    uint64_t version = 0;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        ok = true;
    } else if (rc == SQLITE_DONE) {
        ok = true;
    }
    sqlite3_finalize(stmt);
    return version;
}

bool Database::Impl::applyBatch(WriteBatch& batch) {
    for (const auto& [key, value] : batch.impl_->puts) {
        if (!upsert(key, value)) return false;
    }
    return true;
}

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->isOpen) return false;

    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        impl_->lastError = impl_->db ? sqlite3_errmsg(impl_->db) : "sqlite3_open failed";
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    const char* createTable =
        "CREATE TABLE IF NOT EXISTS kv ("
        "key TEXT PRIMARY KEY,"
        "value BLOB,"
        "version INTEGER NOT NULL DEFAULT 1"
        ");";

    if (!impl_->exec(createTable)) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    sqlite3_busy_timeout(impl_->db, 5000);
    impl_->exec("PRAGMA journal_mode=WAL;");
    impl_->exec("PRAGMA synchronous=NORMAL;");

    impl_->path = path;
    impl_->isOpen = true;
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
    impl_->isOpen = false;
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->isOpen;
}

bool Database::put(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->upsert(key, value);
}

bool Database::put(const std::string& key, const std::string& value) {
    return put(key, std::vector<uint8_t>(value.begin(), value.end()));
}

std::vector<uint8_t> Database::get(const std::string& key) const {
    return getVersioned(key).value;
}

std::string Database::getString(const std::string& key) const {
    auto data = get(key);
    return std::string(data.begin(), data.end());
}

VersionedValue Database::getVersioned(const std::string& key, bool* ok) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    VersionedValue result;
    if (ok) *ok = false;
    if (!impl_->db) {
        impl_->lastError = "database not open";
        return result;
    }

    sqlite3_stmt* stmt;
    const char* sql = "SELECT value, version FROM kv WHERE key = ?;";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        impl_->lastError = sqlite3_errmsg(impl_->db);
        return result;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        result.value = columnBlob(stmt, 0);
        result.version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        result.found = true;
    } else if (rc != SQLITE_DONE) {
        impl_->lastError = sqlite3_errmsg(impl_->db);
        sqlite3_finalize(stmt);
        return result;
    }

    sqlite3_finalize(stmt);
    if (ok) *ok = true;
    return result;
}

uint64_t Database::getVersion(const std::string& key, bool* ok) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    bool found = false;
    uint64_t version = 0;
    if (impl_->db) {
        version = impl_->versionOf(key, found);
        if (!found) impl_->lastError = sqlite3_errmsg(impl_->db);
    } else {
        impl_->lastError = "database not open";
    }
    if (ok) *ok = found;
    return version;
}

bool Database::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->remove(key);
}

bool Database::exists(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT 1 FROM kv WHERE key = ? LIMIT 1;";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);

    return found;
}

CommitStatus Database::commitIfUnchanged(const std::map<std::string, uint64_t>& expected,
                                         WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) {
        impl_->lastError = "database not open";
        return CommitStatus::Failed;
    }

    if (!impl_->exec("BEGIN IMMEDIATE;")) {
        // another connection holds the write lock past the busy timeout
        return CommitStatus::Conflict;
    }

    for (const auto& [key, version] : expected) {
        bool ok = false;
        uint64_t current = impl_->versionOf(key, ok);
        if (!ok) {
            impl_->lastError = sqlite3_errmsg(impl_->db);
            impl_->exec("ROLLBACK;");
            return CommitStatus::Failed;
        }
        if (current != version) {
            impl_->lastError = "version mismatch on " + key;
            impl_->exec("ROLLBACK;");
            return CommitStatus::Conflict;
        }
    }

    if (!impl_->applyBatch(batch)) {
        impl_->exec("ROLLBACK;");
        return CommitStatus::Failed;
    }

    if (!impl_->exec("COMMIT;")) {
        impl_->exec("ROLLBACK;");
        return CommitStatus::Failed;
    }
    batch.clear();
    return CommitStatus::Committed;
}

bool Database::forEach(const std::string& prefix,
                       std::function<bool(const std::string&, const std::vector<uint8_t>&, uint64_t)> fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) {
        impl_->lastError = "database not open";
        return false;
    }

    sqlite3_stmt* stmt;
    std::string sql = "SELECT key, value, version FROM kv";
    if (!prefix.empty()) {
        sql += " WHERE substr(key, 1, ?) = ?";
    }
    sql += " ORDER BY key;";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        impl_->lastError = sqlite3_errmsg(impl_->db);
        return false;
    }

    if (!prefix.empty()) {
        sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
        sqlite3_bind_text(stmt, 2, prefix.c_str(), -1, SQLITE_STATIC);
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::string key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        std::vector<uint8_t> value = columnBlob(stmt, 1);
        uint64_t version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        if (!fn(key, value, version)) {
            rc = SQLITE_DONE;
            break;
        }
    }
    if (rc != SQLITE_DONE) impl_->lastError = sqlite3_errmsg(impl_->db);

    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::vector<std::string> Database::keys(const std::string& prefix) const {
    std::vector<std::string> result;
    forEach(prefix, [&result](const std::string& key, const std::vector<uint8_t>&, uint64_t) {
        result.push_back(key);
        return true;
    });
    return result;
}

size_t Database::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;

    sqlite3_stmt* stmt;
    std::string sql = "SELECT COUNT(*) FROM kv";
    if (!prefix.empty()) {
        sql += " WHERE substr(key, 1, ?) = ?";
    }
    sql += ";";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return 0;

    if (!prefix.empty()) {
        sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
        sqlite3_bind_text(stmt, 2, prefix.c_str(), -1, SQLITE_STATIC);
    }

    size_t cnt = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        cnt = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return cnt;
}

std::string Database::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

}
}
