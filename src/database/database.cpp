#include "database/database.h"
#include "utils/logger.h"
#include <sqlite3.h>
#include <mutex>

namespace coursedao {
namespace database {

struct WriteBatch::Impl {
    std::vector<std::pair<std::string, std::vector<uint8_t>>> puts;
    std::vector<std::string> dels;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::vector<uint8_t>& value) {
    impl_->puts.emplace_back(key, value);
}

void WriteBatch::del(const std::string& key) {
    impl_->dels.push_back(key);
}

void WriteBatch::clear() {
    impl_->puts.clear();
    impl_->dels.clear();
}

size_t WriteBatch::size() const {
    return impl_->puts.size() + impl_->dels.size();
}

namespace {

const char* PREFIX_FILTER = " WHERE substr(key, 1, length(?1)) = ?1";

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            LOG_CAT(WARN, "database", std::string("prepare failed: ") + sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool valid() const { return stmt_ != nullptr; }
    void bindText(int idx, const std::string& text) {
        sqlite3_bind_text(stmt_, idx, text.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bindBlob(int idx, const std::vector<uint8_t>& blob) {
        sqlite3_bind_blob(stmt_, idx, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    }
    int step() { return sqlite3_step(stmt_); }

    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : std::string();
    }
    std::vector<uint8_t> blob(int col) const {
        const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
        int size = sqlite3_column_bytes(stmt_, col);
        if (!data || size <= 0) return {};
        return std::vector<uint8_t>(data, data + size);
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

}

const int BUSY_TIMEOUT_MS = 5000;

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string path;
    bool inTransaction = false;
    mutable std::mutex mtx;

    bool exec(const char* sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_CAT(WARN, "database", std::string("sqlite: ") + (errMsg ? errMsg : sqlite3_errstr(rc)));
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    bool putLocked(const std::string& key, const std::vector<uint8_t>& value) {
        Statement stmt(db, "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);");
        if (!stmt.valid()) return false;
        stmt.bindText(1, key);
        stmt.bindBlob(2, value);
        return stmt.step() == SQLITE_DONE;
    }

    bool delLocked(const std::string& key) {
        Statement stmt(db, "DELETE FROM kv WHERE key = ?;");
        if (!stmt.valid()) return false;
        stmt.bindText(1, key);
        return stmt.step() == SQLITE_DONE;
    }
};

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) return false;

    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        LOG_CAT(ERROR, "database", "cannot open " + path + ": " + sqlite3_errstr(rc));
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    if (!impl_->exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value BLOB);")) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }
    if (path != ":memory:") {
        impl_->exec("PRAGMA journal_mode=WAL;");
        impl_->exec("PRAGMA synchronous=NORMAL;");
    }

    sqlite3_busy_timeout(impl_->db, BUSY_TIMEOUT_MS);
    impl_->path = path;
    LOG_CAT(DEBUG, "database", "opened " + path);
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        if (impl_->inTransaction) impl_->exec("ROLLBACK;");
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
    impl_->inTransaction = false;
}

bool Database::put(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->putLocked(key, value);
}

bool Database::get(const std::string& key, std::vector<uint8_t>& out) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    Statement stmt(impl_->db, "SELECT value FROM kv WHERE key = ?;");
    if (!stmt.valid()) return false;
    stmt.bindText(1, key);
    if (stmt.step() != SQLITE_ROW) return false;
    out = stmt.blob(0);
    return true;
}

std::vector<uint8_t> Database::get(const std::string& key) const {
    std::vector<uint8_t> result;
    get(key, result);
    return result;
}

bool Database::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->delLocked(key);
}

bool Database::exists(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    Statement stmt(impl_->db, "SELECT 1 FROM kv WHERE key = ? LIMIT 1;");
    if (!stmt.valid()) return false;
    stmt.bindText(1, key);
    return stmt.step() == SQLITE_ROW;
}

bool Database::write(WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    const bool nested = impl_->inTransaction;
    if (!impl_->exec(nested ? "SAVEPOINT batch;" : "BEGIN IMMEDIATE TRANSACTION;")) return false;

    bool ok = true;
    for (const auto& [key, value] : batch.impl_->puts) {
        if (!impl_->putLocked(key, value)) { ok = false; break; }
    }
    for (size_t i = 0; ok && i < batch.impl_->dels.size(); i++) {
        ok = impl_->delLocked(batch.impl_->dels[i]);
    }

    if (nested) {
        if (!ok) impl_->exec("ROLLBACK TO batch;");
        if (!impl_->exec("RELEASE batch;")) ok = false;
        if (!ok) return false;
    } else if (!ok || !impl_->exec("COMMIT;")) {
        impl_->exec("ROLLBACK;");
        return false;
    }
    batch.clear();
    return true;
}

void Database::forEach(const std::string& prefix,
                       std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return;

    std::string sql = "SELECT key, value FROM kv";
    if (!prefix.empty()) sql += PREFIX_FILTER;
    sql += " ORDER BY key;";

    Statement stmt(impl_->db, sql);
    if (!stmt.valid()) return;
    if (!prefix.empty()) stmt.bindText(1, prefix);

    while (stmt.step() == SQLITE_ROW) {
        if (!fn(stmt.text(0), stmt.blob(1))) break;
    }
}

std::vector<std::string> Database::keys(const std::string& prefix) const {
    std::vector<std::string> result;
    forEach(prefix, [&result](const std::string& key, const std::vector<uint8_t>&) {
        result.push_back(key);
        return true;
    });
    return result;
}

size_t Database::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;

    std::string sql = "SELECT COUNT(*) FROM kv";
    if (!prefix.empty()) sql += PREFIX_FILTER;
    sql += ";";

    Statement stmt(impl_->db, sql);
    if (!stmt.valid()) return 0;
    if (!prefix.empty()) stmt.bindText(1, prefix);
    if (stmt.step() != SQLITE_ROW) return 0;
    return static_cast<size_t>(stmt.int64(0));
}

std::string Database::getPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->path;
}

bool Database::beginTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || impl_->inTransaction) return false;
    if (!impl_->exec("BEGIN IMMEDIATE TRANSACTION;")) return false;
    impl_->inTransaction = true;
    return true;
}

bool Database::commitTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || !impl_->inTransaction) return false;
    if (!impl_->exec("COMMIT;")) {
        impl_->exec("ROLLBACK;");
        impl_->inTransaction = false;
        return false;
    }
    impl_->inTransaction = false;
    return true;
}

bool Database::rollbackTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || !impl_->inTransaction) return false;
    impl_->inTransaction = false;
    return impl_->exec("ROLLBACK;");
}

bool Database::inTransaction() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->inTransaction;
}

Transaction::Transaction(Database& db) : db_(db), active_(db.beginTransaction()) {}

Transaction::~Transaction() {
    if (active_ && !db_.rollbackTransaction()) {
        LOG_CAT(WARN, "database", "rollback failed for " + db_.getPath());
    }
}

bool Transaction::commit() {
    if (!active_) return false;
    active_ = false;
    return db_.commitTransaction();
}

}
}
