#include "strata/db.hpp"
#include "strata/log.hpp"
#include <type_traits>
#include <utility>

namespace strata {

namespace {

[[noreturn]] void fail(sqlite3* db, int rc, const char* what, const std::string& sql) {
    std::string error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    LOG_ERROR("db", "%s: %s (SQL: %s)", what, error.c_str(), sql.c_str());
    throw db_error(std::string(what) + ": " + error + " (SQL: " + sql + ")", rc);
}

} // namespace

// ============================================================================
// statement
// ============================================================================

statement::statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        fail(db_, rc, "Failed to prepare statement", sql_);
    }
}

statement::~statement() {
    sqlite3_finalize(stmt_);
}

void statement::bind_all(const std::vector<column_value_t>& params) {
    int index = 1;
    for (const auto& param : params) {
        bind(index++, param);
    }
}

void statement::bind(int index, const column_value_t& value) {
    int rc = std::visit([&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt_, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
            // A zero-length blob still binds as BLOB, not NULL
            if (v.empty()) return sqlite3_bind_zeroblob(stmt_, index, 0);
            return sqlite3_bind_blob(stmt_, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        fail(db_, rc, "Failed to bind parameter", sql_);
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail(db_, rc, "Execution failed", sql_);
}

int statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

const char* statement::column_name(int index) const {
    return sqlite3_column_name(stmt_, index);
}

column_value_t statement::column(int index) const {
    switch (sqlite3_column_type(stmt_, index)) {
        case SQLITE_INTEGER:
            return sqlite3_column_int64(stmt_, index);
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, index);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
            auto size = static_cast<size_t>(sqlite3_column_bytes(stmt_, index));
            return text ? std::string(text, size) : std::string();
        }
        case SQLITE_BLOB: {
            const auto* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
            auto size = static_cast<size_t>(sqlite3_column_bytes(stmt_, index));
            if (bytes == nullptr) return std::vector<uint8_t>();
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        default:
            return nullptr;
    }
}

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path, open_mode mode, int busy_timeout_ms)
    : path_(path), mode_(mode) {
    // Serialized threading mode. Transactions spanning several calls still
    // need the caller's own lock.
    int flags = SQLITE_OPEN_FULLMUTEX;
    flags |= mode == open_mode::read_only ? SQLITE_OPEN_READONLY
                                          : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open %s: %s", path_.c_str(), error.c_str());
        throw db_error("Failed to open database " + path_ + ": " + error, rc);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    if (mode_ == open_mode::read_write && path_ != ":memory:") {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    LOG_DEBUG("db", "Opened %s (%s)", path_.c_str(),
              mode_ == open_mode::read_only ? "read-only" : "read-write");
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)), mode_(other.mode_) {}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        mode_ = other.mode_;
    }
    return *this;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);
    // PRAGMA journal_mode reports the new mode as a row
    while (stmt.step()) {
    }
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);

    std::vector<row_t> rows;
    int count = stmt.column_count();
    while (stmt.step()) {
        row_t row;
        for (int i = 0; i < count; ++i) {
            row[stmt.column_name(i)] = stmt.column(i);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::optional<int64_t> database::query_int(const std::string& sql,
                                           const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);
    if (!stmt.step()) return std::nullopt;

    column_value_t value = stmt.column(0);
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    return std::nullopt;
}

bool database::table_exists(const std::string& name) {
    statement stmt(db_, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind(1, name);
    return stmt.step();
}

int database::changes() const {
    return sqlite3_changes(db_);
}

void database::begin_transaction() {
    // IMMEDIATE takes the write lock up front so writers queue on the busy timeout
    execute(mode_ == open_mode::read_only ? "BEGIN" : "BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (completed_) return;
    try {
        db_.rollback();
    } catch (const db_error& e) {
        LOG_WARN("db", "Rollback in transaction destructor failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace strata
