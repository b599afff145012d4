#pragma once

#ifdef __cplusplus

#include <sqlite3.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace strata {

/// SQLite failure. code() is the SQLite result code, or SQLITE_ERROR when
/// the failure did not come from a SQLite call.
class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg, int code = SQLITE_ERROR)
        : std::runtime_error(msg), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

// SQLite column values
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// ============================================================================
// statement - one prepared statement, finalized on destruction
// ============================================================================

class statement {
public:
    statement(sqlite3* db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    /// Binds params to positions 1..n.
    void bind_all(const std::vector<column_value_t>& params);
    void bind(int index, const column_value_t& value);

    /// Advances to the next row. Returns false once the statement is done.
    bool step();

    int column_count() const;
    const char* column_name(int index) const;
    column_value_t column(int index) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

// ============================================================================
// database - one SQLite connection
// ============================================================================

class database {
public:
    enum class open_mode {
        read_write,  ///< Create if missing, read and write (default)
        read_only    ///< Existing database, no writes
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write,
                      int busy_timeout_ms = 5000);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    /// Runs a statement that returns no rows.
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// First column of the first row as an integer; nullopt when there is no
    /// row or the value is not an integer.
    std::optional<int64_t> query_int(const std::string& sql,
                                     const std::vector<column_value_t>& params = {});

    bool table_exists(const std::string& name);

    /// Rows modified by the most recent INSERT, UPDATE or DELETE.
    int changes() const;

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }
    open_mode mode() const { return mode_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
};

// RAII transaction guard. Rolls back unless commit() was called.
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace strata

#endif // __cplusplus
