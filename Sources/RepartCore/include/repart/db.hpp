#pragma once

#ifdef __cplusplus

#include "gateway.hpp"
#include "dialect.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <atomic>
#include <chrono>
#include <mutex>

namespace repart {

/// Gateway over one SQLite connection, used for rehearsals and tests.
///
/// Statements are serialized on the connection. A statement with a timeout
/// is interrupted from SQLite's progress handler once the deadline passes
/// and reported as statement_timeout.
///
/// The connection registers `repart_active_statements(pattern)`, which
/// counts other in-flight statements on this connection whose SQL contains
/// `pattern` (case-insensitive). sqlite_dialect::active_sessions uses it.
class sqlite_gateway : public gateway {
public:
    enum class open_mode {
        read_write,  ///< Create if missing (default)
        read_only
    };

    explicit sqlite_gateway(const std::string& path, open_mode mode = open_mode::read_write);
    ~sqlite_gateway() override;

    sqlite_gateway(const sqlite_gateway&) = delete;
    sqlite_gateway& operator=(const sqlite_gateway&) = delete;

    int64_t execute(const statement& stmt) override;
    std::vector<row_t> query(const statement& stmt) override;
    const dialect& sql_dialect() const override { return dialect_; }

    // Convenience overloads for plain SQL
    int64_t execute(const std::string& sql, const std::vector<column_value_t>& params = {}) {
        return execute(statement(sql, params));
    }
    std::vector<row_t> query(const std::string& sql, const std::vector<column_value_t>& params = {}) {
        return query(statement(sql, params));
    }

    bool is_in_transaction() const;

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3_stmt* prepare(const statement& stmt);
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    [[noreturn]] void fail(const char* what, int rc, const statement& stmt);

    static int on_progress(void* self);

    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    sqlite_dialect dialect_;

    std::mutex mutex_;
    std::chrono::steady_clock::time_point deadline_{};
    std::atomic<bool> deadline_armed_{false};
    bool deadline_hit_ = false;
};

// RAII transaction guard. Rolls back unless committed.
class transaction {
public:
    explicit transaction(sqlite_gateway& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    sqlite_gateway& db_;
    bool completed_ = false;
};

} // namespace repart

#endif // __cplusplus
