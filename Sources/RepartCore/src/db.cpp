#include "repart/db.hpp"
#include "repart/log.hpp"

namespace repart {

namespace {

// repart_active_statements(pattern): in-flight statements on this
// connection whose SQL mentions `pattern`, not counting the caller.
void active_statements_fn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 1 || sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_int64(ctx, 0);
        return;
    }
    auto* db = static_cast<sqlite3*>(sqlite3_user_data(ctx));
    std::string pattern = to_upper(reinterpret_cast<const char*>(sqlite3_value_text(argv[0])));

    int64_t count = 0;
    for (sqlite3_stmt* s = sqlite3_next_stmt(db, nullptr); s; s = sqlite3_next_stmt(db, s)) {
        if (!sqlite3_stmt_busy(s)) continue;
        const char* text = sqlite3_sql(s);
        if (!text) continue;
        std::string sql = to_upper(text);
        if (sql.find("REPART_ACTIVE_STATEMENTS") != std::string::npos) continue;
        if (sql.find(pattern) != std::string::npos) ++count;
    }
    sqlite3_result_int64(ctx, count);
}

} // namespace

sqlite_gateway::sqlite_gateway(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    // Set busy timeout before anything that might contend with other connections.
    sqlite3_busy_timeout(db_, 5000);
    sqlite3_progress_handler(db_, 1000, &sqlite_gateway::on_progress, this);

    rc = sqlite3_create_function_v2(db_, "repart_active_statements", 1, SQLITE_UTF8, db_,
                                    &active_statements_fn, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to register repart_active_statements: %s", error.c_str());
        throw db_error("Failed to register repart_active_statements: " + error);
    }

    execute("PRAGMA foreign_keys = ON");
    if (mode == open_mode::read_write) {
        query("PRAGMA journal_mode = WAL");
    }
    LOG_DEBUG("db", "Opened %s", path_.c_str());
}

sqlite_gateway::~sqlite_gateway() {
    if (db_) {
        if (mode_ == open_mode::read_write) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        }
        sqlite3_close_v2(db_);
    }
}

int sqlite_gateway::on_progress(void* self) {
    auto* gw = static_cast<sqlite_gateway*>(self);
    if (!gw->deadline_armed_.load()) return 0;
    if (std::chrono::steady_clock::now() < gw->deadline_) return 0;
    gw->deadline_hit_ = true;
    return 1;  // interrupts with SQLITE_INTERRUPT
}

sqlite3_stmt* sqlite_gateway::prepare(const statement& stmt) {
    sqlite3_stmt* prepared = nullptr;
    int rc = sqlite3_prepare_v2(db_, stmt.sql.c_str(), -1, &prepared, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(prepared);
        fail("Failed to prepare statement", rc, stmt);
    }

    int index = 1;
    for (const auto& param : stmt.params) {
        bind_value(prepared, index++, param);
    }

    deadline_hit_ = false;
    if (stmt.timeout.count() > 0) {
        deadline_ = std::chrono::steady_clock::now() + stmt.timeout;
        deadline_armed_ = true;
    }
    return prepared;
}

void sqlite_gateway::fail(const char* what, int rc, const statement& stmt) {
    bool timed_out = (rc == SQLITE_INTERRUPT) && deadline_hit_;
    deadline_armed_ = false;
    if (timed_out) {
        LOG_WARN("db", "Statement interrupted after %lld ms (SQL: %s)",
                 static_cast<long long>(stmt.timeout.count()), stmt.sql.c_str());
        throw statement_timeout("Statement exceeded its " + std::to_string(stmt.timeout.count()) +
                                " ms timeout", stmt.sql);
    }
    std::string error = sqlite3_errmsg(db_);
    LOG_ERROR("db", "%s: %s (SQL: %s)", what, error.c_str(), stmt.sql.c_str());
    throw db_error(std::string(what) + ": " + error, stmt.sql);
}

int64_t sqlite_gateway::execute(const statement& stmt) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("db", "execute: %s", stmt.sql.c_str());

    sqlite3_int64 before = sqlite3_total_changes64(db_);
    sqlite3_stmt* prepared = prepare(stmt);

    int rc;
    while ((rc = sqlite3_step(prepared)) == SQLITE_ROW) {
        // PRAGMAs may report their new value; nothing to collect
    }
    sqlite3_finalize(prepared);
    if (rc != SQLITE_DONE) {
        fail("Execution failed", rc, stmt);
    }
    deadline_armed_ = false;

    // Includes rows written by INSTEAD OF triggers; DDL counts nothing.
    return static_cast<int64_t>(sqlite3_total_changes64(db_) - before);
}

std::vector<row_t> sqlite_gateway::query(const statement& stmt) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("db", "query: %s", stmt.sql.c_str());

    sqlite3_stmt* prepared = prepare(stmt);

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(prepared);

    int rc;
    while ((rc = sqlite3_step(prepared)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(prepared, i);
            row[name ? name : std::to_string(i)] = extract_column(prepared, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(prepared);
    if (rc != SQLITE_DONE) {
        fail("Query failed", rc, stmt);
    }
    deadline_armed_ = false;
    return results;
}

bool sqlite_gateway::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active
    return sqlite3_get_autocommit(db_) == 0;
}

void sqlite_gateway::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t sqlite_gateway::extract_column(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const auto* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

// Transaction RAII guard
transaction::transaction(sqlite_gateway& db) : db_(db) {
    db_.execute("BEGIN IMMEDIATE");
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.execute("ROLLBACK");
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.execute("COMMIT");
    completed_ = true;
}

void transaction::rollback() {
    db_.execute("ROLLBACK");
    completed_ = true;
}

} // namespace repart
