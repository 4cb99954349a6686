#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace vaultsync::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers
    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_null(int index);

    // Domain binders: Uuid as text, Timestamp as millis, optionals as NULL.
    Result<void, Error> bind_uuid(int index, const Uuid& id);
    Result<void, Error> bind_timestamp(int index, Timestamp at);
    Result<void, Error> bind_optional_text(int index, const std::optional<std::string>& text);
    Result<void, Error> bind_optional_timestamp(int index, const std::optional<Timestamp>& at);

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    [[nodiscard]] Uuid column_uuid(int index) const;
    [[nodiscard]] Timestamp column_timestamp(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] std::optional<Timestamp> column_optional_timestamp(int index) const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection shared by every repository.
 *
 * The connection is opened in serialized mode. Repositories additionally
 * hold lock() for the duration of one statement or transaction so that a
 * transaction started on one worker thread is not interleaved with
 * statements from another.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    /**
     * Get the raw SQLite handle (use with caution).
     */
    [[nodiscard]] sqlite3* handle() const { return db_; }

    /**
     * Connection lock. Recursive so that a repository may call another
     * repository inside its own transaction.
     */
    [[nodiscard]] std::unique_lock<std::recursive_mutex> lock() const {
        return std::unique_lock<std::recursive_mutex>(*mutex_);
    }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute a SQL statement without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Execute a SQL statement and process results with a callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto guard = lock();
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a transaction, holding the connection lock
     * throughout. Commits on success, rolls back on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());
        auto guard = lock();

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            report_rollback(rollback());
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            report_rollback(rollback());
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    /**
     * Number of rows changed by the last statement.
     */
    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    // Logs a failed rollback; the caller still sees the error that caused it.
    static void report_rollback(const Result<void, Error>& rollback_result);

    sqlite3* db_ = nullptr;
    std::unique_ptr<std::recursive_mutex> mutex_ = std::make_unique<std::recursive_mutex>();
};

// ============================================================================
// Statement helpers shared by the repositories
// ============================================================================

inline Result<void, Error> bind_value(Statement& s, int i, const Uuid& v) { return s.bind_uuid(i, v); }
inline Result<void, Error> bind_value(Statement& s, int i, Timestamp v) { return s.bind_timestamp(i, v); }
inline Result<void, Error> bind_value(Statement& s, int i, const std::optional<Timestamp>& v) {
    return s.bind_optional_timestamp(i, v);
}
inline Result<void, Error> bind_value(Statement& s, int i, const std::string& v) { return s.bind_text(i, v); }
inline Result<void, Error> bind_value(Statement& s, int i, std::string_view v) { return s.bind_text(i, v); }
inline Result<void, Error> bind_value(Statement& s, int i, const std::optional<std::string>& v) {
    return s.bind_optional_text(i, v);
}
inline Result<void, Error> bind_value(Statement& s, int i, int v) { return s.bind_int(i, v); }
inline Result<void, Error> bind_value(Statement& s, int i, int64_t v) { return s.bind_int64(i, v); }
inline Result<void, Error> bind_value(Statement& s, int i, bool v) { return s.bind_int(i, v ? 1 : 0); }

/**
 * Bind args to parameters 1..N, stopping at the first failure.
 */
template<typename... Args>
[[nodiscard]] Result<void, Error> bind_all(Statement& stmt, const Args&... args) {
    auto result = Result<void, Error>::ok();
    [[maybe_unused]] int index = 0;
    ((result.is_ok() ? (result = bind_value(stmt, ++index, args), 0) : 0), ...);
    return result;
}

/**
 * Prepare `sql` and bind `args`. The caller holds Database::lock().
 */
template<typename... Args>
[[nodiscard]] Result<Statement, Error> prepare_bound(Database& db, const std::string& sql,
                                                     const Args&... args) {
    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) {
        return stmt_result;
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = bind_all(stmt, args...);
    if (bound.is_err()) {
        return Result<Statement, Error>::err(bound.unwrap_err());
    }
    return Result<Statement, Error>::ok(std::move(stmt));
}

/**
 * Step a write statement to completion.
 */
[[nodiscard]] inline Result<void, Error> run(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

/**
 * Step through every row, mapping each with `row_fn(Statement&) -> T`.
 */
template<typename T, typename F>
[[nodiscard]] Result<std::vector<T>, Error> collect_rows(Statement& stmt, F&& row_fn) {
    std::vector<T> rows;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<T>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        rows.push_back(row_fn(stmt));
    }
    return Result<std::vector<T>, Error>::ok(std::move(rows));
}

template<typename T, typename F>
[[nodiscard]] Result<std::optional<T>, Error> first_row(Statement& stmt, F&& row_fn) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<T>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<T>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<T>, Error>::ok(row_fn(stmt));
}

/**
 * Transaction RAII guard.
 * Automatically rolls back if not explicitly committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] Result<void, Error> commit();
    void rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool active_ = false;
};

} // namespace vaultsync::storage
