#include "storage/database.hpp"
#include "core/log.hpp"

namespace vaultsync::storage {

namespace {

// Wait this long on a locked database file before reporting SQLITE_BUSY.
constexpr int BUSY_TIMEOUT_MS = 5000;

Result<void, Error> bind_result(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(storage_error(what, rc));
    }
    return Result<void, Error>::ok();
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return bind_result(
        sqlite3_bind_text(stmt_.get(), index, text.data(),
                          static_cast<int>(text.size()), SQLITE_TRANSIENT),
        "Failed to bind text");
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return bind_result(sqlite3_bind_int(stmt_.get(), index, value), "Failed to bind int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return bind_result(sqlite3_bind_int64(stmt_.get(), index, value), "Failed to bind int64");
}

Result<void, Error> Statement::bind_null(int index) {
    return bind_result(sqlite3_bind_null(stmt_.get(), index), "Failed to bind null");
}

Result<void, Error> Statement::bind_uuid(int index, const Uuid& id) {
    return bind_text(index, id.to_string());
}

Result<void, Error> Statement::bind_timestamp(int index, Timestamp at) {
    return bind_int64(index, at.millis());
}

Result<void, Error> Statement::bind_optional_text(int index,
                                                  const std::optional<std::string>& text) {
    return text ? bind_text(index, *text) : bind_null(index);
}

Result<void, Error> Statement::bind_optional_timestamp(int index,
                                                       const std::optional<Timestamp>& at) {
    return at ? bind_timestamp(index, *at) : bind_null(index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Uuid Statement::column_uuid(int index) const {
    return Uuid::parse(column_text(index)).value_or(Uuid{});
}

Timestamp Statement::column_timestamp(int index) const {
    return Timestamp(column_int64(index));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

std::optional<Timestamp> Statement::column_optional_timestamp(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_timestamp(index);
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(storage_error(
        std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : "unknown"), rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(storage_error("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), mutex_(std::move(other.mutex_)) {
    other.db_ = nullptr;
    other.mutex_ = std::make_unique<std::recursive_mutex>();
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
        std::swap(mutex_, other.mutex_);
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : "Unknown error";
        if (db) sqlite3_close(db);
        return Result<Database, Error>::err(storage_error(error, rc));
    }

    Database database(db);
    sqlite3_busy_timeout(db, BUSY_TIMEOUT_MS);

    auto fk = database.execute("PRAGMA foreign_keys = ON;");
    if (fk.is_err()) {
        return Result<Database, Error>::err(fk.unwrap_err());
    }

    // In-memory databases report "memory" here; only files get WAL.
    if (path != ":memory:") {
        auto wal = database.execute("PRAGMA journal_mode = WAL;");
        if (wal.is_err()) {
            qCWarning(vaultsyncStorageLog) << "WAL unavailable for" << path.c_str()
                                           << ":" << wal.unwrap_err().message.c_str();
        }
    }

    qCDebug(vaultsyncStorageLog) << "opened database" << path.c_str();
    return Result<Database, Error>::ok(std::move(database));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(storage_error("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(storage_error(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(storage_error("Database not open", SQLITE_MISUSE));
    }
    auto guard = lock();
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(storage_error(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

void Database::report_rollback(const Result<void, Error>& rollback_result) {
    if (rollback_result.is_err()) {
        qCWarning(vaultsyncStorageLog) << "rollback failed:"
                                       << rollback_result.unwrap_err().message.c_str();
    }
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db) : db_(db), lock_(db.lock()) {
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
    if (!active_) {
        qCWarning(vaultsyncStorageLog) << "begin transaction failed:"
                                       << result.unwrap_err().message.c_str();
    }
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        rollback();
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(storage_error("No active transaction"));
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

void TransactionGuard::rollback() {
    if (active_) {
        active_ = false;
        auto result = db_.rollback();
        if (result.is_err()) {
            qCWarning(vaultsyncStorageLog) << "rollback failed:"
                                           << result.unwrap_err().message.c_str();
        }
    }
}

} // namespace vaultsync::storage
