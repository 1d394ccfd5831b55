#include "DatabaseManager.h"
#include "Logger.h"

namespace DriveSync {

std::atomic<uint64_t> Transaction::counter_{0};

// Transaction Implementation
Transaction::Transaction(sqlite3* db) : db_(db), finished_(false) {
    savepoint_ = "dsync_txn_" + std::to_string(++counter_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, ("SAVEPOINT " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        Logger::instance().log(LogLevel::ERROR, "Failed to create transaction savepoint: " + message, "DatabaseManager");
        throw DatabaseException("Failed to begin transaction: " + message);
    }
}

Transaction::~Transaction() {
    if (!finished_) {
        rollback();
    }
}

void Transaction::commit() {
    if (finished_) {
        return;
    }
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, ("RELEASE " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        Logger::instance().log(LogLevel::ERROR, "Failed to commit transaction: " + message, "DatabaseManager");
        throw DatabaseException("Failed to commit transaction: " + message);
    }
    finished_ = true;
}

void Transaction::rollback() {
    if (finished_) {
        return;
    }
    finished_ = true;
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, ("ROLLBACK TO " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        Logger::instance().log(LogLevel::WARN, "Rollback failed: " + std::string(errMsg ? errMsg : ""), "DatabaseManager");
    }
    if (errMsg) {
        sqlite3_free(errMsg);
        errMsg = nullptr;
    }
    sqlite3_exec(db_, ("RELEASE " + savepoint_).c_str(), nullptr, nullptr, &errMsg);
    if (errMsg) sqlite3_free(errMsg);
}

// PreparedStatement Implementation
PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql)
    : db_(db), stmt_(nullptr), sql_(sql) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw DatabaseException("Failed to prepare statement: " + sql + " - " + sqlite3_errmsg(db_));
    }
}

PreparedStatement::~PreparedStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

PreparedStatement& PreparedStatement::bind(int index, int value) {
    sqlite3_bind_int(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, uint64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, double value) {
    sqlite3_bind_double(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
}

PreparedStatement& PreparedStatement::bindNull(int index) {
    sqlite3_bind_null(stmt_, index);
    return *this;
}

bool PreparedStatement::step() {
    int result = sqlite3_step(stmt_);
    if (result == SQLITE_ROW) {
        return true;
    }
    if (result == SQLITE_DONE) {
        return false;
    }
    std::string message = sqlite3_errmsg(db_);
    sqlite3_reset(stmt_);
    throw DatabaseException("Statement failed (" + std::to_string(result) + "): " + message, result);
}

void PreparedStatement::run() {
    while (step()) {
    }
}

void PreparedStatement::reset() {
    sqlite3_reset(stmt_);
}

void PreparedStatement::clearBindings() {
    sqlite3_clear_bindings(stmt_);
}

int PreparedStatement::getColumnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t PreparedStatement::getColumnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double PreparedStatement::getColumnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string PreparedStatement::getColumnString(int index) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? std::string(text) : std::string();
}

bool PreparedStatement::isColumnNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// DatabaseManager Implementation
DatabaseManager::DatabaseManager(const std::string& dbPath)
    : db_(nullptr), dbPath_(dbPath) {
}

DatabaseManager::~DatabaseManager() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    statementCache_.clear();
    if (db_) {
        sqlite3_close(db_);
    }
}

bool DatabaseManager::initialize(const std::vector<Migration>& migrations) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Logger::instance().log(LogLevel::INFO, "Opening database: " + dbPath_, "DatabaseManager");

    if (sqlite3_open(dbPath_.c_str(), &db_) != SQLITE_OK) {
        Logger::instance().log(LogLevel::ERROR, "Failed to open database: " + dbPath_ + " - " +
                               (db_ ? sqlite3_errmsg(db_) : "out of memory"), "DatabaseManager");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    if (!enableWALMode()) {
        Logger::instance().log(LogLevel::WARN, "Failed to enable WAL mode", "DatabaseManager");
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        execute("PRAGMA foreign_keys=ON");
    } catch (const DatabaseException& e) {
        Logger::instance().log(LogLevel::WARN, e.what(), "DatabaseManager");
    }

    if (!runMigrations(migrations)) {
        Logger::instance().log(LogLevel::ERROR, "Failed to run migrations", "DatabaseManager");
        statementCache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    Logger::instance().log(LogLevel::DEBUG, "Database initialized: " + dbPath_ +
                           " (schema v" + std::to_string(getCurrentVersion()) + ")", "DatabaseManager");
    return true;
}

bool DatabaseManager::enableWALMode() {
    char* errMsg = nullptr;
    int result = sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, &errMsg);
    if (result != SQLITE_OK) {
        if (errMsg) {
            Logger::instance().log(LogLevel::ERROR, "Failed to enable WAL mode: " + std::string(errMsg), "DatabaseManager");
            sqlite3_free(errMsg);
        }
        return false;
    }

    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);
    return true;
}

bool DatabaseManager::runMigrations(const std::vector<Migration>& migrations) {
    try {
        execute("CREATE TABLE IF NOT EXISTS schema_version (version INTEGER PRIMARY KEY, description TEXT)");

        int currentVersion = getCurrentVersion();

        for (const auto& migration : migrations) {
            if (migration.version <= currentVersion) {
                continue;
            }
            Logger::instance().log(LogLevel::INFO, "Running migration " + std::to_string(migration.version) +
                                   ": " + migration.description, "DatabaseManager");

            auto txn = beginTransaction();
            execute(migration.upSql);
            auto stmt = prepare("INSERT OR REPLACE INTO schema_version (version, description) VALUES (?, ?)");
            stmt->bind(1, migration.version).bind(2, migration.description);
            stmt->run();
            txn->commit();
        }
    } catch (const DatabaseException& e) {
        Logger::instance().log(LogLevel::ERROR, std::string("Migration failed: ") + e.what(), "DatabaseManager");
        return false;
    }
    return true;
}

int DatabaseManager::getCurrentVersion() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare("SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
    int version = stmt->step() ? stmt->getColumnInt(0) : 0;
    stmt->reset();
    return version;
}

std::shared_ptr<PreparedStatement> DatabaseManager::prepare(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        throw DatabaseException("Database is not open: " + dbPath_);
    }

    auto it = statementCache_.find(sql);
    if (it != statementCache_.end()) {
        it->second->reset();
        it->second->clearBindings();
        return it->second;
    }

    auto stmt = std::make_shared<PreparedStatement>(db_, sql);
    statementCache_[sql] = stmt;
    return stmt;
}

void DatabaseManager::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        throw DatabaseException("Database is not open: " + dbPath_);
    }
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        throw DatabaseException("Failed to execute SQL: " + message);
    }
}

std::unique_ptr<Transaction> DatabaseManager::beginTransaction() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        throw DatabaseException("Database is not open: " + dbPath_);
    }
    return std::make_unique<Transaction>(db_);
}

int64_t DatabaseManager::lastInsertRowId() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return sqlite3_last_insert_rowid(db_);
}

int DatabaseManager::changes() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return sqlite3_changes(db_);
}

std::string DatabaseManager::getLastError() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

} // namespace DriveSync
