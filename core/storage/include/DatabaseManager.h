#pragma once

#include <sqlite3.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace DriveSync {

/**
 * @brief Thrown for SQLite failures that callers cannot recover from locally
 */
class DatabaseException : public std::runtime_error {
public:
    explicit DatabaseException(const std::string& what, int code = SQLITE_ERROR)
        : std::runtime_error(what), code_(code) {}

    /// Primary SQLite result code (SQLITE_CONSTRAINT, SQLITE_BUSY, ...)
    int code() const { return code_ & 0xff; }

private:
    int code_;
};

/**
 * @brief RAII transaction built on SAVEPOINT so it nests; rolls back unless committed
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    void commit();
    void rollback();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    sqlite3* db_;
    bool finished_;
    std::string savepoint_;

    static std::atomic<uint64_t> counter_;
};

/**
 * @brief Prepared statement wrapper for type-safe parameter binding
 */
class PreparedStatement {
public:
    PreparedStatement(sqlite3* db, const std::string& sql);
    ~PreparedStatement();

    PreparedStatement& bind(int index, int value);
    PreparedStatement& bind(int index, int64_t value);
    PreparedStatement& bind(int index, uint64_t value);
    PreparedStatement& bind(int index, double value);
    PreparedStatement& bind(int index, const std::string& value);
    PreparedStatement& bindNull(int index);

    /**
     * @brief Advance the statement
     * @return true if a row is available, false when done
     * @throws DatabaseException on any SQLite error (including constraint violations)
     */
    bool step();

    /// Step a statement that returns no rows
    void run();

    void reset();
    void clearBindings();

    int getColumnInt(int index) const;
    int64_t getColumnInt64(int index) const;
    double getColumnDouble(int index) const;
    std::string getColumnString(int index) const;
    bool isColumnNull(int index) const;

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
};

/**
 * @brief Single SQLite connection with statement cache and migrations
 *
 * Features:
 * - One connection guarded by a recursive mutex (hold lock() across
 *   multi-statement work)
 * - Prepared statement cache
 * - WAL journal, foreign keys, busy timeout
 * - Versioned migrations recorded in schema_version
 */
class DatabaseManager {
public:
    struct Migration {
        int version;
        std::string description;
        std::string upSql;
    };

    explicit DatabaseManager(const std::string& dbPath);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /**
     * @brief Open the database, configure pragmas and run pending migrations
     * @return false if the database cannot be opened or a migration fails
     */
    bool initialize(const std::vector<Migration>& migrations = {});

    bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Lock the connection for a multi-statement unit of work
     */
    std::unique_lock<std::recursive_mutex> lock() const {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    /**
     * @brief Cached prepared statement, reset and with bindings cleared
     *
     * Caller must hold lock() while using the statement.
     * @throws DatabaseException if the SQL does not compile
     */
    std::shared_ptr<PreparedStatement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (DDL, multi-statement scripts)
     * @throws DatabaseException on failure
     */
    void execute(const std::string& sql);

    /**
     * @brief Begin a (nestable) transaction; caller must hold lock() for its lifetime
     */
    std::unique_ptr<Transaction> beginTransaction();

    int64_t lastInsertRowId() const;
    int changes() const;
    std::string getLastError() const;
    int getCurrentVersion();

    const std::string& path() const { return dbPath_; }

private:
    sqlite3* db_;
    std::string dbPath_;
    mutable std::recursive_mutex mutex_;

    std::unordered_map<std::string, std::shared_ptr<PreparedStatement>> statementCache_;

    bool enableWALMode();
    bool runMigrations(const std::vector<Migration>& migrations);
};

} // namespace DriveSync
