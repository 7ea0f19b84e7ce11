#pragma once

/**
 * Thin RAII layer over the SQLite C API shared by the job and
 * correlation stores.
 */

#include <cstdint>
#include <string>
#include <vector>

// Forward declare sqlite3 types
struct sqlite3;
struct sqlite3_stmt;

namespace ambientcc {

/**
 * SqliteConnection - One database handle
 */
class SqliteConnection {
public:
    SqliteConnection();
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    // Opens the file (creating it), enables WAL and a busy timeout
    bool open(const std::string& filename, int busy_timeout_ms = 30000);
    bool isOpen() const { return db_ != nullptr; }
    void close();

    bool execute(const char* sql);

    // Transaction support. begin(true) takes the write lock immediately.
    bool begin(bool immediate = false);
    bool commit();
    void rollback();

    int64_t changes() const;

    sqlite3* handle() const { return db_; }

    const std::string& lastError() const { return last_error_; }
    void setError(const std::string& context);

private:
    sqlite3* db_;
    std::string last_error_;
};

/**
 * Statement - Prepared statement, finalized on destruction
 */
class Statement {
public:
    Statement(SqliteConnection& conn, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }

    // 1-based parameter indices
    void bind(int idx, const std::string& value);
    void bind(int idx, int64_t value);
    void bind(int idx, int value) { bind(idx, static_cast<int64_t>(value)); }
    void bind(int idx, double value);
    void bindBlob(int idx, const std::vector<double>& values);

    // SQLITE_ROW -> true with a row available; SQLITE_DONE -> false
    bool step();
    bool failed() const { return failed_; }

    // Runs a statement that returns no rows
    bool run();

    std::string columnText(int col) const;
    int64_t columnInt(int col) const;
    double columnDouble(int col) const;
    std::vector<double> columnBlob(int col) const;

    void reset();

private:
    SqliteConnection& conn_;
    sqlite3_stmt* stmt_;
    bool failed_;
};

} // namespace ambientcc
