#include "ambientcc/database/sqlite_connection.hpp"
#include "ambientcc/core/log.hpp"
#include <sqlite3.h>
#include <cstring>

namespace ambientcc {

// SqliteConnection

SqliteConnection::SqliteConnection()
    : db_(nullptr)
{
}

SqliteConnection::~SqliteConnection() {
    close();
}

bool SqliteConnection::open(const std::string& filename, int busy_timeout_ms) {
    if (db_) {
        close();
    }

    int rc = sqlite3_open(filename.c_str(), &db_);
    if (rc != SQLITE_OK) {
        setError("Failed to open database " + filename);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);

    // Several worker processes share the file
    execute("PRAGMA journal_mode = WAL;");
    execute("PRAGMA synchronous = NORMAL;");
    return true;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteConnection::execute(const char* sql) {
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        if (errmsg) {
            last_error_ = errmsg;
            sqlite3_free(errmsg);
        } else {
            last_error_ = sqlite3_errstr(rc);
        }
        return false;
    }
    return true;
}

bool SqliteConnection::begin(bool immediate) {
    return execute(immediate ? "BEGIN IMMEDIATE TRANSACTION" : "BEGIN TRANSACTION");
}

bool SqliteConnection::commit() {
    return execute("COMMIT");
}

void SqliteConnection::rollback() {
    if (db_ && !sqlite3_get_autocommit(db_)) {
        execute("ROLLBACK");
    }
}

int64_t SqliteConnection::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

void SqliteConnection::setError(const std::string& context) {
    last_error_ = context + ": " + (db_ ? sqlite3_errmsg(db_) : "no database");
    LOG_ERROR("database error: " + last_error_);
}

// Statement

Statement::Statement(SqliteConnection& conn, const char* sql)
    : conn_(conn)
    , stmt_(nullptr)
    , failed_(false)
{
    if (!conn_.isOpen() ||
        sqlite3_prepare_v2(conn_.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        conn_.setError("Failed to prepare statement");
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        failed_ = true;
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::bind(int idx, const std::string& value) {
    if (stmt_) sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::bind(int idx, int64_t value) {
    if (stmt_) sqlite3_bind_int64(stmt_, idx, value);
}

void Statement::bind(int idx, double value) {
    if (stmt_) sqlite3_bind_double(stmt_, idx, value);
}

void Statement::bindBlob(int idx, const std::vector<double>& values) {
    if (!stmt_) return;
    sqlite3_bind_blob(stmt_, idx, values.data(),
                      static_cast<int>(values.size() * sizeof(double)), SQLITE_TRANSIENT);
}

bool Statement::step() {
    if (!stmt_) return false;
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc != SQLITE_DONE) {
        conn_.setError("Statement failed");
        failed_ = true;
    }
    return false;
}

bool Statement::run() {
    step();
    return !failed_;
}

std::string Statement::columnText(int col) const {
    const unsigned char* txt = sqlite3_column_text(stmt_, col);
    return txt ? reinterpret_cast<const char*>(txt) : "";
}

int64_t Statement::columnInt(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

double Statement::columnDouble(int col) const {
    return sqlite3_column_double(stmt_, col);
}

std::vector<double> Statement::columnBlob(int col) const {
    const void* blob = sqlite3_column_blob(stmt_, col);
    int bytes = sqlite3_column_bytes(stmt_, col);
    std::vector<double> values(bytes / sizeof(double));
    if (blob && !values.empty()) {
        std::memcpy(values.data(), blob, values.size() * sizeof(double));
    }
    return values;
}

void Statement::reset() {
    if (stmt_) {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }
    failed_ = !stmt_;
}

} // namespace ambientcc
