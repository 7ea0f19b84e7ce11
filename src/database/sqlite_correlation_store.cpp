#include "ambientcc/database/sqlite_correlation_store.hpp"
#include "ambientcc/database/schema.hpp"
#include "ambientcc/core/log.hpp"
#include <chrono>

namespace ambientcc {

namespace {

double nowEpoch() {
    using namespace std::chrono;
    return duration_cast<microseconds>(
        system_clock::now().time_since_epoch()).count() / 1e6;
}

double toEpoch(TimePoint t) {
    return std::chrono::duration_cast<Duration>(t.time_since_epoch()).count() / 1e6;
}

TimePoint fromEpoch(double seconds) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        secondsToDuration(seconds)));
}

} // anonymous namespace

bool SqliteCorrelationStore::open(const std::string& filename, int busy_timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_.open(filename, busy_timeout_ms)) {
        return false;
    }
    LOG_DEBUG("correlation store opened: " + filename);
    return true;
}

void SqliteCorrelationStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    conn_.close();
}

bool SqliteCorrelationStore::createSchema() {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* tables[] = {
        schema::MetaRow::CREATE_SQL,
        schema::DailyStackRow::CREATE_SQL,
        schema::WindowCorrelationRow::CREATE_SQL,
    };
    for (const char* sql : tables) {
        if (!conn_.execute(sql)) {
            LOG_ERROR("failed to create correlation tables: " + conn_.lastError());
            return false;
        }
    }

    Statement stmt(conn_,
        "INSERT OR IGNORE INTO meta (key, value) VALUES ('schema_version', ?)");
    if (!stmt.ok()) return false;
    stmt.bind(1, std::string(schema::SCHEMA_VERSION));
    return stmt.run();
}

std::string SqliteCorrelationStore::schemaVersion() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_, "SELECT value FROM meta WHERE key = 'schema_version'");
    if (!stmt.ok() || !stmt.step()) return "";
    return stmt.columnText(0);
}

bool SqliteCorrelationStore::storeDailyStack(const DailyStack& stack) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_, R"(
        INSERT OR REPLACE INTO daily_ccf
            (pair, components, filterid, day, nsamp, ncorr, samprate,
             maxlag, stackmethod, data, lddate)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmt.ok()) return false;

    stmt.bind(1, stack.key.pair_id);
    stmt.bind(2, stack.key.components);
    stmt.bind(3, stack.key.filter_id);
    stmt.bind(4, stack.key.day);
    stmt.bind(5, static_cast<int64_t>(stack.sampleCount()));
    stmt.bind(6, static_cast<int64_t>(stack.ncorr));
    stmt.bind(7, stack.sampling_rate);
    stmt.bind(8, stack.maxlag);
    stmt.bind(9, stack.stack_method);
    stmt.bindBlob(10, stack.data);
    stmt.bind(11, nowEpoch());

    if (!stmt.run()) {
        LOG_ERROR("failed to store daily stack " + stack.key.toString());
        return false;
    }
    return true;
}

bool SqliteCorrelationStore::storeWindowCorrelation(const PairCorrelation& corr) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_, R"(
        INSERT OR REPLACE INTO window_ccf
            (pair, components, filterid, day, wstart, nsamp, samprate, data, lddate)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmt.ok()) return false;

    stmt.bind(1, corr.key.pair_id);
    stmt.bind(2, corr.key.components);
    stmt.bind(3, corr.key.filter_id);
    stmt.bind(4, corr.key.day);
    stmt.bind(5, toEpoch(corr.window_start));
    stmt.bind(6, static_cast<int64_t>(corr.data.size()));
    stmt.bind(7, corr.sampling_rate);
    stmt.bindBlob(8, corr.data);
    stmt.bind(9, nowEpoch());

    if (!stmt.run()) {
        LOG_ERROR("failed to store window CCF " + corr.key.toString() +
                  " at " + formatTime(corr.window_start));
        return false;
    }
    return true;
}

std::vector<DailyStack> SqliteCorrelationStore::dailyStacks(const std::string& day,
                                                            const std::string& pair) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyStack> result;

    Statement stmt(conn_, R"(
        SELECT pair, components, filterid, day, ncorr, samprate, maxlag,
               stackmethod, data
        FROM daily_ccf
        WHERE (?1 = '' OR day = ?1) AND (?2 = '' OR pair = ?2)
        ORDER BY day, pair, components, filterid
    )");
    if (!stmt.ok()) return result;
    stmt.bind(1, day);
    stmt.bind(2, pair);

    while (stmt.step()) {
        DailyStack stack;
        stack.key = CorrelationKey(stmt.columnText(0), stmt.columnText(1),
                                   static_cast<int>(stmt.columnInt(2)),
                                   stmt.columnText(3));
        stack.ncorr = static_cast<size_t>(stmt.columnInt(4));
        stack.sampling_rate = stmt.columnDouble(5);
        stack.maxlag = stmt.columnDouble(6);
        stack.stack_method = stmt.columnText(7);
        stack.data = stmt.columnBlob(8);
        result.push_back(std::move(stack));
    }
    return result;
}

std::vector<PairCorrelation> SqliteCorrelationStore::windowCorrelations(
        const std::string& day, const std::string& pair) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PairCorrelation> result;

    Statement stmt(conn_, R"(
        SELECT pair, components, filterid, day, wstart, samprate, data
        FROM window_ccf
        WHERE (?1 = '' OR day = ?1) AND (?2 = '' OR pair = ?2)
        ORDER BY day, pair, components, filterid, wstart
    )");
    if (!stmt.ok()) return result;
    stmt.bind(1, day);
    stmt.bind(2, pair);

    while (stmt.step()) {
        PairCorrelation corr;
        corr.key = CorrelationKey(stmt.columnText(0), stmt.columnText(1),
                                  static_cast<int>(stmt.columnInt(2)),
                                  stmt.columnText(3));
        corr.window_start = fromEpoch(stmt.columnDouble(4));
        corr.sampling_rate = stmt.columnDouble(5);
        corr.data = stmt.columnBlob(6);
        result.push_back(std::move(corr));
    }
    return result;
}

int64_t SqliteCorrelationStore::dailyStackCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_, "SELECT COUNT(*) FROM daily_ccf");
    if (!stmt.ok() || !stmt.step()) return -1;
    return stmt.columnInt(0);
}

std::string SqliteCorrelationStore::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conn_.lastError();
}

} // namespace ambientcc
