#pragma once

/**
 * SQLite storage for daily and window cross-correlations
 *
 * A stack written again for the same (pair, components, filter, day)
 * replaces the earlier one, so recomputing a day is idempotent.
 */

#include "correlation_sink.hpp"
#include "sqlite_connection.hpp"
#include <mutex>
#include <vector>

namespace ambientcc {

/**
 * SqliteCorrelationStore - CorrelationSink over daily_ccf / window_ccf
 */
class SqliteCorrelationStore : public CorrelationSink {
public:
    SqliteCorrelationStore() = default;
    ~SqliteCorrelationStore() override = default;

    SqliteCorrelationStore(const SqliteCorrelationStore&) = delete;
    SqliteCorrelationStore& operator=(const SqliteCorrelationStore&) = delete;

    bool open(const std::string& filename, int busy_timeout_ms = 30000);
    bool isOpen() const { return conn_.isOpen(); }
    void close();

    bool createSchema();
    std::string schemaVersion();

    // CorrelationSink
    bool storeDailyStack(const DailyStack& stack) override;
    bool storeWindowCorrelation(const PairCorrelation& corr) override;

    // Queries. Empty arguments match everything.
    std::vector<DailyStack> dailyStacks(const std::string& day = "",
                                        const std::string& pair = "");
    std::vector<PairCorrelation> windowCorrelations(const std::string& day = "",
                                                    const std::string& pair = "");
    int64_t dailyStackCount();

    std::string lastError() const;

private:
    SqliteConnection conn_;
    mutable std::mutex mutex_;
};

using SqliteCorrelationStorePtr = std::shared_ptr<SqliteCorrelationStore>;

} // namespace ambientcc
