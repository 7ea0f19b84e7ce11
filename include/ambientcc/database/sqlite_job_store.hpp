#pragma once

/**
 * SQLite-backed job queue
 *
 * Each worker process opens its own SqliteJobStore on the shared file.
 * Claims run inside BEGIN IMMEDIATE transactions so the database write
 * lock serializes them; competing writers wait up to the busy timeout.
 */

#include "job_store.hpp"
#include "sqlite_connection.hpp"
#include <mutex>

namespace ambientcc {

/**
 * SqliteJobStore - JobStore over the jobs table
 */
class SqliteJobStore : public JobStore {
public:
    SqliteJobStore() = default;
    ~SqliteJobStore() override = default;

    SqliteJobStore(const SqliteJobStore&) = delete;
    SqliteJobStore& operator=(const SqliteJobStore&) = delete;

    // Connection management
    bool open(const std::string& filename, int busy_timeout_ms = 30000);
    bool isOpen() const { return conn_.isOpen(); }
    void close();

    bool createSchema();

    // JobStore
    bool hasPending(const std::string& jobtype) override;
    bool claimNext(const std::string& jobtype, std::vector<Job>& claimed) override;
    bool mark(const Job& job, JobState state) override;
    bool markMany(const std::vector<Job>& jobs, JobState state) override;
    bool enqueue(const std::string& day, const std::string& pair,
                 const std::string& jobtype, JobState state) override;
    int64_t reset(const std::string& jobtype, bool all) override;
    int64_t count(const std::string& jobtype, JobState state) override;

    // Every job of a type (all types when empty), ordered by day and pair
    std::vector<Job> jobs(const std::string& jobtype = "");

    std::string lastError() const;

private:
    bool updateFlag(int64_t ref, JobState state);

    SqliteConnection conn_;
    mutable std::mutex mutex_;
};

using SqliteJobStorePtr = std::shared_ptr<SqliteJobStore>;

} // namespace ambientcc
