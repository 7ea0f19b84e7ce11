#include "ambientcc/database/sqlite_job_store.hpp"
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

std::string flagString(JobState state) {
    return std::string(1, jobStateToFlag(state));
}

Job readJob(const Statement& stmt) {
    Job job;
    job.ref = stmt.columnInt(0);
    job.day = stmt.columnText(1);
    job.pair = stmt.columnText(2);
    job.jobtype = stmt.columnText(3);
    std::string flag = stmt.columnText(4);
    if (flag.empty() || !jobStateFromFlag(flag[0], job.state)) {
        LOG_WARN("job " + std::to_string(job.ref) + " has unknown flag '" + flag + "'");
    }
    return job;
}

} // anonymous namespace

bool SqliteJobStore::open(const std::string& filename, int busy_timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_.open(filename, busy_timeout_ms)) {
        return false;
    }
    LOG_DEBUG("job store opened: " + filename);
    return true;
}

void SqliteJobStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    conn_.close();
}

bool SqliteJobStore::createSchema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_.execute(schema::JobRow::CREATE_SQL) ||
        !conn_.execute(schema::JobRow::INDEX_SQL)) {
        LOG_ERROR("failed to create jobs table: " + conn_.lastError());
        return false;
    }
    return true;
}

bool SqliteJobStore::hasPending(const std::string& jobtype) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_,
        "SELECT 1 FROM jobs WHERE jobtype = ? AND flag = 'T' LIMIT 1");
    if (!stmt.ok()) return false;
    stmt.bind(1, jobtype);
    return stmt.step();
}

bool SqliteJobStore::claimNext(const std::string& jobtype, std::vector<Job>& claimed) {
    std::lock_guard<std::mutex> lock(mutex_);
    claimed.clear();

    // Takes the write lock up front so no other worker can select the
    // same rows between our SELECT and UPDATE
    if (!conn_.begin(true)) {
        LOG_ERROR("claim: cannot begin transaction: " + conn_.lastError());
        return false;
    }

    std::string day;
    {
        Statement stmt(conn_,
            "SELECT day FROM jobs WHERE jobtype = ? AND flag = 'T' "
            "ORDER BY day LIMIT 1");
        if (!stmt.ok()) {
            conn_.rollback();
            return false;
        }
        stmt.bind(1, jobtype);
        if (stmt.step()) {
            day = stmt.columnText(0);
        } else if (stmt.failed()) {
            LOG_ERROR("claim: cannot select pending day: " + conn_.lastError());
            conn_.rollback();
            return false;
        }
    }

    if (day.empty()) {
        conn_.rollback();
        return true;
    }

    {
        Statement stmt(conn_,
            "SELECT ref, day, pair, jobtype, flag FROM jobs "
            "WHERE jobtype = ? AND day = ? AND flag = 'T' ORDER BY pair");
        if (!stmt.ok()) {
            conn_.rollback();
            return false;
        }
        stmt.bind(1, jobtype);
        stmt.bind(2, day);
        while (stmt.step()) {
            claimed.push_back(readJob(stmt));
        }
        if (stmt.failed()) {
            LOG_ERROR("claim: cannot select jobs of " + day + ": " + conn_.lastError());
            claimed.clear();
            conn_.rollback();
            return false;
        }
    }

    {
        Statement stmt(conn_,
            "UPDATE jobs SET flag = 'I', lastmod = ? "
            "WHERE jobtype = ? AND day = ? AND flag = 'T'");
        stmt.bind(1, nowEpoch());
        stmt.bind(2, jobtype);
        stmt.bind(3, day);
        if (!stmt.ok() || !stmt.run() ||
            conn_.changes() != static_cast<int64_t>(claimed.size())) {
            LOG_ERROR("claim: update of day " + day + " failed: " + conn_.lastError());
            claimed.clear();
            conn_.rollback();
            return false;
        }
    }

    if (!conn_.commit()) {
        LOG_ERROR("claim: commit failed: " + conn_.lastError());
        claimed.clear();
        conn_.rollback();
        return false;
    }

    for (auto& job : claimed) {
        job.state = JobState::InProgress;
    }
    LOG_DEBUG("claimed " + std::to_string(claimed.size()) + " " + jobtype +
              " jobs for " + day);
    return true;
}

bool SqliteJobStore::updateFlag(int64_t ref, JobState state) {
    Statement stmt(conn_, "UPDATE jobs SET flag = ?, lastmod = ? WHERE ref = ?");
    if (!stmt.ok()) return false;
    stmt.bind(1, flagString(state));
    stmt.bind(2, nowEpoch());
    stmt.bind(3, ref);
    return stmt.run();
}

bool SqliteJobStore::mark(const Job& job, JobState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    return updateFlag(job.ref, state);
}

bool SqliteJobStore::markMany(const std::vector<Job>& jobs, JobState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs.empty()) return true;

    if (!conn_.begin(true)) {
        LOG_ERROR("markMany: cannot begin transaction: " + conn_.lastError());
        return false;
    }
    for (const auto& job : jobs) {
        if (!updateFlag(job.ref, state)) {
            conn_.rollback();
            return false;
        }
    }
    if (!conn_.commit()) {
        LOG_ERROR("markMany: commit failed: " + conn_.lastError());
        conn_.rollback();
        return false;
    }
    return true;
}

bool SqliteJobStore::enqueue(const std::string& day, const std::string& pair,
                             const std::string& jobtype, JobState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_, R"(
        INSERT INTO jobs (day, pair, jobtype, flag, lastmod)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(day, pair, jobtype)
        DO UPDATE SET flag = excluded.flag, lastmod = excluded.lastmod
    )");
    if (!stmt.ok()) return false;
    stmt.bind(1, day);
    stmt.bind(2, pair);
    stmt.bind(3, jobtype);
    stmt.bind(4, flagString(state));
    stmt.bind(5, nowEpoch());
    return stmt.run();
}

int64_t SqliteJobStore::reset(const std::string& jobtype, bool all) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = all
        ? "UPDATE jobs SET flag = 'T', lastmod = ? WHERE jobtype = ? AND flag != 'T'"
        : "UPDATE jobs SET flag = 'T', lastmod = ? WHERE jobtype = ? AND flag = 'I'";
    Statement stmt(conn_, sql);
    if (!stmt.ok()) return -1;
    stmt.bind(1, nowEpoch());
    stmt.bind(2, jobtype);
    if (!stmt.run()) return -1;
    return conn_.changes();
}

int64_t SqliteJobStore::count(const std::string& jobtype, JobState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_, "SELECT COUNT(*) FROM jobs WHERE jobtype = ? AND flag = ?");
    if (!stmt.ok()) return -1;
    stmt.bind(1, jobtype);
    stmt.bind(2, flagString(state));
    if (!stmt.step()) return -1;
    return stmt.columnInt(0);
}

std::vector<Job> SqliteJobStore::jobs(const std::string& jobtype) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> result;
    const char* sql = jobtype.empty()
        ? "SELECT ref, day, pair, jobtype, flag FROM jobs ORDER BY day, pair, jobtype"
        : "SELECT ref, day, pair, jobtype, flag FROM jobs WHERE jobtype = ? "
          "ORDER BY day, pair";
    Statement stmt(conn_, sql);
    if (!stmt.ok()) return result;
    if (!jobtype.empty()) stmt.bind(1, jobtype);
    while (stmt.step()) {
        result.push_back(readJob(stmt));
    }
    return result;
}

std::string SqliteJobStore::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conn_.lastError();
}

} // namespace ambientcc
