/**
 * Unit tests for the SQLite job queue and correlation store
 */

#include "test_framework.hpp"
#include "ambientcc/database/sqlite_job_store.hpp"
#include "ambientcc/database/sqlite_correlation_store.hpp"
#include "ambientcc/database/schema.hpp"
#include "ambientcc/database/sqlite_connection.hpp"
#include <cstdio>
#include <set>
#include <thread>
#include <unistd.h>

using namespace ambientcc;
using namespace ambientcc::test;

namespace {
    // Counter for unique database names
    static int db_counter = 0;

    std::string testDbPath() {
        return "/tmp/ambientcc_test_" + std::to_string(getpid()) + "_" +
               std::to_string(++db_counter) + ".db";
    }

    // WAL mode leaves two side files next to the database
    void removeTestDb(const std::string& path) {
        std::remove(path.c_str());
        std::remove((path + "-wal").c_str());
        std::remove((path + "-shm").c_str());
    }

    TimePoint at(const std::string& day, int seconds) {
        TimePoint t;
        parseDay(day, t);
        return t + std::chrono::seconds(seconds);
    }
}

// ============================================================================
// JobState Tests
// ============================================================================

TEST(JobState, Flags) {
    ASSERT_EQ(jobStateToFlag(JobState::Todo), 'T');
    ASSERT_EQ(jobStateToFlag(JobState::InProgress), 'I');
    ASSERT_EQ(jobStateToFlag(JobState::Done), 'D');

    JobState s;
    ASSERT_TRUE(jobStateFromFlag('I', s));
    ASSERT_TRUE(s == JobState::InProgress);
    ASSERT_FALSE(jobStateFromFlag('X', s));
}

// ============================================================================
// SqliteJobStore Tests
// ============================================================================

TEST(SqliteJobStore, CreateAndOpen) {
    std::string db_path = testDbPath();

    SqliteJobStore store;
    ASSERT_FALSE(store.isOpen());
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.isOpen());
    ASSERT_TRUE(store.createSchema());
    // Creating twice is harmless
    ASSERT_TRUE(store.createSchema());

    ASSERT_FALSE(store.hasPending(schema::JOB_CC));
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::Todo), 0);

    store.close();
    ASSERT_FALSE(store.isOpen());
    removeTestDb(db_path);
}

TEST(SqliteJobStore, EnqueueIsUpsert) {
    std::string db_path = testDbPath();
    SqliteJobStore store;
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.createSchema());

    ASSERT_TRUE(store.enqueue("2024-01-01", "XX.S01_XX.S02", schema::JOB_CC, JobState::Done));
    ASSERT_TRUE(store.enqueue("2024-01-01", "XX.S01_XX.S02", schema::JOB_CC, JobState::Todo));
    ASSERT_TRUE(store.enqueue("2024-01-01", "XX.S01_XX.S02", schema::JOB_STACK, JobState::Todo));

    auto cc = store.jobs(schema::JOB_CC);
    ASSERT_EQ(cc.size(), 1u);
    ASSERT_TRUE(cc[0].state == JobState::Todo);
    ASSERT_EQ(store.jobs().size(), 2u);
    ASSERT_TRUE(store.hasPending(schema::JOB_CC));

    store.close();
    removeTestDb(db_path);
}

TEST(SqliteJobStore, ClaimTakesEarliestDayOnly) {
    std::string db_path = testDbPath();
    SqliteJobStore store;
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.createSchema());

    store.enqueue("2024-01-02", "XX.S01_XX.S02", schema::JOB_CC, JobState::Todo);
    store.enqueue("2024-01-01", "XX.S02_XX.S03", schema::JOB_CC, JobState::Todo);
    store.enqueue("2024-01-01", "XX.S01_XX.S02", schema::JOB_CC, JobState::Todo);
    store.enqueue("2024-01-01", "XX.S01_XX.S03", schema::JOB_CC, JobState::Done);
    store.enqueue("2023-12-31", "XX.S01_XX.S02", schema::JOB_STACK, JobState::Todo);

    std::vector<Job> claimed;
    ASSERT_TRUE(store.claimNext(schema::JOB_CC, claimed));
    ASSERT_EQ(claimed.size(), 2u);
    ASSERT_EQ(claimed[0].day, std::string("2024-01-01"));
    ASSERT_EQ(claimed[0].pair, std::string("XX.S01_XX.S02"));
    ASSERT_EQ(claimed[1].pair, std::string("XX.S02_XX.S03"));
    for (const auto& job : claimed) {
        ASSERT_TRUE(job.state == JobState::InProgress);
        ASSERT_EQ(job.jobtype, std::string(schema::JOB_CC));
    }
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::InProgress), 2);
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::Todo), 1);

    std::vector<Job> next;
    ASSERT_TRUE(store.claimNext(schema::JOB_CC, next));
    ASSERT_EQ(next.size(), 1u);
    ASSERT_EQ(next[0].day, std::string("2024-01-02"));

    // Nothing left is not an error
    ASSERT_TRUE(store.claimNext(schema::JOB_CC, next));
    ASSERT_TRUE(next.empty());
    ASSERT_FALSE(store.hasPending(schema::JOB_CC));
    ASSERT_TRUE(store.hasPending(schema::JOB_STACK));

    store.close();
    removeTestDb(db_path);
}

TEST(SqliteJobStore, MarkAndMarkMany) {
    std::string db_path = testDbPath();
    SqliteJobStore store;
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.createSchema());

    store.enqueue("2024-01-01", "XX.S01_XX.S02", schema::JOB_CC, JobState::Todo);
    store.enqueue("2024-01-01", "XX.S01_XX.S03", schema::JOB_CC, JobState::Todo);
    store.enqueue("2024-01-01", "XX.S02_XX.S03", schema::JOB_CC, JobState::Todo);

    std::vector<Job> claimed;
    ASSERT_TRUE(store.claimNext(schema::JOB_CC, claimed));
    ASSERT_EQ(claimed.size(), 3u);

    ASSERT_TRUE(store.mark(claimed[0], JobState::Done));
    ASSERT_TRUE(store.markMany({claimed[1], claimed[2]}, JobState::Done));
    ASSERT_TRUE(store.markMany({}, JobState::Done));

    ASSERT_EQ(store.count(schema::JOB_CC, JobState::Done), 3);
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::InProgress), 0);

    store.close();
    removeTestDb(db_path);
}

TEST(SqliteJobStore, ResetInProgressAndAll) {
    std::string db_path = testDbPath();
    SqliteJobStore store;
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.createSchema());

    store.enqueue("2024-01-01", "XX.S01_XX.S02", schema::JOB_CC, JobState::Todo);
    store.enqueue("2024-01-02", "XX.S01_XX.S02", schema::JOB_CC, JobState::Done);
    store.enqueue("2024-01-03", "XX.S01_XX.S02", schema::JOB_CC, JobState::Todo);
    std::vector<Job> claimed;
    ASSERT_TRUE(store.claimNext(schema::JOB_CC, claimed));
    ASSERT_EQ(claimed.size(), 1u);

    // An abandoned claim goes back to the queue
    ASSERT_EQ(store.reset(schema::JOB_CC, false), 1);
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::Todo), 2);
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::Done), 1);

    ASSERT_EQ(store.reset(schema::JOB_CC, true), 1);
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::Todo), 3);
    ASSERT_EQ(store.reset(schema::JOB_STACK, true), 0);

    store.close();
    removeTestDb(db_path);
}

TEST(SqliteJobStore, ClaimFailureIsReported) {
    std::string db_path = testDbPath();
    SqliteJobStore store;
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.createSchema());
    store.enqueue("2024-01-01", "XX.S01_XX.S02", schema::JOB_CC, JobState::Todo);

    // Every flag change on the jobs table now aborts
    SqliteConnection admin;
    ASSERT_TRUE(admin.open(db_path));
    ASSERT_TRUE(admin.execute(
        "CREATE TRIGGER block_updates BEFORE UPDATE ON jobs "
        "BEGIN SELECT RAISE(ABORT, 'jobs are read-only'); END"));

    std::vector<Job> claimed;
    ASSERT_FALSE(store.claimNext(schema::JOB_CC, claimed));
    ASSERT_TRUE(claimed.empty());
    ASSERT_FALSE(store.lastError().empty());

    // The failed claim was rolled back
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::Todo), 1);
    ASSERT_EQ(store.count(schema::JOB_CC, JobState::InProgress), 0);

    ASSERT_TRUE(admin.execute("DROP TRIGGER block_updates"));
    ASSERT_TRUE(store.claimNext(schema::JOB_CC, claimed));
    ASSERT_EQ(claimed.size(), 1u);

    admin.close();
    store.close();
    removeTestDb(db_path);
}

TEST(SqliteJobStore, ConcurrentClaimsNeverOverlap) {
    std::string db_path = testDbPath();
    {
        SqliteJobStore setup;
        ASSERT_TRUE(setup.open(db_path));
        ASSERT_TRUE(setup.createSchema());
        for (int d = 1; d <= 6; d++) {
            std::string day = "2024-01-0" + std::to_string(d);
            setup.enqueue(day, "XX.S01_XX.S02", schema::JOB_CC, JobState::Todo);
            setup.enqueue(day, "XX.S01_XX.S03", schema::JOB_CC, JobState::Todo);
        }
    }

    // Two connections on the same file, as two worker processes would have
    SqliteJobStore a, b;
    ASSERT_TRUE(a.open(db_path));
    ASSERT_TRUE(b.open(db_path));

    std::vector<Job> got_a, got_b;
    auto drain = [](SqliteJobStore& store, std::vector<Job>& got) {
        for (int attempt = 0; attempt < 1000; attempt++) {
            std::vector<Job> claimed;
            if (!store.claimNext(schema::JOB_CC, claimed)) break;
            if (claimed.empty()) {
                if (!store.hasPending(schema::JOB_CC)) break;
                continue;
            }
            got.insert(got.end(), claimed.begin(), claimed.end());
        }
    };
    std::thread ta(drain, std::ref(a), std::ref(got_a));
    std::thread tb(drain, std::ref(b), std::ref(got_b));
    ta.join();
    tb.join();

    ASSERT_EQ(got_a.size() + got_b.size(), 12u);
    std::set<int64_t> refs;
    for (const auto& j : got_a) refs.insert(j.ref);
    for (const auto& j : got_b) refs.insert(j.ref);
    ASSERT_EQ(refs.size(), 12u);

    // Claims are whole days
    std::set<std::string> days_a, days_b;
    for (const auto& j : got_a) days_a.insert(j.day);
    for (const auto& j : got_b) days_b.insert(j.day);
    for (const auto& d : days_a) ASSERT_EQ(days_b.count(d), 0u);

    a.close();
    b.close();
    removeTestDb(db_path);
}

// ============================================================================
// SqliteCorrelationStore Tests
// ============================================================================

TEST(SqliteCorrelationStore, SchemaVersion) {
    std::string db_path = testDbPath();
    SqliteCorrelationStore store;
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.createSchema());
    ASSERT_EQ(store.schemaVersion(), std::string(schema::SCHEMA_VERSION));
    ASSERT_EQ(store.dailyStackCount(), 0);

    store.close();
    removeTestDb(db_path);
}

TEST(SqliteCorrelationStore, StoreAndQueryDailyStacks) {
    std::string db_path = testDbPath();
    SqliteCorrelationStore store;
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.createSchema());

    DailyStack stack;
    stack.key = CorrelationKey("XX.S01_XX.S02", "ZZ", 1, "2024-01-01");
    stack.ncorr = 48;
    stack.sampling_rate = 20.0;
    stack.maxlag = 0.1;
    stack.stack_method = "linear";
    stack.data = {0.25, -1.5, 3.0, 0.0, 1e-9};
    ASSERT_TRUE(store.storeDailyStack(stack));

    DailyStack other = stack;
    other.key.day = "2024-01-02";
    other.ncorr = 10;
    ASSERT_TRUE(store.storeDailyStack(other));

    // Same key again replaces the first row
    stack.ncorr = 47;
    ASSERT_TRUE(store.storeDailyStack(stack));
    ASSERT_EQ(store.dailyStackCount(), 2);

    auto day1 = store.dailyStacks("2024-01-01");
    ASSERT_EQ(day1.size(), 1u);
    ASSERT_TRUE(day1[0].key == stack.key);
    ASSERT_EQ(day1[0].ncorr, 47u);
    ASSERT_NEAR(day1[0].sampling_rate, 20.0, 1e-12);
    ASSERT_EQ(day1[0].stack_method, std::string("linear"));
    ASSERT_EQ(day1[0].data.size(), 5u);
    ASSERT_NEAR(day1[0].data[1], -1.5, 0.0);
    ASSERT_NEAR(day1[0].data[4], 1e-9, 0.0);

    ASSERT_EQ(store.dailyStacks().size(), 2u);
    ASSERT_EQ(store.dailyStacks("", "XX.S01_XX.S02").size(), 2u);
    ASSERT_TRUE(store.dailyStacks("", "XX.S01_XX.S03").empty());

    store.close();
    removeTestDb(db_path);
}

TEST(SqliteCorrelationStore, StoreAndQueryWindowCorrelations) {
    std::string db_path = testDbPath();
    SqliteCorrelationStore store;
    ASSERT_TRUE(store.open(db_path));
    ASSERT_TRUE(store.createSchema());

    for (int w = 0; w < 3; w++) {
        PairCorrelation pc;
        pc.key = CorrelationKey("XX.S01_XX.S02", "ZZ", 1, "2024-01-01");
        pc.window_start = at("2024-01-01", w * 1800);
        pc.sampling_rate = 20.0;
        pc.data = SampleVector(5, static_cast<double>(w));
        ASSERT_TRUE(store.storeWindowCorrelation(pc));
    }

    auto wins = store.windowCorrelations("2024-01-01", "XX.S01_XX.S02");
    ASSERT_EQ(wins.size(), 3u);
    ASSERT_TRUE(wins[2].window_start == at("2024-01-01", 3600));
    ASSERT_NEAR(wins[2].data[0], 2.0, 1e-12);
    ASSERT_TRUE(store.windowCorrelations("2024-01-02").empty());

    store.close();
    removeTestDb(db_path);
}
