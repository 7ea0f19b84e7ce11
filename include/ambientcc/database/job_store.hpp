#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ambientcc {

/**
 * JobState - Lifecycle of a queued job
 *
 * Todo -> InProgress (claimed by exactly one runner) -> Done
 */
enum class JobState {
    Todo,
    InProgress,
    Done
};

char jobStateToFlag(JobState state);
bool jobStateFromFlag(char flag, JobState& state);
std::string jobStateToString(JobState state);

/**
 * Job - One (day, pair, jobtype) unit of work
 */
struct Job {
    int64_t ref = -1;
    std::string day;        // YYYY-MM-DD
    std::string pair;       // NET.STA1_NET.STA2
    std::string jobtype;    // CC, STACK, ...
    JobState state = JobState::Todo;
};

/**
 * JobStore - Persistent job table shared by cooperating workers
 *
 * claimNext() must be atomic across processes: every Todo job of the
 * earliest pending day is flipped to InProgress in one step, and no two
 * callers can receive the same job.
 */
class JobStore {
public:
    virtual ~JobStore() = default;

    virtual bool hasPending(const std::string& jobtype) = 0;

    // Fills claimed with all Todo jobs of the earliest pending day, now
    // InProgress. claimed is empty if nothing was left or another worker
    // won the race. Returns false only when the store itself failed.
    virtual bool claimNext(const std::string& jobtype, std::vector<Job>& claimed) = 0;

    virtual bool mark(const Job& job, JobState state) = 0;
    virtual bool markMany(const std::vector<Job>& jobs, JobState state) = 0;

    // Creates the job, or sets the state of an existing one
    virtual bool enqueue(const std::string& day, const std::string& pair,
                         const std::string& jobtype, JobState state) = 0;

    // InProgress -> Todo, or every job -> Todo when all is set.
    // Returns the number of rows changed, -1 on failure.
    virtual int64_t reset(const std::string& jobtype, bool all) = 0;

    virtual int64_t count(const std::string& jobtype, JobState state) = 0;
};

using JobStorePtr = std::shared_ptr<JobStore>;

} // namespace ambientcc
