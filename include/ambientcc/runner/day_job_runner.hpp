#pragma once

/**
 * Job loop of a correlation worker
 *
 * Any number of workers, each in its own process with its own store
 * connection, may run the loop against the same job table. The only
 * coordination between them is JobStore::claimNext().
 */

#include "../core/config.hpp"
#include "../core/preprocessor.hpp"
#include "../database/job_store.hpp"
#include "../database/correlation_sink.hpp"
#include "day_processor.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace ambientcc {

enum class RunStatus {
    ConfigurationError,  // nothing claimed, the worker should stop
    StoreError,          // the job store failed to claim; the worker should stop
    NoPendingJobs,       // queue empty
    NothingToDo,         // claimed day had too little data; jobs finalized
    Processed            // day processed, or a lost claim race
};

std::string runStatusToString(RunStatus status);

/**
 * RunnerStatistics - Totals over the lifetime of a runner
 */
struct RunnerStatistics {
    size_t batches = 0;
    size_t jobs_done = 0;
    size_t days_without_data = 0;
    size_t stacks_stored = 0;
    size_t window_ccfs_stored = 0;
    size_t store_failures = 0;
    size_t claim_failures = 0;
};

/**
 * DayJobRunner - Claims CC jobs one day at a time and computes them
 */
class DayJobRunner {
public:
    DayJobRunner(JobStorePtr jobs, WaveformPreprocessorPtr preprocessor,
                 CorrelationSinkPtr sink, const CorrelationParams& params,
                 const std::vector<FilterBand>& bands);

    // Claims and processes the next day of CC jobs
    RunStatus runNext();

    // Calls runNext() while CC jobs are pending. Returns the number of
    // batches processed; stops early on a configuration or store error.
    size_t runAll();

    const RunnerStatistics& statistics() const { return stats_; }

    // Statistics of the most recently processed day
    const DayStatistics& lastDay() const { return last_day_; }

    // NET.STA of both ends of every job pair
    static std::set<std::string> stationsOf(const std::vector<Job>& jobs);

private:
    bool finalize(const std::vector<Job>& jobs, bool enqueue_stack);
    void store(const DayResult& result);

    JobStorePtr jobs_;
    WaveformPreprocessorPtr preprocessor_;
    CorrelationSinkPtr sink_;
    CorrelationParams params_;
    std::vector<FilterBand> bands_;
    bool config_ok_;
    std::string config_error_;
    DayProcessor processor_;
    RunnerStatistics stats_;
    DayStatistics last_day_;
};

using DayJobRunnerPtr = std::shared_ptr<DayJobRunner>;

} // namespace ambientcc
