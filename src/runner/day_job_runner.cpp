#include "ambientcc/runner/day_job_runner.hpp"
#include "ambientcc/database/schema.hpp"
#include "ambientcc/core/log.hpp"

namespace ambientcc {

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::ConfigurationError: return "ConfigurationError";
        case RunStatus::StoreError: return "StoreError";
        case RunStatus::NoPendingJobs: return "NoPendingJobs";
        case RunStatus::NothingToDo: return "NothingToDo";
        case RunStatus::Processed: return "Processed";
    }
    return "Unknown";
}

DayJobRunner::DayJobRunner(JobStorePtr jobs, WaveformPreprocessorPtr preprocessor,
                           CorrelationSinkPtr sink, const CorrelationParams& params,
                           const std::vector<FilterBand>& bands)
    : jobs_(std::move(jobs))
    , preprocessor_(std::move(preprocessor))
    , sink_(std::move(sink))
    , params_(params)
    , bands_(usedFilterBands(bands))
    , config_ok_(true)
    , processor_(params, bands)
{
    if (!params_.validate(config_error_)) {
        config_ok_ = false;
    } else if (bands_.empty()) {
        config_ok_ = false;
        config_error_ = "no filter band configured";
    } else if (!jobs_ || !preprocessor_ || !sink_) {
        config_ok_ = false;
        config_error_ = "runner is missing a job store, preprocessor or sink";
    }
}

std::set<std::string> DayJobRunner::stationsOf(const std::vector<Job>& jobs) {
    std::set<std::string> stations;
    for (const auto& job : jobs) {
        std::string first, second;
        if (splitPairId(job.pair, first, second)) {
            stations.insert(first);
            stations.insert(second);
        } else {
            LOG_WARN("job " + std::to_string(job.ref) + ": malformed pair '" +
                     job.pair + "'");
        }
    }
    return stations;
}

RunStatus DayJobRunner::runNext() {
    if (!config_ok_) {
        LOG_ERROR("configuration error: " + config_error_);
        return RunStatus::ConfigurationError;
    }

    if (!jobs_->hasPending(schema::JOB_CC)) {
        return RunStatus::NoPendingJobs;
    }

    std::vector<Job> claimed;
    if (!jobs_->claimNext(schema::JOB_CC, claimed)) {
        stats_.claim_failures++;
        LOG_ERROR("could not claim CC jobs");
        return RunStatus::StoreError;
    }
    if (claimed.empty()) {
        // Another worker took the day between hasPending and claimNext
        LOG_DEBUG("claim lost to another worker");
        return RunStatus::Processed;
    }

    const std::string day = claimed.front().day;
    std::set<std::string> requested;
    for (const auto& job : claimed) {
        requested.insert(job.pair);
    }
    std::set<std::string> stations = stationsOf(claimed);
    std::set<char> components = params_.requiredComponents();

    LOG_INFO("processing " + day + ": " + std::to_string(claimed.size()) + " jobs, " +
             std::to_string(stations.size()) + " stations");

    WaveformBundle bundle = preprocessor_->getBundle(stations, components, day);
    if (bundle.empty() || bundle.maxChannelSamples() < params_.windowSamples()) {
        LOG_INFO(day + ": not enough data");
        stats_.days_without_data++;
        finalize(claimed, false);
        return RunStatus::NothingToDo;
    }

    DayResult result = processor_.process(bundle, day, requested);
    last_day_ = result.stats;
    store(result);

    finalize(claimed, true);
    stats_.batches++;

    LOG_INFO(day + ": done, " + std::to_string(result.stacks.size()) +
             " daily stacks from " + std::to_string(result.stats.windows_used) +
             " windows");
    return RunStatus::Processed;
}

size_t DayJobRunner::runAll() {
    size_t batches = 0;
    while (true) {
        RunStatus status = runNext();
        if (status == RunStatus::ConfigurationError ||
            status == RunStatus::StoreError ||
            status == RunStatus::NoPendingJobs) {
            break;
        }
        if (status == RunStatus::Processed || status == RunStatus::NothingToDo) {
            batches++;
        }
    }
    return batches;
}

void DayJobRunner::store(const DayResult& result) {
    if (params_.keep_all) {
        for (const auto& corr : result.window_correlations) {
            if (sink_->storeWindowCorrelation(corr)) {
                stats_.window_ccfs_stored++;
            } else {
                stats_.store_failures++;
                LOG_ERROR("could not store window CCF " + corr.key.toString());
            }
        }
    }

    if (params_.keep_days) {
        for (const auto& stack : result.stacks) {
            if (sink_->storeDailyStack(stack)) {
                stats_.stacks_stored++;
            } else {
                stats_.store_failures++;
                LOG_ERROR("could not store daily stack " + stack.key.toString());
            }
        }
    }

    if (result.stacks.empty() && result.window_correlations.empty()) {
        LOG_DEBUG("no correlation survived for the claimed pairs");
    }
}

bool DayJobRunner::finalize(const std::vector<Job>& jobs, bool enqueue_stack) {
    if (!jobs_->markMany(jobs, JobState::Done)) {
        LOG_ERROR("could not mark " + std::to_string(jobs.size()) + " jobs done");
        return false;
    }
    stats_.jobs_done += jobs.size();

    if (!enqueue_stack) return true;

    bool ok = true;
    for (const auto& job : jobs) {
        if (!jobs_->enqueue(job.day, job.pair, schema::JOB_STACK, JobState::Todo)) {
            LOG_ERROR("could not enqueue STACK job for " + job.pair + " " + job.day);
            ok = false;
        }
    }
    return ok;
}

} // namespace ambientcc
