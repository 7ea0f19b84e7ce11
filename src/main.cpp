/**
 * ambientcc - Ambient noise cross-correlation worker
 *
 * Main application that:
 * 1. Claims one day of CC jobs at a time from the shared job database
 * 2. Builds the day's waveform bundle (synthetic noise source)
 * 3. Correlates every requested station pair per filter band and window
 * 4. Stacks the window correlations into daily CCFs and stores them
 * 5. Marks the jobs done and queues STACK jobs for the next stage
 *
 * Several workers can be started at once with -t; each runs in its own
 * process with its own database connection.
 */

#include <iostream>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <vector>

#include "ambientcc/core/types.hpp"
#include "ambientcc/core/config.hpp"
#include "ambientcc/core/log.hpp"
#include "ambientcc/core/synthetic_source.hpp"
#include "ambientcc/database/schema.hpp"
#include "ambientcc/database/sqlite_job_store.hpp"
#include "ambientcc/database/sqlite_correlation_store.hpp"
#include "ambientcc/processing/correlation_types.hpp"
#include "ambientcc/runner/day_job_runner.hpp"

using namespace ambientcc;

// Global shutdown flag
std::atomic<bool> g_running(true);

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>    Configuration file (default: ambientcc.conf)\n";
    std::cout << "  -d, --database <file>  Job and correlation database (overrides config)\n";
    std::cout << "  -t, --threads <n>      Number of worker processes (default: 1)\n";
    std::cout << "  --add-job <day> <pair> Queue a CC job; day may be FIRST:LAST,\n";
    std::cout << "                         pair may be 'all' (every synthetic station pair)\n";
    std::cout << "  --reset                Put InProgress CC jobs back to Todo\n";
    std::cout << "  --all                  With --reset: put every CC job back to Todo\n";
    std::cout << "  --status               Print job and result counts\n";
    std::cout << "  -v, --verbose          Debug logging\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "\n";
    std::cout << "Without --add-job, --reset or --status the pending CC jobs are computed.\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progname << " --add-job 2024-01-01:2024-01-07 all\n";
    std::cout << "  " << progname << " -t 4\n";
}

/**
 * AmbientCC Application
 */
class AmbientCC {
public:
    AmbientCC() : startup_jitter_(1.0) {}

    bool loadConfig(const std::string& filename) {
        if (!config_.loadFromFile(filename)) {
            LOG_WARN("config file not found: " + filename + ", using defaults");
        }

        std::string error;
        if (!loadCorrelationParams(config_, params_, error) ||
            !loadFilterBands(config_, bands_, error)) {
            LOG_ERROR("configuration error: " + error);
            return false;
        }
        if (usedFilterBands(bands_).empty()) {
            LOG_ERROR("configuration error: no filter band configured");
            return false;
        }
        if (!SyntheticNoiseSource::fromConfig(config_, params_.cc_sampling_rate,
                                              synthetic_, stations_, error)) {
            LOG_ERROR("configuration error: " + error);
            return false;
        }

        database_file_ = config_.getString("database.file", "ambientcc.sqlite");
        startup_jitter_ = config_.getDouble("runner.startup_jitter", 1.0);
        if (startup_jitter_ < 0) startup_jitter_ = 0;
        return true;
    }

    void setDatabase(const std::string& filename) { database_file_ = filename; }

    bool initDatabase() {
        SqliteJobStore jobs;
        SqliteCorrelationStore results;
        if (!jobs.open(database_file_) || !jobs.createSchema() ||
            !results.open(database_file_) || !results.createSchema()) {
            LOG_ERROR("cannot initialize database " + database_file_);
            return false;
        }
        return true;
    }

    // Queues CC jobs for a day (or FIRST:LAST range) and a pair (or all)
    bool addJobs(const std::string& days, const std::string& pair) {
        std::vector<std::string> day_list;
        if (!expandDays(days, day_list)) {
            LOG_ERROR("invalid day or range: " + days);
            return false;
        }

        std::vector<std::string> pairs;
        if (pair == "all") {
            for (auto a = stations_.begin(); a != stations_.end(); ++a) {
                auto b = a;
                if (!params_.autocorr) ++b;
                for (; b != stations_.end(); ++b) {
                    pairs.push_back(makePairId(*a, *b));
                }
            }
            if (pairs.empty()) {
                LOG_ERROR("no synthetic stations configured");
                return false;
            }
        } else {
            std::string first, second;
            if (!splitPairId(pair, first, second)) {
                LOG_ERROR("pair must be NET.STA1_NET.STA2, got '" + pair + "'");
                return false;
            }
            pairs.push_back(pair);
        }

        SqliteJobStore jobs;
        if (!jobs.open(database_file_)) return false;

        size_t added = 0;
        for (const auto& day : day_list) {
            for (const auto& p : pairs) {
                if (!jobs.enqueue(day, p, schema::JOB_CC, JobState::Todo)) {
                    return false;
                }
                added++;
            }
        }
        std::cout << "Queued " << added << " CC jobs" << std::endl;
        return true;
    }

    bool resetJobs(bool all) {
        SqliteJobStore jobs;
        if (!jobs.open(database_file_)) return false;
        int64_t n = jobs.reset(schema::JOB_CC, all);
        if (n < 0) return false;
        std::cout << "Reset " << n << " CC jobs to Todo" << std::endl;
        return true;
    }

    bool printStatus() {
        SqliteJobStore jobs;
        SqliteCorrelationStore results;
        if (!jobs.open(database_file_) || !results.open(database_file_)) return false;

        std::cout << "Database: " << database_file_ << "\n";
        for (const char* type : {schema::JOB_CC, schema::JOB_STACK}) {
            std::cout << "  " << type << ":";
            for (JobState state : {JobState::Todo, JobState::InProgress, JobState::Done}) {
                std::cout << " " << jobStateToString(state) << "="
                          << jobs.count(type, state);
            }
            std::cout << "\n";
        }
        std::cout << "  Daily stacks: " << results.dailyStackCount() << std::endl;
        return true;
    }

    // Runs one worker per process; returns the process exit status
    int run(int workers) {
        if (workers <= 1) {
            return work(0);
        }

        std::vector<pid_t> children;
        for (int i = 0; i < workers; i++) {
            pid_t pid = fork();
            if (pid < 0) {
                LOG_ERROR("fork failed for worker " + std::to_string(i));
                break;
            }
            if (pid == 0) {
                _exit(work(i));
            }
            children.push_back(pid);
        }

        int status = children.empty() ? 1 : 0;
        for (pid_t pid : children) {
            int child_status = 0;
            if (waitpid(pid, &child_status, 0) < 0) {
                status = 1;
                continue;
            }
            if (!WIFEXITED(child_status) || WEXITSTATUS(child_status) != 0) {
                LOG_ERROR("worker " + std::to_string(pid) + " failed");
                status = 1;
            }
        }
        return status;
    }

private:
    int work(int index) {
        // Stagger worker start so the first claims do not all collide
        if (index > 0 && startup_jitter_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(
                static_cast<int64_t>(index * startup_jitter_ * 1000)));
        }

        auto jobs = std::make_shared<SqliteJobStore>();
        auto results = std::make_shared<SqliteCorrelationStore>();
        if (!jobs->open(database_file_) || !results->open(database_file_)) {
            return 1;
        }
        auto source = std::make_shared<SyntheticNoiseSource>(synthetic_);

        DayJobRunner runner(jobs, source, results, params_, bands_);
        LOG_INFO("worker " + std::to_string(index) + " started");

        while (g_running) {
            RunStatus status = runner.runNext();
            if (status == RunStatus::ConfigurationError ||
                status == RunStatus::StoreError) {
                return 1;
            }
            if (status == RunStatus::NoPendingJobs) break;
        }

        const RunnerStatistics& stats = runner.statistics();
        LOG_INFO("worker " + std::to_string(index) + " finished: " +
                 std::to_string(stats.jobs_done) + " jobs, " +
                 std::to_string(stats.stacks_stored) + " daily stacks");
        return stats.store_failures > 0 ? 1 : 0;
    }

    static bool expandDays(const std::string& spec, std::vector<std::string>& days) {
        std::string first = spec, last = spec;
        auto colon = spec.find(':');
        if (colon != std::string::npos) {
            first = spec.substr(0, colon);
            last = spec.substr(colon + 1);
        }

        TimePoint t0, t1;
        if (!parseDay(first, t0) || !parseDay(last, t1) || t1 < t0) return false;
        for (TimePoint t = t0; t <= t1;
             t += secondsToDuration(constants::SECONDS_PER_DAY)) {
            days.push_back(formatDay(t));
        }
        return true;
    }

    Config config_;
    CorrelationParams params_;
    std::vector<FilterBand> bands_;
    SyntheticOptions synthetic_;
    std::set<std::string> stations_;
    std::string database_file_;
    double startup_jitter_;
};

int main(int argc, char* argv[]) {
    // Set up signal handlers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    // Parse command line arguments
    std::string config_file = "ambientcc.conf";
    std::string database_file;
    int workers = 1;
    std::string add_day, add_pair;
    bool add_job = false;
    bool reset = false;
    bool reset_all = false;
    bool status = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            database_file = argv[++i];
        } else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            try {
                workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid worker count: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--add-job" && i + 2 < argc) {
            add_job = true;
            add_day = argv[++i];
            add_pair = argv[++i];
        } else if (arg == "--reset") {
            reset = true;
        } else if (arg == "--all") {
            reset_all = true;
        } else if (arg == "--status") {
            status = true;
        } else if (arg == "-v" || arg == "--verbose") {
            Logger::setLevel(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    AmbientCC app;

    if (!app.loadConfig(config_file)) {
        return 1;
    }
    if (!database_file.empty()) {
        app.setDatabase(database_file);
    }
    if (!app.initDatabase()) {
        return 1;
    }

    if (add_job) {
        return app.addJobs(add_day, add_pair) ? 0 : 1;
    }
    if (reset) {
        return app.resetJobs(reset_all) ? 0 : 1;
    }
    if (status) {
        return app.printStatus() ? 0 : 1;
    }

    return app.run(workers);
}
