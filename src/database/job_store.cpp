#include "ambientcc/database/job_store.hpp"
#include "ambientcc/database/schema.hpp"

namespace ambientcc {

char jobStateToFlag(JobState state) {
    switch (state) {
        case JobState::Todo: return schema::FLAG_TODO;
        case JobState::InProgress: return schema::FLAG_IN_PROGRESS;
        case JobState::Done: return schema::FLAG_DONE;
    }
    return schema::FLAG_TODO;
}

bool jobStateFromFlag(char flag, JobState& state) {
    switch (flag) {
        case schema::FLAG_TODO: state = JobState::Todo; return true;
        case schema::FLAG_IN_PROGRESS: state = JobState::InProgress; return true;
        case schema::FLAG_DONE: state = JobState::Done; return true;
        default: return false;
    }
}

std::string jobStateToString(JobState state) {
    switch (state) {
        case JobState::Todo: return "Todo";
        case JobState::InProgress: return "InProgress";
        case JobState::Done: return "Done";
    }
    return "Unknown";
}

} // namespace ambientcc
