#include "ambientcc/core/types.hpp"
#include <ctime>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace ambientcc {

bool parseDay(const std::string& day, TimePoint& start) {
    int year = 0, month = 0, mday = 0;
    char trailing = 0;
    if (std::sscanf(day.c_str(), "%4d-%2d-%2d%c", &year, &month, &mday, &trailing) != 3) {
        return false;
    }
    if (month < 1 || month > 12 || mday < 1 || mday > 31) return false;

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = mday;
    time_t t = timegm(&tm);
    if (t == static_cast<time_t>(-1)) return false;

    start = std::chrono::system_clock::from_time_t(t);
    return true;
}

std::string formatDay(TimePoint t) {
    time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

std::string formatTime(TimePoint t) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        t.time_since_epoch()).count();
    int64_t secs = us / 1000000;
    int64_t frac = us % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }
    time_t tt = static_cast<time_t>(secs);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (frac != 0) {
        oss << "." << std::setfill('0') << std::setw(6) << frac;
    }
    return oss.str();
}

} // namespace ambientcc
