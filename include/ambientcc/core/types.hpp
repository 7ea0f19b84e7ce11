#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <cmath>
#include <complex>
#include <limits>

namespace ambientcc {

// Time handling - using microsecond precision
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

// Sample data type
using Sample = double;
using SampleVector = std::vector<Sample>;

// Frequency domain
using Complex = std::complex<double>;
using Spectrum = std::vector<Complex>;

// Stream identifier (SEED convention)
struct StreamID {
    std::string network;     // 2 char
    std::string station;     // 5 char max
    std::string location;    // 2 char
    std::string channel;     // 3 char (e.g., BHZ, HHN)

    StreamID() = default;
    StreamID(const std::string& net, const std::string& sta,
             const std::string& loc, const std::string& chan)
        : network(net), station(sta), location(loc), channel(chan) {}

    std::string toString() const {
        return network + "." + station + "." + location + "." + channel;
    }

    // NET.STA, the station part of a pair identifier
    std::string netsta() const {
        return network + "." + station;
    }

    // Component code is the last character of the channel (Z, N, E, ...)
    char component() const {
        return channel.empty() ? '?' : channel.back();
    }

    bool operator==(const StreamID& other) const {
        return network == other.network && station == other.station &&
               location == other.location && channel == other.channel;
    }

    bool operator!=(const StreamID& other) const {
        return !(*this == other);
    }

    bool operator<(const StreamID& other) const {
        if (network != other.network) return network < other.network;
        if (station != other.station) return station < other.station;
        if (location != other.location) return location < other.location;
        return channel < other.channel;
    }
};

// Seconds <-> Duration helpers
inline Duration secondsToDuration(double seconds) {
    return Duration(static_cast<int64_t>(std::llround(seconds * 1e6)));
}

inline double durationToSeconds(Duration d) {
    return d.count() * 1e-6;
}

// Calendar day handling ("YYYY-MM-DD", UTC)
bool parseDay(const std::string& day, TimePoint& start);
std::string formatDay(TimePoint t);
std::string formatTime(TimePoint t);

// Constants
namespace constants {
    constexpr double SECONDS_PER_DAY = 86400.0;
    constexpr double TAPER_FRACTION = 0.04;
    constexpr size_t DEFAULT_NAPOD = 100;
}

} // namespace ambientcc
