#pragma once

#include "../core/types.hpp"
#include <string>
#include <tuple>

namespace ambientcc {

/**
 * CorrelationKey - Identifies one daily CCF
 */
struct CorrelationKey {
    std::string pair_id;      // NET.STA1_NET.STA2
    std::string components;   // e.g. ZZ, ZN
    int filter_id = 0;
    std::string day;          // YYYY-MM-DD

    CorrelationKey() = default;
    CorrelationKey(const std::string& pair, const std::string& comps,
                   int filter, const std::string& d)
        : pair_id(pair), components(comps), filter_id(filter), day(d) {}

    bool operator<(const CorrelationKey& other) const {
        return std::tie(pair_id, components, filter_id, day) <
               std::tie(other.pair_id, other.components, other.filter_id, other.day);
    }

    bool operator==(const CorrelationKey& other) const {
        return pair_id == other.pair_id && components == other.components &&
               filter_id == other.filter_id && day == other.day;
    }

    std::string toString() const;
};

/**
 * PairCorrelation - One window's CCF for a key
 */
struct PairCorrelation {
    CorrelationKey key;
    TimePoint window_start;
    double sampling_rate = 0;
    SampleVector data;        // 2 * maxlag_samples + 1 values
};

/**
 * DailyStack - All window CCFs of a key combined into one
 */
struct DailyStack {
    CorrelationKey key;
    size_t ncorr = 0;
    double sampling_rate = 0;
    double maxlag = 0;
    std::string stack_method;
    SampleVector data;

    size_t sampleCount() const { return data.size(); }
};

/**
 * Split "NET.STA1_NET.STA2" into its two stations
 */
bool splitPairId(const std::string& pair_id, std::string& first, std::string& second);

std::string makePairId(const std::string& netsta1, const std::string& netsta2);

} // namespace ambientcc
