#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "correlation_types.hpp"
#include "spectral_transform.hpp"
#include <map>
#include <vector>

namespace ambientcc {

/**
 * StackAccumulator - Collects window CCFs and stacks them per key
 *
 * Linear: arithmetic mean.
 * PWS (Schimmel & Paulssen, 1997): the mean is weighted sample by sample
 * by the phase coherence of the windows, smoothed over pws_timegate and
 * raised to pws_power.
 */
class StackAccumulator {
public:
    using WindowMap = std::map<TimePoint, SampleVector>;

    explicit StackAccumulator(const CorrelationParams& params);

    void add(const CorrelationKey& key, TimePoint window_start, SampleVector corr);

    bool empty() const { return windows_.empty(); }
    size_t keyCount() const { return windows_.size(); }
    size_t windowCount(const CorrelationKey& key) const;

    const std::map<CorrelationKey, WindowMap>& windows() const { return windows_; }

    // Every window CCF, for keep_all output
    std::vector<PairCorrelation> windowCorrelations() const;

    // One DailyStack per key holding at least one window
    std::vector<DailyStack> finalize(SpectralTransform& transform) const;

    static SampleVector linearStack(const std::vector<SampleVector>& corrs);

    static SampleVector phaseWeightedStack(const std::vector<SampleVector>& corrs,
                                           size_t timegate_samples, double power,
                                           SpectralTransform& transform);

    void clear() { windows_.clear(); }

private:
    StackMethod method_;
    double sample_rate_;
    double maxlag_;
    double pws_timegate_;
    double pws_power_;
    std::map<CorrelationKey, WindowMap> windows_;
};

} // namespace ambientcc
