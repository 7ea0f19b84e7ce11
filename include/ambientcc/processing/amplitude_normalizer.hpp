#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "gap_filter.hpp"
#include <vector>

namespace ambientcc {

/**
 * AmplitudeNormalizer - Windsorizing and edge taper of channel frames
 *
 * windsorizing == -1: 1-bit (sign) normalization
 * windsorizing == k > 0: clip to +-k * RMS of the samples inside the
 *                        1st-99th percentile band
 * windsorizing == 0: no clipping
 *
 * A Hann taper of constants::TAPER_FRACTION of the frame length is then
 * applied at both ends.
 */
class AmplitudeNormalizer {
public:
    explicit AmplitudeNormalizer(double windsorizing,
                                 double taper_fraction = constants::TAPER_FRACTION);

    void apply(ChannelFrame& frame) const;
    void apply(std::vector<ChannelFrame>& frames) const;

    // Clip level used for the given samples (0 when not clipping)
    double clipLevel(const SampleVector& data) const;

    // Percentile with linear interpolation between order statistics
    static double percentile(SampleVector data, double pct);

    // RMS of the samples in [lo, hi]
    static double bandedRms(const SampleVector& data, double lo, double hi);

private:
    double windsorizing_;
    double taper_fraction_;
};

} // namespace ambientcc
