#pragma once

#include "../core/types.hpp"
#include "../core/waveform.hpp"
#include "../core/waveform_bundle.hpp"
#include "../core/config.hpp"
#include "window_slicer.hpp"
#include <vector>

namespace ambientcc {

// One channel's samples within one window
using ChannelFrame = Waveform;

/**
 * GapFilterResult - What happened to a window in the gap filter
 */
struct GapFilterResult {
    bool accepted = false;
    size_t gapped_channels = 0;     // dropped for internal gaps
    size_t short_channels = 0;      // dropped for a wrong sample count
    size_t sample_count = 0;        // common count of the surviving frames
    std::string reason;             // set when the window is discarded
};

/**
 * GapFilter - Builds clean, equal-length channel frames for a window
 *
 * Channels with an internal gap are dropped (no interpolation), the
 * remaining ones must all hold the largest sample count present, and the
 * window must be long enough to hold +-maxlag. Survivors are demeaned.
 */
class GapFilter {
public:
    explicit GapFilter(const CorrelationParams& params);

    GapFilterResult apply(const WaveformBundle& bundle, const Window& window,
                          std::vector<ChannelFrame>& frames) const;

    // Minimum number of samples a window needs (exclusive bound)
    double minimumSamples() const;

private:
    double maxlag_;
    double sample_rate_;
};

} // namespace ambientcc
