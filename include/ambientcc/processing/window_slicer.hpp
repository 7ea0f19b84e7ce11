#pragma once

#include "../core/types.hpp"
#include "../core/waveform_bundle.hpp"
#include "../core/config.hpp"

namespace ambientcc {

/**
 * Window - One correlation window, half-open [start, end)
 */
struct Window {
    TimePoint start;
    TimePoint end;
    size_t index = 0;
};

/**
 * WindowSlicer - Lazy, restartable sequence of overlapping windows
 *
 * Window starts advance by corr_duration * (1 - overlap). Every window
 * spans the full corr_duration: iteration ends with the last window that
 * fits before the end of data coverage and within analysis_duration.
 * Windows in which no trace has samples are skipped.
 */
class WindowSlicer {
public:
    WindowSlicer(const WaveformBundle& bundle, const CorrelationParams& params,
                 TimePoint day_start);

    // Advances to the next window with data; false when exhausted
    bool next(Window& window);

    // Restarts the sequence from the first window
    void reset();

    // Total number of candidate window positions, empty ones included
    size_t candidateCount() const;

private:
    bool hasData(TimePoint start, TimePoint end) const;

    const WaveformBundle& bundle_;
    Duration length_;
    Duration step_;
    TimePoint first_start_;
    TimePoint limit_;
    size_t position_;
    size_t emitted_;
};

} // namespace ambientcc
