#include "ambientcc/processing/window_slicer.hpp"
#include <algorithm>

namespace ambientcc {

WindowSlicer::WindowSlicer(const WaveformBundle& bundle, const CorrelationParams& params,
                           TimePoint day_start)
    : bundle_(bundle)
    , length_(secondsToDuration(params.corr_duration))
    , step_(secondsToDuration(params.windowStep()))
    , position_(0)
    , emitted_(0)
{
    if (bundle_.empty()) {
        first_start_ = day_start;
        limit_ = day_start;
        return;
    }

    // Windows are aligned on the day start unless data begins later
    first_start_ = std::max(day_start, bundle_.startTime());
    limit_ = std::min(bundle_.coverageEnd(),
                      first_start_ + secondsToDuration(params.analysis_duration));
}

bool WindowSlicer::next(Window& window) {
    if (step_.count() <= 0 || length_.count() <= 0) return false;

    while (true) {
        TimePoint start = first_start_ + step_ * static_cast<int64_t>(position_);
        TimePoint end = start + length_;
        // Partial windows at the end of the data are never produced
        if (end > limit_) return false;
        position_++;

        if (!hasData(start, end)) continue;

        window.start = start;
        window.end = end;
        window.index = emitted_++;
        return true;
    }
}

void WindowSlicer::reset() {
    position_ = 0;
    emitted_ = 0;
}

size_t WindowSlicer::candidateCount() const {
    if (step_.count() <= 0 || limit_ - first_start_ < length_) return 0;
    auto span = limit_ - first_start_ - length_;
    return static_cast<size_t>(span.count() / step_.count()) + 1;
}

bool WindowSlicer::hasData(TimePoint start, TimePoint end) const {
    for (const auto& tr : bundle_.traces()) {
        if (tr.startTime() >= end || tr.coverageEnd() <= start) continue;
        // Overlaps in time; make sure at least one sample falls inside
        int64_t first = std::max<int64_t>(tr.firstIndexAtOrAfter(start), 0);
        int64_t last = std::min<int64_t>(tr.firstIndexAtOrAfter(end),
                                         static_cast<int64_t>(tr.sampleCount()));
        if (last > first) return true;
    }
    return false;
}

} // namespace ambientcc
