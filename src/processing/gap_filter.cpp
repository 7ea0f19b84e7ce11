#include "ambientcc/processing/gap_filter.hpp"
#include "ambientcc/core/log.hpp"
#include <algorithm>
#include <iterator>
#include <map>

namespace ambientcc {

GapFilter::GapFilter(const CorrelationParams& params)
    : maxlag_(params.maxlag)
    , sample_rate_(params.cc_sampling_rate)
{
}

double GapFilter::minimumSamples() const {
    return 2.0 * maxlag_ * sample_rate_ + 1.0;
}

GapFilterResult GapFilter::apply(const WaveformBundle& bundle, const Window& window,
                                 std::vector<ChannelFrame>& frames) const {
    GapFilterResult result;
    frames.clear();

    // Collect the window's slices per channel, in time order
    std::map<StreamID, std::vector<Waveform>> slices;
    for (const auto& tr : bundle.traces()) {
        if (tr.startTime() >= window.end || tr.coverageEnd() <= window.start) continue;
        Waveform piece = tr.slice(window.start, window.end);
        if (!piece.empty()) slices[tr.streamId()].push_back(std::move(piece));
    }

    for (auto& [id, pieces] : slices) {
        std::sort(pieces.begin(), pieces.end(),
                  [](const Waveform& a, const Waveform& b) {
                      return a.startTime() < b.startTime();
                  });

        Waveform joined = pieces.front();
        bool gapped = false;
        for (size_t i = 1; i < pieces.size(); i++) {
            // Offset of the next piece, in samples, relative to where the
            // joined frame ends
            double missing = joined.offsetAt(pieces[i].startTime()) -
                             static_cast<double>(joined.sampleCount());
            if (missing > 0.5) {
                gapped = true;
                break;
            }
            // Contiguous or overlapping: append the part not yet covered
            int64_t skip = std::max<int64_t>(0, static_cast<int64_t>(std::llround(-missing)));
            const auto& d = pieces[i].data();
            if (skip < static_cast<int64_t>(d.size())) {
                joined.data().insert(joined.data().end(), d.begin() + skip, d.end());
            }
        }

        if (gapped) {
            LOG_DEBUG(id.toString() + " contains gap(s), removing it");
            result.gapped_channels++;
            continue;
        }
        frames.push_back(std::move(joined));
    }

    if (frames.size() < 2) {
        result.reason = "fewer than 2 channels without gaps";
        frames.clear();
        return result;
    }

    size_t base = 0;
    for (const auto& f : frames) base = std::max(base, f.sampleCount());

    if (static_cast<double>(base) <= minimumSamples()) {
        result.reason = "traces too short to export +-maxlag";
        frames.clear();
        return result;
    }

    auto it = std::remove_if(frames.begin(), frames.end(),
                             [base](const ChannelFrame& f) { return f.sampleCount() != base; });
    result.short_channels = static_cast<size_t>(std::distance(it, frames.end()));
    frames.erase(it, frames.end());

    if (frames.size() < 2) {
        result.reason = "fewer than 2 channels of full length";
        frames.clear();
        return result;
    }

    for (auto& f : frames) f.demean();

    result.accepted = true;
    result.sample_count = base;
    return result;
}

} // namespace ambientcc
