#include "ambientcc/core/waveform_bundle.hpp"
#include <algorithm>
#include <map>

namespace ambientcc {

void WaveformBundle::add(const Waveform& trace) {
    if (!trace.empty()) traces_.push_back(trace);
}

void WaveformBundle::add(Waveform&& trace) {
    if (!trace.empty()) traces_.push_back(std::move(trace));
}

bool WaveformBundle::empty() const {
    return traces_.empty();
}

std::set<StreamID> WaveformBundle::channels() const {
    std::set<StreamID> ids;
    for (const auto& tr : traces_) ids.insert(tr.streamId());
    return ids;
}

size_t WaveformBundle::maxChannelSamples() const {
    std::map<StreamID, size_t> counts;
    for (const auto& tr : traces_) counts[tr.streamId()] += tr.sampleCount();

    size_t best = 0;
    for (const auto& [id, n] : counts) best = std::max(best, n);
    return best;
}

double WaveformBundle::sampleRate() const {
    return traces_.empty() ? 0.0 : traces_.front().sampleRate();
}

TimePoint WaveformBundle::startTime() const {
    if (traces_.empty()) return TimePoint();
    TimePoint t = traces_.front().startTime();
    for (const auto& tr : traces_) t = std::min(t, tr.startTime());
    return t;
}

TimePoint WaveformBundle::coverageEnd() const {
    if (traces_.empty()) return TimePoint();
    TimePoint t = traces_.front().coverageEnd();
    for (const auto& tr : traces_) t = std::max(t, tr.coverageEnd());
    return t;
}

void WaveformBundle::sort() {
    std::stable_sort(traces_.begin(), traces_.end(),
        [](const Waveform& a, const Waveform& b) {
            if (a.streamId() != b.streamId()) return a.streamId() < b.streamId();
            return a.startTime() < b.startTime();
        });
}

} // namespace ambientcc
