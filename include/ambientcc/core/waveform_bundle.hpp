#pragma once

#include "types.hpp"
#include "waveform.hpp"
#include <vector>
#include <set>

namespace ambientcc {

/**
 * WaveformBundle - One day of preprocessed traces for many channels
 *
 * A channel with internal gaps is represented by several traces sharing
 * the same StreamID. All traces are expected at the same sampling rate.
 */
class WaveformBundle {
public:
    WaveformBundle() = default;

    void add(const Waveform& trace);
    void add(Waveform&& trace);

    bool empty() const;
    size_t traceCount() const { return traces_.size(); }
    const std::vector<Waveform>& traces() const { return traces_; }

    // Distinct channels present in the bundle
    std::set<StreamID> channels() const;

    // Largest number of samples held by a single channel
    size_t maxChannelSamples() const;

    // Common sampling rate (0 for an empty bundle)
    double sampleRate() const;

    TimePoint startTime() const;
    TimePoint coverageEnd() const;

    // Sorts traces by stream id, then start time
    void sort();

private:
    std::vector<Waveform> traces_;
};

} // namespace ambientcc
