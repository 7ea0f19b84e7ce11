#pragma once

#include "types.hpp"
#include <memory>
#include <algorithm>
#include <numeric>
#include <cmath>

namespace ambientcc {

/**
 * Waveform - Container for one contiguous segment of seismic data
 */
class Waveform {
public:
    Waveform() : sample_rate_(0) {}

    Waveform(const StreamID& id, double sample_rate, TimePoint start_time)
        : stream_id_(id), sample_rate_(sample_rate), start_time_(start_time) {}

    Waveform(const StreamID& id, double sample_rate, TimePoint start_time,
             SampleVector data)
        : stream_id_(id), sample_rate_(sample_rate), start_time_(start_time),
          data_(std::move(data)) {}

    // Accessors
    const StreamID& streamId() const { return stream_id_; }
    double sampleRate() const { return sample_rate_; }
    double delta() const { return sample_rate_ > 0 ? 1.0 / sample_rate_ : 0; }
    TimePoint startTime() const { return start_time_; }

    // Time of the last sample
    TimePoint endTime() const {
        if (data_.empty()) return start_time_;
        return timeAt(data_.size() - 1);
    }

    // End of the time span covered by the samples (last sample + dt)
    TimePoint coverageEnd() const {
        return timeAt(data_.size());
    }

    size_t sampleCount() const { return data_.size(); }
    bool empty() const { return data_.empty(); }
    double duration() const { return data_.size() / sample_rate_; }

    // Data access
    const SampleVector& data() const { return data_; }
    SampleVector& data() { return data_; }

    Sample operator[](size_t idx) const { return data_[idx]; }
    Sample& operator[](size_t idx) { return data_[idx]; }

    // Append samples
    void append(Sample s) { data_.push_back(s); }
    void append(const SampleVector& samples) {
        data_.insert(data_.end(), samples.begin(), samples.end());
    }

    // Fractional sample offset of a time relative to the first sample
    double offsetAt(TimePoint t) const {
        auto dt = std::chrono::duration_cast<std::chrono::microseconds>(t - start_time_);
        return dt.count() * 1e-6 * sample_rate_;
    }

    // Index of the first sample at or after t (may be negative or past the end)
    int64_t firstIndexAtOrAfter(TimePoint t) const {
        return static_cast<int64_t>(std::ceil(offsetAt(t) - 1e-6));
    }

    // Get time for index
    TimePoint timeAt(size_t idx) const {
        return start_time_ + secondsToDuration(idx / sample_rate_);
    }

    // Statistical operations
    Sample mean() const {
        if (data_.empty()) return 0;
        return std::accumulate(data_.begin(), data_.end(), 0.0) / data_.size();
    }

    Sample rms() const {
        if (data_.empty()) return 0;
        Sample sum = 0;
        for (auto s : data_) sum += s * s;
        return std::sqrt(sum / data_.size());
    }

    Sample absMax() const {
        Sample m = 0;
        for (auto s : data_) {
            Sample a = std::abs(s);
            if (a > m) m = a;
        }
        return m;
    }

    // Processing operations
    void demean() {
        Sample m = mean();
        for (auto& s : data_) s -= m;
    }

    void taper(double fraction = 0.05);

    // Samples whose time lies in the half-open interval [start, end)
    Waveform slice(TimePoint start, TimePoint end) const;

    // Samples by index, end exclusive
    Waveform slice(size_t start_idx, size_t end_idx) const;

private:
    StreamID stream_id_;
    double sample_rate_;
    TimePoint start_time_;
    SampleVector data_;
};

using WaveformPtr = std::shared_ptr<Waveform>;

} // namespace ambientcc
