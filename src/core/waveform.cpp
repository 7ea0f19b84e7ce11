#include "ambientcc/core/waveform.hpp"
#include <cmath>
#include <algorithm>

namespace ambientcc {

void Waveform::taper(double fraction) {
    if (data_.empty()) return;
    size_t taper_len = static_cast<size_t>(data_.size() * fraction);
    if (taper_len < 1) taper_len = 1;
    if (taper_len > data_.size() / 2) taper_len = data_.size() / 2;

    for (size_t i = 0; i < taper_len; i++) {
        double w = 0.5 * (1.0 - std::cos(M_PI * i / taper_len));
        data_[i] *= w;
        data_[data_.size() - 1 - i] *= w;
    }
}

Waveform Waveform::slice(size_t start_idx, size_t end_idx) const {
    Waveform result(stream_id_, sample_rate_, timeAt(start_idx));
    if (end_idx > data_.size()) end_idx = data_.size();
    if (start_idx < end_idx) {
        result.data_.assign(data_.begin() + start_idx, data_.begin() + end_idx);
    }
    return result;
}

Waveform Waveform::slice(TimePoint start, TimePoint end) const {
    int64_t n = static_cast<int64_t>(data_.size());
    int64_t s = std::clamp<int64_t>(firstIndexAtOrAfter(start), 0, n);
    int64_t e = std::clamp<int64_t>(firstIndexAtOrAfter(end), 0, n);
    if (e < s) e = s;
    return slice(static_cast<size_t>(s), static_cast<size_t>(e));
}

} // namespace ambientcc
