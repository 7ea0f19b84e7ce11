#include "ambientcc/processing/amplitude_normalizer.hpp"
#include <algorithm>
#include <cmath>

namespace ambientcc {

AmplitudeNormalizer::AmplitudeNormalizer(double windsorizing, double taper_fraction)
    : windsorizing_(windsorizing)
    , taper_fraction_(taper_fraction)
{
}

void AmplitudeNormalizer::apply(std::vector<ChannelFrame>& frames) const {
    for (auto& f : frames) apply(f);
}

void AmplitudeNormalizer::apply(ChannelFrame& frame) const {
    SampleVector& data = frame.data();

    if (windsorizing_ == -1) {
        for (auto& s : data) {
            s = (s > 0) ? 1.0 : (s < 0 ? -1.0 : 0.0);
        }
    } else if (windsorizing_ > 0) {
        double level = clipLevel(data);
        for (auto& s : data) {
            s = std::clamp(s, -level, level);
        }
    }

    frame.taper(taper_fraction_);
}

double AmplitudeNormalizer::clipLevel(const SampleVector& data) const {
    if (windsorizing_ <= 0 || data.empty()) return 0;

    double lo = percentile(data, 1.0);
    double hi = percentile(data, 99.0);
    return windsorizing_ * bandedRms(data, lo, hi);
}

double AmplitudeNormalizer::percentile(SampleVector data, double pct) {
    if (data.empty()) return 0;
    std::sort(data.begin(), data.end());

    double idx = pct / 100.0 * (data.size() - 1);
    size_t i0 = static_cast<size_t>(std::floor(idx));
    size_t i1 = std::min(i0 + 1, data.size() - 1);
    double frac = idx - i0;
    return data[i0] + (data[i1] - data[i0]) * frac;
}

double AmplitudeNormalizer::bandedRms(const SampleVector& data, double lo, double hi) {
    double sum = 0;
    size_t n = 0;
    for (auto s : data) {
        if (s >= lo && s <= hi) {
            sum += s * s;
            n++;
        }
    }
    return n > 0 ? std::sqrt(sum / n) : 0.0;
}

} // namespace ambientcc
