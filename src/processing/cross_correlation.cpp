#include "ambientcc/processing/cross_correlation.hpp"
#include "ambientcc/processing/correlation_types.hpp"

namespace ambientcc {

CrossCorrelationEngine::CrossCorrelationEngine(const CorrelationParams& params)
    : whitening_(params.whitening)
    , components_(params.components_to_compute)
    , autocorr_(params.autocorr)
    , maxlag_samples_(params.maxlagSamples())
{
}

std::vector<PairSelection> CrossCorrelationEngine::selectPairs(
        const std::vector<ChannelFrame>& frames,
        const std::set<std::string>& requested_pairs) const {
    std::vector<PairSelection> pairs;

    for (size_t i = 0; i < frames.size(); i++) {
        // combinations, or combinations with replacement for autocorr
        for (size_t j = autocorr_ ? i : i + 1; j < frames.size(); j++) {
            const StreamID& a = frames[i].streamId();
            const StreamID& b = frames[j].streamId();

            std::string comps{a.component(), b.component()};
            if (components_.count(comps) == 0) continue;

            std::string pair_id = makePairId(a.netsta(), b.netsta());
            if (!requested_pairs.empty() &&
                requested_pairs.count(pair_id) == 0 &&
                requested_pairs.count(makePairId(b.netsta(), a.netsta())) == 0) {
                continue;
            }

            PairSelection sel;
            sel.first = i;
            sel.second = j;
            sel.pair_id = pair_id;
            sel.components = comps;
            sel.whiten = shouldWhiten(whitening_, a, b);
            pairs.push_back(sel);
        }
    }
    return pairs;
}

bool CrossCorrelationEngine::shouldWhiten(WhiteningMode mode, const StreamID& a,
                                          const StreamID& b) {
    switch (mode) {
        case WhiteningMode::None:
            return false;
        case WhiteningMode::All:
            return a != b;
        case WhiteningMode::ComponentsDiffer:
            return a.component() != b.component();
    }
    return false;
}

SampleVector CrossCorrelationEngine::correlate(const Spectrum& a, const Spectrum& b,
                                               double energy_a, double energy_b,
                                               size_t maxlag_samples,
                                               SpectralTransform& transform) {
    if (a.empty() || a.size() != b.size()) return {};
    double norm = energy_a * energy_b;
    if (!(norm > 0)) return {};

    size_t nfft = a.size();
    Spectrum cross(nfft);
    for (size_t k = 0; k < nfft; k++) {
        cross[k] = std::conj(a[k]) * b[k];
    }
    SampleVector full = transform.inverseReal(cross);

    // Negative lags wrap around to the end of the circular correlation
    int64_t m = static_cast<int64_t>(maxlag_samples);
    int64_t n = static_cast<int64_t>(nfft);
    SampleVector out(2 * maxlag_samples + 1);
    for (int64_t j = 0; j <= 2 * m; j++) {
        int64_t lag = j - m;
        int64_t idx = ((lag % n) + n) % n;
        out[j] = full[idx] / norm;
    }
    return out;
}

} // namespace ambientcc
