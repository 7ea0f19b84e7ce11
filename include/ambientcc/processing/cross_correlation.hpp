#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "gap_filter.hpp"
#include "spectral_transform.hpp"
#include <set>
#include <string>
#include <vector>

namespace ambientcc {

/**
 * PairSelection - Two frames of a window to be correlated
 */
struct PairSelection {
    size_t first = 0;          // index into the window's frames
    size_t second = 0;
    std::string pair_id;       // NET.STA1_NET.STA2
    std::string components;    // component of first + component of second
    bool whiten = false;       // whether whitened spectra are used
};

/**
 * CrossCorrelationEngine - Frequency-domain cross-correlation of frames
 */
class CrossCorrelationEngine {
public:
    explicit CrossCorrelationEngine(const CorrelationParams& params);

    // Combinations of the (sorted) frames that the configuration asks for.
    // requested_pairs holds station pair ids in either orientation; an
    // empty set accepts every station pair.
    std::vector<PairSelection> selectPairs(const std::vector<ChannelFrame>& frames,
                                           const std::set<std::string>& requested_pairs) const;

    // Whitening policy for one pair
    static bool shouldWhiten(WhiteningMode mode, const StreamID& a, const StreamID& b);

    // real(IFFT(conj(A) * B)) / (energy_a * energy_b) at lags
    // -maxlag_samples..+maxlag_samples. Returns an empty vector when an
    // energy is zero.
    static SampleVector correlate(const Spectrum& a, const Spectrum& b,
                                  double energy_a, double energy_b,
                                  size_t maxlag_samples, SpectralTransform& transform);

    size_t maxlagSamples() const { return maxlag_samples_; }

private:
    WhiteningMode whitening_;
    std::set<std::string> components_;
    bool autocorr_;
    size_t maxlag_samples_;
};

} // namespace ambientcc
