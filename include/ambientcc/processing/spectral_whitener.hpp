#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "gap_filter.hpp"
#include "spectral_transform.hpp"
#include <vector>

namespace ambientcc {

/**
 * Passband - FFT bin limits of one filter band
 *
 * [lo, p1)  cos^2 ramp up
 * [p1, p2)  flat
 * [p2, hi)  cos^2 ramp down (starting at 1 on p2)
 * below lo and from hi on the spectrum is zeroed
 */
struct Passband {
    size_t lo = 0;
    size_t p1 = 0;
    size_t p2 = 0;
    size_t hi = 0;
};

/**
 * SpectralWhitener - Frequency-domain amplitude flattening per filter band
 */
class SpectralWhitener {
public:
    explicit SpectralWhitener(size_t napod = constants::DEFAULT_NAPOD);

    size_t napod() const { return napod_; }

    // sqrt of the one-sided PSD estimate (mean removed, Hann window,
    // zero-padded to nfft); nfft/2 + 1 bins
    static SampleVector amplitudeSpectrum(const SampleVector& data, double sample_rate,
                                          size_t nfft, SpectralTransform& transform);

    // Replaces the E and N magnitude spectra of each station by their mean.
    // amplitudes[i] belongs to frames[i]. Vertical components are left alone.
    static void poolHorizontalComponents(const std::vector<ChannelFrame>& frames,
                                         std::vector<SampleVector>& amplitudes);

    // Bin limits for a band; false if no positive-frequency bin lies inside
    bool passband(const FilterBand& band, size_t nfft, double sample_rate,
                  Passband& pb) const;

    // Weights for bins 0..nfft/2
    static SampleVector passbandTaper(const Passband& pb, size_t nfft);

    // Flattens |X| inside the passband, keeps the phase, zeroes elsewhere,
    // and restores Hermitian symmetry
    Spectrum whiten(const Spectrum& raw, const SampleVector& amplitude,
                    const Passband& pb) const;

    // RMS of the real inverse transform
    static double energy(const Spectrum& spectrum, SpectralTransform& transform);

private:
    size_t napod_;
};

} // namespace ambientcc
