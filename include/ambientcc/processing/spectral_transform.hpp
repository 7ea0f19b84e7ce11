#pragma once

#include "../core/types.hpp"
#include <unsupported/Eigen/FFT>
#include <set>

namespace ambientcc {

/**
 * SpectralTransform - FFT front end with a scoped plan cache
 *
 * Eigen's FFT keeps twiddle tables per transform length. One instance is
 * owned by a single day's processing and dropped (or clear()ed) when that
 * day is done, so the cache never outlives the lengths it was built for.
 * Not thread-safe.
 */
class SpectralTransform {
public:
    SpectralTransform() = default;
    ~SpectralTransform() = default;

    SpectralTransform(const SpectralTransform&) = delete;
    SpectralTransform& operator=(const SpectralTransform&) = delete;

    // Full complex spectrum of data zero-padded to nfft samples
    Spectrum forward(const SampleVector& data, size_t nfft);

    // Complex inverse transform, scaled by 1/n
    Spectrum inverse(const Spectrum& spectrum);

    // Real part of the inverse transform, scaled by 1/n
    SampleVector inverseReal(const Spectrum& spectrum);

    // Analytic signal x + i*H(x), computed at the signal length
    Spectrum analyticSignal(const SampleVector& data);

    // Releases all cached plans
    void clear();

    // Transform lengths planned since construction or the last clear()
    const std::set<size_t>& plannedLengths() const { return planned_; }

    // Smallest 2^a * 3^b * 5^c >= n
    static size_t nextFastLength(size_t n);

private:
    Eigen::FFT<double> fft_;
    std::set<size_t> planned_;
};

} // namespace ambientcc
