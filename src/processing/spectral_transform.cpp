#include "ambientcc/processing/spectral_transform.hpp"
#include <algorithm>

namespace ambientcc {

Spectrum SpectralTransform::forward(const SampleVector& data, size_t nfft) {
    if (nfft == 0) return {};

    Spectrum in(nfft, Complex(0, 0));
    size_t n = std::min(nfft, data.size());
    for (size_t i = 0; i < n; i++) {
        in[i] = data[i];
    }

    Spectrum out(nfft);
    fft_.fwd(out.data(), in.data(), static_cast<Eigen::Index>(nfft));
    planned_.insert(nfft);
    return out;
}

Spectrum SpectralTransform::inverse(const Spectrum& spectrum) {
    if (spectrum.empty()) return {};

    Spectrum out(spectrum.size());
    fft_.inv(out.data(), spectrum.data(), static_cast<Eigen::Index>(spectrum.size()));
    planned_.insert(spectrum.size());
    return out;
}

SampleVector SpectralTransform::inverseReal(const Spectrum& spectrum) {
    Spectrum x = inverse(spectrum);
    SampleVector result(x.size());
    for (size_t i = 0; i < x.size(); i++) {
        result[i] = x[i].real();
    }
    return result;
}

Spectrum SpectralTransform::analyticSignal(const SampleVector& data) {
    size_t n = data.size();
    if (n == 0) return {};

    Spectrum spec = forward(data, n);

    // h = [1, 2, ..., 2, (1), 0, ..., 0]
    size_t half = n / 2;
    for (size_t k = 1; k < n; k++) {
        if (k < (n + 1) / 2) {
            spec[k] *= 2.0;
        } else if (n % 2 == 0 && k == half) {
            // Nyquist bin kept as is
        } else {
            spec[k] = 0;
        }
    }
    return inverse(spec);
}

void SpectralTransform::clear() {
    fft_.impl().clear();
    planned_.clear();
}

size_t SpectralTransform::nextFastLength(size_t n) {
    if (n <= 1) return 1;

    for (size_t candidate = n; ; candidate++) {
        size_t m = candidate;
        for (size_t p : {2, 3, 5}) {
            while (m % p == 0) m /= p;
        }
        if (m == 1) return candidate;
    }
}

} // namespace ambientcc
