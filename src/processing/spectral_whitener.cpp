#include "ambientcc/processing/spectral_whitener.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace ambientcc {

SpectralWhitener::SpectralWhitener(size_t napod)
    : napod_(napod)
{
}

SampleVector SpectralWhitener::amplitudeSpectrum(const SampleVector& data, double sample_rate,
                                                 size_t nfft, SpectralTransform& transform) {
    if (nfft == 0) return {};

    SampleVector x(nfft, 0.0);
    std::copy_n(data.begin(), std::min(nfft, data.size()), x.begin());

    double mean = 0;
    for (auto s : x) mean += s;
    mean /= nfft;

    // Symmetric Hann window
    double wsum = 0;
    for (size_t i = 0; i < nfft; i++) {
        double w = nfft > 1 ? 0.5 - 0.5 * std::cos(2.0 * M_PI * i / (nfft - 1)) : 1.0;
        x[i] = (x[i] - mean) * w;
        wsum += w * w;
    }

    Spectrum spec = transform.forward(x, nfft);

    size_t nbins = nfft / 2 + 1;
    SampleVector amp(nbins);
    double scale = 1.0 / (sample_rate * wsum);
    for (size_t k = 0; k < nbins; k++) {
        double p = std::norm(spec[k]) * scale;
        // One-sided: interior bins carry the energy of their mirror
        bool has_mirror = k > 0 && !(nfft % 2 == 0 && k == nfft / 2);
        if (has_mirror) p *= 2.0;
        amp[k] = std::sqrt(p);
    }
    return amp;
}

void SpectralWhitener::poolHorizontalComponents(const std::vector<ChannelFrame>& frames,
                                                std::vector<SampleVector>& amplitudes) {
    // netsta -> component -> frame index
    std::map<std::string, std::map<char, size_t>> index;
    for (size_t i = 0; i < frames.size(); i++) {
        index[frames[i].streamId().netsta()][frames[i].streamId().component()] = i;
    }

    for (const auto& [netsta, comps] : index) {
        auto e = comps.find('E');
        auto n = comps.find('N');
        if (e == comps.end() || n == comps.end()) continue;

        SampleVector& ae = amplitudes[e->second];
        SampleVector& an = amplitudes[n->second];
        size_t len = std::min(ae.size(), an.size());
        for (size_t k = 0; k < len; k++) {
            double m = 0.5 * (ae[k] + an[k]);
            ae[k] = m;
            an[k] = m;
        }
    }
}

bool SpectralWhitener::passband(const FilterBand& band, size_t nfft, double sample_rate,
                                Passband& pb) const {
    if (nfft < 2 || sample_rate <= 0) return false;

    double df = sample_rate / nfft;
    size_t half = nfft / 2;

    bool found = false;
    size_t first = 0, last = 0;
    for (size_t k = 0; k < half; k++) {
        double f = k * df;
        if (f >= band.low && f <= band.high) {
            if (!found) first = k;
            last = k;
            found = true;
        }
    }
    if (!found) return false;

    pb.p1 = first;
    pb.p2 = last;
    pb.lo = first > napod_ ? first - napod_ : 0;
    if (pb.lo < 1) pb.lo = 1;
    pb.hi = std::min(last + napod_, half);
    if (pb.p1 < pb.lo) pb.p1 = pb.lo;
    if (pb.p2 > pb.hi) pb.p2 = pb.hi;
    return true;
}

SampleVector SpectralWhitener::passbandTaper(const Passband& pb, size_t nfft) {
    size_t nbins = nfft / 2 + 1;
    SampleVector taper(nbins, 0.0);

    // cos^2 over linspace(pi/2, pi, p1 - lo)
    size_t up = pb.p1 - pb.lo;
    for (size_t j = 0; j < up; j++) {
        double a = M_PI / 2.0 + (up > 1 ? (M_PI / 2.0) * j / (up - 1) : 0.0);
        taper[pb.lo + j] = std::pow(std::cos(a), 2);
    }
    for (size_t k = pb.p1; k < pb.p2 && k < nbins; k++) {
        taper[k] = 1.0;
    }
    // cos^2 over linspace(0, pi/2, hi - p2)
    size_t down = pb.hi - pb.p2;
    for (size_t j = 0; j < down && pb.p2 + j < nbins; j++) {
        double a = down > 1 ? (M_PI / 2.0) * j / (down - 1) : 0.0;
        taper[pb.p2 + j] = std::pow(std::cos(a), 2);
    }
    return taper;
}

Spectrum SpectralWhitener::whiten(const Spectrum& raw, const SampleVector& amplitude,
                                  const Passband& pb) const {
    size_t nfft = raw.size();
    Spectrum out(nfft, Complex(0, 0));
    if (nfft == 0) return out;

    SampleVector taper = passbandTaper(pb, nfft);
    size_t nbins = std::min(taper.size(), amplitude.size());

    for (size_t k = 0; k < nbins; k++) {
        if (taper[k] == 0 || amplitude[k] <= 0) continue;
        out[k] = raw[k] / amplitude[k] * taper[k];
    }

    // Negative frequencies mirror the positive ones
    for (size_t k = 1; k < (nfft + 1) / 2; k++) {
        out[nfft - k] = std::conj(out[k]);
    }
    return out;
}

double SpectralWhitener::energy(const Spectrum& spectrum, SpectralTransform& transform) {
    if (spectrum.empty()) return 0;
    SampleVector x = transform.inverseReal(spectrum);
    double sum = 0;
    for (auto s : x) sum += s * s;
    return std::sqrt(sum / x.size());
}

} // namespace ambientcc
