#include "ambientcc/runner/day_processor.hpp"
#include "ambientcc/processing/window_slicer.hpp"
#include "ambientcc/processing/stack_accumulator.hpp"
#include "ambientcc/processing/spectral_transform.hpp"
#include "ambientcc/core/log.hpp"

namespace ambientcc {

DayProcessor::DayProcessor(const CorrelationParams& params,
                           const std::vector<FilterBand>& bands)
    : params_(params)
    , bands_(usedFilterBands(bands))
    , gap_filter_(params)
    , normalizer_(params.windsorizing)
    , whitener_(params.whitening_napod)
    , engine_(params)
{
}

DayResult DayProcessor::process(const WaveformBundle& bundle, const std::string& day,
                                const std::set<std::string>& requested_pairs) const {
    DayResult result;
    DayStatistics& stats = result.stats;

    TimePoint day_start;
    if (!parseDay(day, day_start)) {
        LOG_ERROR("invalid day '" + day + "'");
        return result;
    }
    if (bundle.empty()) return result;

    // Plans are built on demand and released when this call returns
    SpectralTransform transform;
    StackAccumulator accumulator(params_);

    const double fs = params_.cc_sampling_rate;
    const size_t maxlag_samples = engine_.maxlagSamples();

    WindowSlicer slicer(bundle, params_, day_start);
    Window window;
    while (slicer.next(window)) {
        stats.windows++;

        std::vector<ChannelFrame> frames;
        GapFilterResult gf = gap_filter_.apply(bundle, window, frames);
        stats.channels_gapped += gf.gapped_channels;
        stats.channels_short += gf.short_channels;
        if (!gf.accepted) {
            stats.windows_rejected++;
            LOG_DEBUG("window " + formatTime(window.start) + " discarded: " + gf.reason);
            continue;
        }

        normalizer_.apply(frames);

        std::vector<PairSelection> pairs = engine_.selectPairs(frames, requested_pairs);
        if (pairs.empty()) {
            LOG_TRACE("window " + formatTime(window.start) + ": no pairs to correlate");
            continue;
        }

        const size_t nfft = SpectralTransform::nextFastLength(gf.sample_count);

        bool any_whitened = false;
        for (const auto& p : pairs) {
            any_whitened = any_whitened || p.whiten;
        }

        // Snapshot of spectra and energies for this window
        std::vector<Spectrum> raw(frames.size());
        std::vector<double> raw_energy(frames.size(), 0.0);
        for (size_t i = 0; i < frames.size(); i++) {
            raw[i] = transform.forward(frames[i].data(), nfft);
            raw_energy[i] = SpectralWhitener::energy(raw[i], transform);
        }

        std::vector<SampleVector> amplitudes;
        if (any_whitened) {
            amplitudes.resize(frames.size());
            for (size_t i = 0; i < frames.size(); i++) {
                amplitudes[i] = SpectralWhitener::amplitudeSpectrum(
                    frames[i].data(), fs, nfft, transform);
            }
            SpectralWhitener::poolHorizontalComponents(frames, amplitudes);
        }

        bool window_used = false;
        for (const auto& band : bands_) {
            std::vector<Spectrum> white;
            std::vector<double> white_energy;

            // Without a passband only the whitened pairs lose this band
            bool band_whitened = false;
            Passband pb;
            if (any_whitened) {
                if (whitener_.passband(band, nfft, fs, pb)) {
                    band_whitened = true;
                } else {
                    stats.skipped_bands++;
                    LOG_DEBUG("filter " + std::to_string(band.id) +
                              ": no frequency bin in range for nfft " +
                              std::to_string(nfft));
                }
            }

            if (band_whitened) {
                white.resize(frames.size());
                white_energy.assign(frames.size(), 0.0);
                for (size_t i = 0; i < frames.size(); i++) {
                    white[i] = whitener_.whiten(raw[i], amplitudes[i], pb);
                    white_energy[i] = SpectralWhitener::energy(white[i], transform);
                }
            }

            for (const auto& p : pairs) {
                if (p.whiten && !band_whitened) continue;

                const Spectrum& a = p.whiten ? white[p.first] : raw[p.first];
                const Spectrum& b = p.whiten ? white[p.second] : raw[p.second];
                double ea = p.whiten ? white_energy[p.first] : raw_energy[p.first];
                double eb = p.whiten ? white_energy[p.second] : raw_energy[p.second];

                SampleVector corr = CrossCorrelationEngine::correlate(
                    a, b, ea, eb, maxlag_samples, transform);
                if (corr.empty()) {
                    LOG_DEBUG("pair " + p.pair_id + " " + p.components +
                              ": zero energy in window " + formatTime(window.start));
                    continue;
                }

                if (p.whiten) {
                    stats.whitened_pairs++;
                } else {
                    stats.raw_pairs++;
                }
                stats.correlations++;
                window_used = true;

                accumulator.add(CorrelationKey(p.pair_id, p.components, band.id, day),
                                window.start, std::move(corr));
            }
        }

        if (window_used) stats.windows_used++;
    }

    if (params_.keep_all) {
        result.window_correlations = accumulator.windowCorrelations();
    }
    if (params_.keep_days) {
        result.stacks = accumulator.finalize(transform);
    }
    stats.fft_lengths = transform.plannedLengths();

    LOG_DEBUG(day + ": " + std::to_string(stats.windows_used) + "/" +
              std::to_string(stats.windows) + " windows used, " +
              std::to_string(stats.correlations) + " correlations");
    return result;
}

} // namespace ambientcc
