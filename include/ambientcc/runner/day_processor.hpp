#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/waveform_bundle.hpp"
#include "../processing/correlation_types.hpp"
#include "../processing/gap_filter.hpp"
#include "../processing/amplitude_normalizer.hpp"
#include "../processing/spectral_whitener.hpp"
#include "../processing/cross_correlation.hpp"
#include <set>
#include <string>
#include <vector>

namespace ambientcc {

/**
 * DayStatistics - Counters collected while processing one day
 */
struct DayStatistics {
    size_t windows = 0;             // windows with data
    size_t windows_used = 0;        // windows that produced correlations
    size_t windows_rejected = 0;    // discarded by the gap filter
    size_t channels_gapped = 0;     // channel-windows dropped for gaps
    size_t channels_short = 0;      // channel-windows dropped for length
    size_t correlations = 0;        // window CCFs computed
    size_t whitened_pairs = 0;      // pair-bands correlated on whitened spectra
    size_t raw_pairs = 0;           // pair-bands correlated on raw spectra
    size_t skipped_bands = 0;       // band-windows without any bin in range
    std::set<size_t> fft_lengths;   // transform lengths planned for the day
};

/**
 * DayResult - Output of one day
 */
struct DayResult {
    std::vector<DailyStack> stacks;                 // when keep_days
    std::vector<PairCorrelation> window_correlations; // when keep_all
    DayStatistics stats;
};

/**
 * DayProcessor - Runs the window pipeline over one day's bundle
 *
 * For each window: gap filter, windsorizing and taper, spectra and
 * amplitude spectra (E/N pooled per station), then for every used filter
 * band and selected pair a whitened or raw cross-correlation. Window CCFs
 * are collected per key and stacked at the end of the day.
 *
 * The FFT plan cache lives for exactly one process() call.
 */
class DayProcessor {
public:
    DayProcessor(const CorrelationParams& params, const std::vector<FilterBand>& bands);

    // requested_pairs: station pair ids of the claimed jobs (either
    // orientation); empty accepts all pairs
    DayResult process(const WaveformBundle& bundle, const std::string& day,
                      const std::set<std::string>& requested_pairs) const;

    const std::vector<FilterBand>& bands() const { return bands_; }

private:
    CorrelationParams params_;
    std::vector<FilterBand> bands_;
    GapFilter gap_filter_;
    AmplitudeNormalizer normalizer_;
    SpectralWhitener whitener_;
    CrossCorrelationEngine engine_;
};

} // namespace ambientcc
