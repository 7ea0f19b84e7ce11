#pragma once

/**
 * Synthetic ambient noise generator
 *
 * Every station records the same random wavefield delayed by a per-station
 * travel time, plus incoherent local noise. Cross-correlating two stations
 * therefore peaks at the difference of their delays. Output is fully
 * determined by the seed and the day.
 */

#include "preprocessor.hpp"
#include "config.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace ambientcc {

/**
 * GapPattern - Samples removed from one channel, repeating every period
 *
 * Within each period, [offset, offset + length) seconds are missing.
 */
struct GapPattern {
    std::string netsta;
    char component = 'Z';
    double period = 0;      // 0 = a single gap
    double offset = 0;
    double length = 0;
};

struct SyntheticOptions {
    double sampling_rate = 20.0;
    double start_offset = 0;            // seconds after midnight
    double duration = constants::SECONDS_PER_DAY;
    double source_level = 1.0;          // coherent wavefield RMS
    double noise_level = 0.5;           // local noise RMS
    uint32_t seed = 42;
    std::string location = "00";
    std::string band_code = "BH";
    std::set<char> available_components;    // empty = any requested
    std::map<std::string, double> delays;   // NET.STA -> seconds
    std::vector<GapPattern> gaps;
    std::set<std::string> empty_days;       // days returning no data
};

/**
 * SyntheticNoiseSource - Deterministic WaveformPreprocessor
 */
class SyntheticNoiseSource : public WaveformPreprocessor {
public:
    explicit SyntheticNoiseSource(const SyntheticOptions& options = SyntheticOptions());

    WaveformBundle getBundle(const std::set<std::string>& stations,
                             const std::set<char>& components,
                             const std::string& day) override;

    const SyntheticOptions& options() const { return options_; }
    SyntheticOptions& options() { return options_; }

    // Options from the [synthetic] config section. Station entries may
    // carry a delay as NET.STA:seconds.
    static bool fromConfig(const Config& config, double sampling_rate,
                           SyntheticOptions& options, std::set<std::string>& stations,
                           std::string& error);

private:
    // Splits a trace around the gaps configured for its channel
    void addWithGaps(WaveformBundle& bundle, Waveform trace) const;

    SyntheticOptions options_;
};

} // namespace ambientcc
