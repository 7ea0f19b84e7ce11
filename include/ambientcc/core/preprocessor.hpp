#pragma once

#include "types.hpp"
#include "waveform_bundle.hpp"
#include <memory>
#include <set>
#include <string>

namespace ambientcc {

/**
 * WaveformPreprocessor - Source of one day of ready-to-correlate data
 *
 * Implementations read, merge, resample and filter the raw archive; the
 * returned traces are all at the correlation sampling rate. A day with no
 * data yields an empty bundle.
 */
class WaveformPreprocessor {
public:
    virtual ~WaveformPreprocessor() = default;

    // stations: "NET.STA"; components: single letters (Z, N, E, ...)
    virtual WaveformBundle getBundle(const std::set<std::string>& stations,
                                     const std::set<char>& components,
                                     const std::string& day) = 0;
};

using WaveformPreprocessorPtr = std::shared_ptr<WaveformPreprocessor>;

} // namespace ambientcc
