#include "ambientcc/core/synthetic_source.hpp"
#include "ambientcc/core/log.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>

namespace ambientcc {

namespace {

// FNV-1a, stable across platforms unlike std::hash
uint32_t hashString(const std::string& s) {
    uint32_t h = 2166136261u;
    for (unsigned char c : s) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

bool splitStation(const std::string& netsta, std::string& net, std::string& sta) {
    auto dot = netsta.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= netsta.size()) return false;
    net = netsta.substr(0, dot);
    sta = netsta.substr(dot + 1);
    return true;
}

} // anonymous namespace

SyntheticNoiseSource::SyntheticNoiseSource(const SyntheticOptions& options)
    : options_(options)
{
}

WaveformBundle SyntheticNoiseSource::getBundle(const std::set<std::string>& stations,
                                               const std::set<char>& components,
                                               const std::string& day) {
    WaveformBundle bundle;

    TimePoint day_start;
    if (!parseDay(day, day_start)) {
        LOG_WARN("synthetic source: invalid day '" + day + "'");
        return bundle;
    }
    if (options_.empty_days.count(day) || options_.duration <= 0 ||
        options_.sampling_rate <= 0) {
        return bundle;
    }

    const double fs = options_.sampling_rate;
    size_t n = static_cast<size_t>(std::llround(options_.duration * fs));
    if (n == 0) return bundle;

    // Largest delay determines how much leading wavefield is needed
    size_t max_delay = 0;
    for (const auto& netsta : stations) {
        auto it = options_.delays.find(netsta);
        if (it != options_.delays.end() && it->second > 0) {
            max_delay = std::max(max_delay,
                                 static_cast<size_t>(std::llround(it->second * fs)));
        }
    }

    // normal_distribution needs a positive sigma; a zero level means silence
    SampleVector wavefield(n + max_delay, 0.0);
    if (options_.source_level > 0) {
        std::mt19937 gen(options_.seed ^ hashString(day));
        std::normal_distribution<> source_dist(0.0, options_.source_level);
        for (auto& s : wavefield) {
            s = source_dist(gen);
        }
    }

    TimePoint start = day_start + secondsToDuration(options_.start_offset);

    for (const auto& netsta : stations) {
        std::string net, sta;
        if (!splitStation(netsta, net, sta)) {
            LOG_WARN("synthetic source: invalid station '" + netsta + "'");
            continue;
        }

        size_t delay = 0;
        auto it = options_.delays.find(netsta);
        if (it != options_.delays.end() && it->second > 0) {
            delay = static_cast<size_t>(std::llround(it->second * fs));
        }

        for (char comp : components) {
            if (!options_.available_components.empty() &&
                options_.available_components.count(comp) == 0) {
                continue;
            }

            StreamID id(net, sta, options_.location,
                        options_.band_code + std::string(1, comp));

            SampleVector data(n);
            for (size_t i = 0; i < n; i++) {
                // The station sees the wavefield `delay` samples late
                data[i] = wavefield[max_delay + i - delay];
            }
            if (options_.noise_level > 0) {
                std::mt19937 local_gen(options_.seed ^ hashString(day + id.toString()));
                std::normal_distribution<> noise(0.0, options_.noise_level);
                for (auto& s : data) {
                    s += noise(local_gen);
                }
            }

            addWithGaps(bundle, Waveform(id, fs, start, std::move(data)));
        }
    }

    bundle.sort();
    LOG_DEBUG("synthetic source: " + std::to_string(bundle.traceCount()) +
              " traces for " + day);
    return bundle;
}

void SyntheticNoiseSource::addWithGaps(WaveformBundle& bundle, Waveform trace) const {
    const StreamID id = trace.streamId();
    const double fs = trace.sampleRate();
    const size_t n = trace.sampleCount();

    std::vector<bool> keep(n, true);
    bool has_gap = false;

    for (const auto& gap : options_.gaps) {
        if (gap.netsta != id.netsta() || gap.component != id.component()) continue;
        if (gap.length <= 0) continue;

        double period = gap.period > 0 ? gap.period : options_.duration + gap.offset + 1;
        for (double base = 0; base < options_.start_offset + options_.duration;
             base += period) {
            double from = base + gap.offset - options_.start_offset;
            double to = from + gap.length;
            int64_t i0 = std::max<int64_t>(0, static_cast<int64_t>(std::ceil(from * fs)));
            int64_t i1 = std::min<int64_t>(n, static_cast<int64_t>(std::ceil(to * fs)));
            for (int64_t i = i0; i < i1; i++) {
                keep[i] = false;
                has_gap = true;
            }
        }
    }

    if (!has_gap) {
        bundle.add(std::move(trace));
        return;
    }

    // Emit every contiguous run of kept samples as its own trace
    size_t i = 0;
    while (i < n) {
        if (!keep[i]) {
            i++;
            continue;
        }
        size_t j = i;
        while (j < n && keep[j]) j++;
        bundle.add(trace.slice(i, j));
        i = j;
    }
}

bool SyntheticNoiseSource::fromConfig(const Config& config, double sampling_rate,
                                      SyntheticOptions& options,
                                      std::set<std::string>& stations,
                                      std::string& error) {
    options.sampling_rate = sampling_rate;
    options.seed = static_cast<uint32_t>(config.getInt("synthetic.seed", 42));
    options.noise_level = config.getDouble("synthetic.noise_level", options.noise_level);
    options.source_level = config.getDouble("synthetic.source_level", options.source_level);
    options.duration = config.getDouble("synthetic.duration", options.duration);

    if (!config.conversionErrors().empty()) {
        error = "invalid value for " + *config.conversionErrors().begin();
        return false;
    }
    if (options.noise_level < 0 || options.source_level < 0) {
        error = "synthetic noise and source levels must be >= 0";
        return false;
    }

    for (const auto& comp : config.getStringList("synthetic.components")) {
        if (comp.size() != 1) {
            error = "synthetic.components: expected single letters, got '" + comp + "'";
            return false;
        }
        options.available_components.insert(
            static_cast<char>(std::toupper(static_cast<unsigned char>(comp[0]))));
    }

    stations.clear();
    for (const auto& entry : config.getStringList("synthetic.stations")) {
        std::string netsta = entry;
        auto colon = entry.find(':');
        if (colon != std::string::npos) {
            netsta = entry.substr(0, colon);
            try {
                options.delays[netsta] = std::stod(entry.substr(colon + 1));
            } catch (const std::exception&) {
                error = "synthetic.stations: invalid delay in '" + entry + "'";
                return false;
            }
        }
        std::string net, sta;
        if (!splitStation(netsta, net, sta)) {
            error = "synthetic.stations: expected NET.STA, got '" + entry + "'";
            return false;
        }
        stations.insert(netsta);
    }
    return true;
}

} // namespace ambientcc
