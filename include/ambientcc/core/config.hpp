#pragma once

#include "types.hpp"
#include <string>
#include <map>
#include <set>
#include <vector>

namespace ambientcc {

/**
 * Config - Simple INI-style configuration parser
 *
 * Keys inside a [section] are stored as "section.key".
 */
class Config {
public:
    Config() = default;

    bool loadFromFile(const std::string& filename);
    void loadFromString(const std::string& text);

    // Getters
    std::string getString(const std::string& key, const std::string& default_val = "") const;
    int getInt(const std::string& key, int default_val = 0) const;
    double getDouble(const std::string& key, double default_val = 0.0) const;
    bool getBool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> getStringList(const std::string& key) const;

    // Section names starting with prefix, e.g. "filter." -> {"filter.1", "filter.2"}
    std::vector<std::string> sections(const std::string& prefix) const;

    // Setters
    void set(const std::string& key, const std::string& value) { values_[key] = value; }
    void set(const std::string& key, const char* value) { values_[key] = value; }
    void set(const std::string& key, int value) { values_[key] = std::to_string(value); }
    void set(const std::string& key, double value) { values_[key] = std::to_string(value); }
    void set(const std::string& key, bool value) { values_[key] = value ? "true" : "false"; }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    const std::map<std::string, std::string>& all() const { return values_; }

    // Keys whose value could not be converted by the typed getters
    const std::set<std::string>& conversionErrors() const { return conversion_errors_; }

private:
    void parseLine(std::string line, std::string& section);

    std::map<std::string, std::string> values_;
    mutable std::set<std::string> conversion_errors_;
};

/**
 * WhiteningMode - When spectral whitening is applied to a channel pair
 */
enum class WhiteningMode {
    None,              // never whiten
    All,               // whiten everything except auto-correlations
    ComponentsDiffer   // whiten only if the component codes differ
};

/**
 * StackMethod - How window correlations are combined into a daily stack
 */
enum class StackMethod {
    Linear,
    PhaseWeighted
};

std::string whiteningModeToString(WhiteningMode mode);
bool parseWhiteningMode(const std::string& s, WhiteningMode& mode);
std::string stackMethodToString(StackMethod method);
bool parseStackMethod(const std::string& s, StackMethod& method);

/**
 * FilterBand - Frequency passband processed independently
 */
struct FilterBand {
    int id;
    double low;
    double high;
    bool used;

    FilterBand() : id(0), low(0), high(0), used(true) {}
    FilterBand(int id_, double low_, double high_, bool used_ = true)
        : id(id_), low(low_), high(high_), used(used_) {}
};

/**
 * CorrelationParams - Validated, read-only parameters of a compute run
 */
struct CorrelationParams {
    double cc_sampling_rate = 20.0;       // Hz
    double analysis_duration = 86400.0;   // s
    double overlap = 0.0;                 // fraction [0, 1)
    double maxlag = 120.0;                // s
    double corr_duration = 1800.0;        // s
    double windsorizing = 3.0;            // -1 (1-bit), 0 (off) or k > 0
    WhiteningMode whitening = WhiteningMode::All;
    size_t whitening_napod = constants::DEFAULT_NAPOD;
    bool keep_all = false;
    bool keep_days = true;
    StackMethod stack_method = StackMethod::Linear;
    double pws_timegate = 10.0;           // s
    double pws_power = 2.0;
    std::set<std::string> components_to_compute = {"ZZ"};
    bool autocorr = false;

    double delta() const { return 1.0 / cc_sampling_rate; }

    // ceil(maxlag / dt)
    size_t maxlagSamples() const {
        return static_cast<size_t>(std::ceil(maxlag * cc_sampling_rate - 1e-9));
    }

    // 2 * ceil(maxlag / dt) + 1
    size_t correlationLength() const { return 2 * maxlagSamples() + 1; }

    // Samples in one full correlation window
    size_t windowSamples() const {
        return static_cast<size_t>(std::llround(corr_duration * cc_sampling_rate));
    }

    double windowStep() const { return corr_duration * (1.0 - overlap); }

    // Component letters the preprocessor must deliver (R/T need E and N)
    std::set<char> requiredComponents() const;

    bool validate(std::string& error) const;
};

bool loadCorrelationParams(const Config& config, CorrelationParams& params,
                           std::string& error);

// Reads every [filter.<id>] section; bands are sorted by id
bool loadFilterBands(const Config& config, std::vector<FilterBand>& bands,
                     std::string& error);

std::vector<FilterBand> usedFilterBands(const std::vector<FilterBand>& bands);

} // namespace ambientcc
