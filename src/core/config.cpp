#include "ambientcc/core/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ambientcc {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// Config

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::string line;
    std::string section;
    while (std::getline(file, line)) {
        parseLine(line, section);
    }
    return true;
}

void Config::loadFromString(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::string section;
    while (std::getline(in, line)) {
        parseLine(line, section);
    }
}

void Config::parseLine(std::string line, std::string& section) {
    line = trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#' || line[0] == ';') return;

    // Section header
    if (line[0] == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.size() - 2));
        return;
    }

    // Key-value pair, trailing comments allowed after whitespace
    auto pos = line.find('=');
    if (pos == std::string::npos) return;

    std::string key = trim(line.substr(0, pos));
    std::string value = line.substr(pos + 1);
    auto hash = value.find(" #");
    if (hash != std::string::npos) value = value.substr(0, hash);
    value = trim(value);

    std::string full_key = section.empty() ? key : section + "." + key;
    values_[full_key] = value;
}

std::string Config::getString(const std::string& key, const std::string& default_val) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : default_val;
}

int Config::getInt(const std::string& key, int default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    try {
        size_t used = 0;
        int v = std::stoi(it->second, &used);
        if (used != it->second.size()) throw std::invalid_argument(key);
        return v;
    } catch (const std::exception&) {
        conversion_errors_.insert(key);
        return default_val;
    }
}

double Config::getDouble(const std::string& key, double default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    try {
        size_t used = 0;
        double v = std::stod(it->second, &used);
        if (used != it->second.size()) throw std::invalid_argument(key);
        return v;
    } catch (const std::exception&) {
        conversion_errors_.insert(key);
        return default_val;
    }
}

bool Config::getBool(const std::string& key, bool default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    std::string v = lower(it->second);
    if (v == "true" || v == "yes" || v == "1" || v == "on" || v == "y") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off" || v == "n") return false;
    conversion_errors_.insert(key);
    return default_val;
}

std::vector<std::string> Config::getStringList(const std::string& key) const {
    std::vector<std::string> result;
    auto it = values_.find(key);
    if (it != values_.end()) {
        std::stringstream ss(it->second);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) result.push_back(item);
        }
    }
    return result;
}

std::vector<std::string> Config::sections(const std::string& prefix) const {
    std::set<std::string> names;
    for (const auto& [key, value] : values_) {
        if (key.compare(0, prefix.size(), prefix) != 0) continue;
        auto dot = key.find('.', prefix.size());
        if (dot == std::string::npos) continue;
        names.insert(key.substr(0, dot));
    }
    return std::vector<std::string>(names.begin(), names.end());
}

// Enumerations

std::string whiteningModeToString(WhiteningMode mode) {
    switch (mode) {
        case WhiteningMode::None: return "N";
        case WhiteningMode::All: return "A";
        case WhiteningMode::ComponentsDiffer: return "C";
    }
    return "?";
}

bool parseWhiteningMode(const std::string& s, WhiteningMode& mode) {
    std::string v = lower(trim(s));
    if (v == "n" || v == "none") { mode = WhiteningMode::None; return true; }
    if (v == "a" || v == "all") { mode = WhiteningMode::All; return true; }
    if (v == "c" || v == "components-different" || v == "components_different") {
        mode = WhiteningMode::ComponentsDiffer;
        return true;
    }
    return false;
}

std::string stackMethodToString(StackMethod method) {
    return method == StackMethod::PhaseWeighted ? "pws" : "linear";
}

bool parseStackMethod(const std::string& s, StackMethod& method) {
    std::string v = lower(trim(s));
    if (v == "linear") { method = StackMethod::Linear; return true; }
    if (v == "pws") { method = StackMethod::PhaseWeighted; return true; }
    return false;
}

// CorrelationParams

std::set<char> CorrelationParams::requiredComponents() const {
    std::set<char> comps;
    for (const auto& pair : components_to_compute) {
        for (char c : pair) {
            if (c == 'R' || c == 'T') {
                comps.insert('E');
                comps.insert('N');
            } else {
                comps.insert(c);
            }
        }
    }
    return comps;
}

bool CorrelationParams::validate(std::string& error) const {
    if (!(cc_sampling_rate > 0)) {
        error = "cc_sampling_rate must be positive";
        return false;
    }
    if (!(analysis_duration > 0)) {
        error = "analysis_duration must be positive";
        return false;
    }
    if (!(overlap >= 0 && overlap < 1)) {
        error = "overlap must be in [0, 1)";
        return false;
    }
    if (!(maxlag > 0)) {
        error = "maxlag must be positive";
        return false;
    }
    if (!(corr_duration > 2 * maxlag)) {
        error = "corr_duration must be longer than 2 * maxlag";
        return false;
    }
    if (!(windsorizing == -1 || windsorizing >= 0)) {
        error = "windsorizing must be -1, 0 or positive";
        return false;
    }
    if (!(pws_timegate >= 0)) {
        error = "pws_timegate must not be negative";
        return false;
    }
    if (!(pws_power >= 0)) {
        error = "pws_power must not be negative";
        return false;
    }
    if (components_to_compute.empty()) {
        error = "components_to_compute is empty";
        return false;
    }
    for (const auto& comp : components_to_compute) {
        if (comp.size() != 2) {
            error = "invalid component pair '" + comp + "'";
            return false;
        }
    }
    return true;
}

bool loadCorrelationParams(const Config& config, CorrelationParams& params,
                           std::string& error) {
    CorrelationParams p;

    p.cc_sampling_rate = config.getDouble("ccf.cc_sampling_rate", p.cc_sampling_rate);
    p.analysis_duration = config.getDouble("ccf.analysis_duration", p.analysis_duration);
    p.overlap = config.getDouble("ccf.overlap", p.overlap);
    p.maxlag = config.getDouble("ccf.maxlag", p.maxlag);
    p.corr_duration = config.getDouble("ccf.corr_duration", p.corr_duration);
    p.windsorizing = config.getDouble("ccf.windsorizing", p.windsorizing);
    p.keep_all = config.getBool("ccf.keep_all", p.keep_all);
    p.keep_days = config.getBool("ccf.keep_days", p.keep_days);
    p.pws_timegate = config.getDouble("ccf.pws_timegate", p.pws_timegate);
    p.pws_power = config.getDouble("ccf.pws_power", p.pws_power);
    p.autocorr = config.getBool("ccf.autocorr", p.autocorr);

    int napod = config.getInt("ccf.whitening_napod", static_cast<int>(p.whitening_napod));
    if (napod < 0) {
        error = "whitening_napod must not be negative";
        return false;
    }
    p.whitening_napod = static_cast<size_t>(napod);

    if (config.has("ccf.whitening") &&
        !parseWhiteningMode(config.getString("ccf.whitening"), p.whitening)) {
        error = "unknown whitening mode '" + config.getString("ccf.whitening") + "'";
        return false;
    }
    if (config.has("ccf.stack_method") &&
        !parseStackMethod(config.getString("ccf.stack_method"), p.stack_method)) {
        error = "unknown stack_method '" + config.getString("ccf.stack_method") + "'";
        return false;
    }
    if (config.has("ccf.components_to_compute")) {
        p.components_to_compute.clear();
        for (const auto& comp : config.getStringList("ccf.components_to_compute")) {
            std::string c = comp;
            std::transform(c.begin(), c.end(), c.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            p.components_to_compute.insert(c);
        }
    }

    if (!config.conversionErrors().empty()) {
        error = "invalid value for '" + *config.conversionErrors().begin() + "'";
        return false;
    }
    if (!p.validate(error)) return false;

    params = p;
    return true;
}

bool loadFilterBands(const Config& config, std::vector<FilterBand>& bands,
                     std::string& error) {
    std::vector<FilterBand> result;

    for (const auto& section : config.sections("filter.")) {
        std::string id_str = section.substr(std::string("filter.").size());
        FilterBand band;
        try {
            size_t used = 0;
            band.id = std::stoi(id_str, &used);
            if (used != id_str.size()) throw std::invalid_argument(id_str);
        } catch (const std::exception&) {
            error = "invalid filter id '" + id_str + "'";
            return false;
        }

        band.low = config.getDouble(section + ".low", 0.0);
        band.high = config.getDouble(section + ".high", 0.0);
        band.used = config.getBool(section + ".used", true);

        if (!config.conversionErrors().empty()) {
            error = "invalid value for '" + *config.conversionErrors().begin() + "'";
            return false;
        }
        if (!(band.low >= 0 && band.high > band.low)) {
            error = "filter " + id_str + " needs 0 <= low < high";
            return false;
        }
        result.push_back(band);
    }

    std::sort(result.begin(), result.end(),
              [](const FilterBand& a, const FilterBand& b) { return a.id < b.id; });
    bands = result;
    return true;
}

std::vector<FilterBand> usedFilterBands(const std::vector<FilterBand>& bands) {
    std::vector<FilterBand> used;
    for (const auto& b : bands) {
        if (b.used) used.push_back(b);
    }
    return used;
}

} // namespace ambientcc
