#include "ambientcc/processing/correlation_types.hpp"
#include <cstdio>

namespace ambientcc {

std::string CorrelationKey::toString() const {
    char filter[16];
    std::snprintf(filter, sizeof(filter), "%02d", filter_id);
    return pair_id + "_" + components + "_" + filter + "_" + day;
}

bool splitPairId(const std::string& pair_id, std::string& first, std::string& second) {
    auto pos = pair_id.find('_');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= pair_id.size()) return false;
    if (pair_id.find('_', pos + 1) != std::string::npos) return false;

    first = pair_id.substr(0, pos);
    second = pair_id.substr(pos + 1);
    return true;
}

std::string makePairId(const std::string& netsta1, const std::string& netsta2) {
    return netsta1 + "_" + netsta2;
}

} // namespace ambientcc
