#pragma once

#include "../processing/correlation_types.hpp"
#include <memory>

namespace ambientcc {

/**
 * CorrelationSink - Destination of computed correlations
 */
class CorrelationSink {
public:
    virtual ~CorrelationSink() = default;

    virtual bool storeDailyStack(const DailyStack& stack) = 0;
    virtual bool storeWindowCorrelation(const PairCorrelation& corr) = 0;
};

using CorrelationSinkPtr = std::shared_ptr<CorrelationSink>;

} // namespace ambientcc
