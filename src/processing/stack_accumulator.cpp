#include "ambientcc/processing/stack_accumulator.hpp"
#include <algorithm>
#include <cmath>

namespace ambientcc {

StackAccumulator::StackAccumulator(const CorrelationParams& params)
    : method_(params.stack_method)
    , sample_rate_(params.cc_sampling_rate)
    , maxlag_(params.maxlag)
    , pws_timegate_(params.pws_timegate)
    , pws_power_(params.pws_power)
{
}

void StackAccumulator::add(const CorrelationKey& key, TimePoint window_start,
                           SampleVector corr) {
    windows_[key][window_start] = std::move(corr);
}

size_t StackAccumulator::windowCount(const CorrelationKey& key) const {
    auto it = windows_.find(key);
    return it == windows_.end() ? 0 : it->second.size();
}

std::vector<PairCorrelation> StackAccumulator::windowCorrelations() const {
    std::vector<PairCorrelation> result;
    for (const auto& [key, wins] : windows_) {
        for (const auto& [start, data] : wins) {
            PairCorrelation pc;
            pc.key = key;
            pc.window_start = start;
            pc.sampling_rate = sample_rate_;
            pc.data = data;
            result.push_back(std::move(pc));
        }
    }
    return result;
}

std::vector<DailyStack> StackAccumulator::finalize(SpectralTransform& transform) const {
    std::vector<DailyStack> stacks;
    size_t timegate = std::max<size_t>(
        1, static_cast<size_t>(pws_timegate_ * sample_rate_));

    for (const auto& [key, wins] : windows_) {
        if (wins.empty()) continue;

        std::vector<SampleVector> corrs;
        corrs.reserve(wins.size());
        for (const auto& [start, data] : wins) corrs.push_back(data);

        DailyStack stack;
        stack.key = key;
        stack.ncorr = corrs.size();
        stack.sampling_rate = sample_rate_;
        stack.maxlag = maxlag_;
        stack.stack_method = stackMethodToString(method_);
        if (method_ == StackMethod::PhaseWeighted) {
            stack.data = phaseWeightedStack(corrs, timegate, pws_power_, transform);
        } else {
            stack.data = linearStack(corrs);
        }
        if (stack.data.empty()) continue;

        stacks.push_back(std::move(stack));
    }
    return stacks;
}

SampleVector StackAccumulator::linearStack(const std::vector<SampleVector>& corrs) {
    if (corrs.empty()) return {};

    size_t n = corrs.front().size();
    SampleVector mean(n, 0.0);
    for (const auto& c : corrs) {
        size_t len = std::min(n, c.size());
        for (size_t i = 0; i < len; i++) mean[i] += c[i];
    }
    for (auto& v : mean) v /= corrs.size();
    return mean;
}

SampleVector StackAccumulator::phaseWeightedStack(const std::vector<SampleVector>& corrs,
                                                  size_t timegate_samples, double power,
                                                  SpectralTransform& transform) {
    if (corrs.empty()) return {};

    size_t n = corrs.front().size();
    Spectrum phasestack(n, Complex(0, 0));
    for (const auto& c : corrs) {
        Spectrum analytic = transform.analyticSignal(c);
        size_t len = std::min(n, analytic.size());
        for (size_t i = 0; i < len; i++) {
            double phase = std::arg(analytic[i]);
            phasestack[i] += Complex(std::cos(phase), std::sin(phase));
        }
    }

    SampleVector coh(n);
    for (size_t i = 0; i < n; i++) {
        coh[i] = std::abs(phasestack[i]) / corrs.size();
    }

    // Centred boxcar smoothing, same length as the input
    size_t gate = std::max<size_t>(1, timegate_samples);
    SampleVector smooth(n, 0.0);
    int64_t left = static_cast<int64_t>(gate / 2);
    for (int64_t i = 0; i < static_cast<int64_t>(n); i++) {
        double sum = 0;
        for (int64_t j = 0; j < static_cast<int64_t>(gate); j++) {
            int64_t k = i - left + j;
            if (k >= 0 && k < static_cast<int64_t>(n)) sum += coh[k];
        }
        smooth[i] = sum / gate;
    }

    SampleVector weight(n);
    for (size_t i = 0; i < n; i++) {
        weight[i] = std::pow(smooth[i], power);
    }

    SampleVector result(n, 0.0);
    for (const auto& c : corrs) {
        size_t len = std::min(n, c.size());
        for (size_t i = 0; i < len; i++) result[i] += c[i] * weight[i];
    }
    for (auto& v : result) v /= corrs.size();
    return result;
}

} // namespace ambientcc
