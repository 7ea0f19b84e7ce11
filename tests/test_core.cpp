/**
 * Unit tests for core components
 */

#include "test_framework.hpp"
#include "ambientcc/core/types.hpp"
#include "ambientcc/core/waveform.hpp"
#include "ambientcc/core/waveform_bundle.hpp"
#include "ambientcc/core/config.hpp"
#include "ambientcc/core/log.hpp"
#include "ambientcc/core/synthetic_source.hpp"

using namespace ambientcc;
using namespace ambientcc::test;

namespace {

TimePoint dayStart(const std::string& day) {
    TimePoint t;
    parseDay(day, t);
    return t;
}

SampleVector ramp(size_t n) {
    SampleVector v(n);
    for (size_t i = 0; i < n; i++) v[i] = static_cast<double>(i);
    return v;
}

} // anonymous namespace

// ============================================================================
// StreamID Tests
// ============================================================================

TEST(StreamID, ToString) {
    StreamID id("XX", "S01", "00", "BHZ");
    ASSERT_EQ(id.toString(), std::string("XX.S01.00.BHZ"));
    ASSERT_EQ(id.netsta(), std::string("XX.S01"));
}

TEST(StreamID, ComponentIsLastChannelLetter) {
    ASSERT_EQ(StreamID("XX", "S01", "", "HHN").component(), 'N');
    ASSERT_EQ(StreamID("XX", "S01", "", "BHE").component(), 'E');
    ASSERT_EQ(StreamID("XX", "S01", "", "").component(), '?');
}

TEST(StreamID, Ordering) {
    StreamID a("XX", "S01", "00", "BHE");
    StreamID b("XX", "S01", "00", "BHZ");
    StreamID c("XX", "S02", "00", "BHE");
    ASSERT_TRUE(a < b);
    ASSERT_TRUE(b < c);
    ASSERT_FALSE(b < a);
    ASSERT_TRUE(a != b);
}

// ============================================================================
// Day Tests
// ============================================================================

TEST(Day, ParseAndFormat) {
    TimePoint t;
    ASSERT_TRUE(parseDay("2024-02-29", t));
    ASSERT_EQ(formatDay(t), std::string("2024-02-29"));
    ASSERT_EQ(formatDay(t + secondsToDuration(86399.5)), std::string("2024-02-29"));
    ASSERT_EQ(formatDay(t + secondsToDuration(86400)), std::string("2024-03-01"));
}

TEST(Day, RejectsMalformed) {
    TimePoint t;
    ASSERT_FALSE(parseDay("2024-13-01", t));
    ASSERT_FALSE(parseDay("2024-01-01x", t));
    ASSERT_FALSE(parseDay("yesterday", t));
}

TEST(Day, FormatTime) {
    TimePoint t = dayStart("2024-01-01") + secondsToDuration(3661.25);
    ASSERT_EQ(formatTime(t), std::string("2024-01-01 01:01:01.250000"));
}

// ============================================================================
// Waveform Tests
// ============================================================================

TEST(Waveform, Basics) {
    TimePoint t0 = dayStart("2024-01-01");
    Waveform w(StreamID("XX", "S01", "00", "BHZ"), 20.0, t0, ramp(100));
    ASSERT_EQ(w.sampleCount(), 100u);
    ASSERT_NEAR(w.delta(), 0.05, 1e-12);
    ASSERT_NEAR(w.duration(), 5.0, 1e-12);
    ASSERT_TRUE(w.coverageEnd() == t0 + secondsToDuration(5.0));
    ASSERT_TRUE(w.endTime() == t0 + secondsToDuration(4.95));
}

TEST(Waveform, SliceIsHalfOpen) {
    TimePoint t0 = dayStart("2024-01-01");
    Waveform w(StreamID("XX", "S01", "00", "BHZ"), 10.0, t0, ramp(100));

    Waveform s = w.slice(t0 + secondsToDuration(1.0), t0 + secondsToDuration(2.0));
    ASSERT_EQ(s.sampleCount(), 10u);
    ASSERT_NEAR(s[0], 10.0, 1e-12);
    ASSERT_NEAR(s[9], 19.0, 1e-12);
    ASSERT_TRUE(s.startTime() == t0 + secondsToDuration(1.0));
}

TEST(Waveform, SliceClampsToData) {
    TimePoint t0 = dayStart("2024-01-01");
    Waveform w(StreamID("XX", "S01", "00", "BHZ"), 10.0, t0, ramp(100));

    Waveform s = w.slice(t0 - secondsToDuration(5.0), t0 + secondsToDuration(0.5));
    ASSERT_EQ(s.sampleCount(), 5u);

    Waveform none = w.slice(t0 + secondsToDuration(20.0), t0 + secondsToDuration(30.0));
    ASSERT_TRUE(none.empty());
}

TEST(Waveform, DemeanAndStatistics) {
    TimePoint t0 = dayStart("2024-01-01");
    Waveform w(StreamID("XX", "S01", "00", "BHZ"), 1.0, t0, {1.0, 2.0, 3.0, 6.0});
    ASSERT_NEAR(w.mean(), 3.0, 1e-12);
    ASSERT_NEAR(w.absMax(), 6.0, 1e-12);
    w.demean();
    ASSERT_NEAR(w.mean(), 0.0, 1e-12);
    ASSERT_NEAR(w[3], 3.0, 1e-12);
}

TEST(Waveform, TaperZeroesEdgesOnly) {
    TimePoint t0 = dayStart("2024-01-01");
    Waveform w(StreamID("XX", "S01", "00", "BHZ"), 1.0, t0, SampleVector(1000, 1.0));
    w.taper(0.04);
    ASSERT_NEAR(w[0], 0.0, 1e-12);
    ASSERT_NEAR(w[999], 0.0, 1e-12);
    ASSERT_LT(w[20], 1.0);
    ASSERT_NEAR(w[40], 1.0, 1e-12);
    ASSERT_NEAR(w[500], 1.0, 1e-12);
    ASSERT_NEAR(w[20], w[979], 1e-12);
}

// ============================================================================
// WaveformBundle Tests
// ============================================================================

TEST(WaveformBundle, ChannelsAndCoverage) {
    TimePoint t0 = dayStart("2024-01-01");
    StreamID z("XX", "S01", "00", "BHZ");
    StreamID n("XX", "S01", "00", "BHN");

    WaveformBundle bundle;
    bundle.add(Waveform(z, 10.0, t0 + secondsToDuration(10), SampleVector(50, 1.0)));
    bundle.add(Waveform(z, 10.0, t0, SampleVector(60, 1.0)));
    bundle.add(Waveform(n, 10.0, t0, SampleVector(80, 1.0)));
    bundle.add(Waveform(n, 10.0, t0));  // empty traces are ignored

    ASSERT_EQ(bundle.traceCount(), 3u);
    ASSERT_EQ(bundle.channels().size(), 2u);
    ASSERT_EQ(bundle.maxChannelSamples(), 110u);
    ASSERT_NEAR(bundle.sampleRate(), 10.0, 1e-12);
    ASSERT_TRUE(bundle.startTime() == t0);
    ASSERT_TRUE(bundle.coverageEnd() == t0 + secondsToDuration(15.0));

    bundle.sort();
    ASSERT_TRUE(bundle.traces()[0].streamId() == n);
    ASSERT_TRUE(bundle.traces()[1].startTime() == t0);
    ASSERT_TRUE(bundle.traces()[2].startTime() == t0 + secondsToDuration(10));
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(Config, ParseSectionsAndComments) {
    Config config;
    config.loadFromString(
        "# comment\n"
        "[ccf]\n"
        "maxlag = 60   # seconds\n"
        "; another comment\n"
        "components_to_compute = zz, ZN\n"
        "[filter.2]\n"
        "low = 0.5\n"
        "[filter.1]\n"
        "low = 0.1\n");

    ASSERT_NEAR(config.getDouble("ccf.maxlag"), 60.0, 1e-12);
    ASSERT_EQ(config.getStringList("ccf.components_to_compute").size(), 2u);
    auto sections = config.sections("filter.");
    ASSERT_EQ(sections.size(), 2u);
    ASSERT_EQ(sections[0], std::string("filter.1"));
}

TEST(Config, TypedGettersRecordBadValues) {
    Config config;
    config.set("a.int", "12x");
    config.set("a.flag", "maybe");
    ASSERT_EQ(config.getInt("a.int", 7), 7);
    ASSERT_FALSE(config.getBool("a.flag", false));
    ASSERT_EQ(config.conversionErrors().size(), 2u);
    ASSERT_TRUE(config.getBool("a.missing", true));
}

TEST(Config, LoadCorrelationParams) {
    Config config;
    config.loadFromString(
        "[ccf]\n"
        "cc_sampling_rate = 10\n"
        "maxlag = 50\n"
        "corr_duration = 600\n"
        "overlap = 0.5\n"
        "windsorizing = -1\n"
        "whitening = components-different\n"
        "stack_method = PWS\n"
        "components_to_compute = zz, zn\n"
        "keep_all = yes\n");

    CorrelationParams p;
    std::string error;
    ASSERT_TRUE(loadCorrelationParams(config, p, error));
    ASSERT_NEAR(p.cc_sampling_rate, 10.0, 1e-12);
    ASSERT_TRUE(p.whitening == WhiteningMode::ComponentsDiffer);
    ASSERT_TRUE(p.stack_method == StackMethod::PhaseWeighted);
    ASSERT_TRUE(p.keep_all);
    ASSERT_EQ(p.components_to_compute.count("ZN"), 1u);
    ASSERT_EQ(p.maxlagSamples(), 500u);
    ASSERT_EQ(p.correlationLength(), 1001u);
    ASSERT_EQ(p.windowSamples(), 6000u);
    ASSERT_NEAR(p.windowStep(), 300.0, 1e-12);
}

TEST(Config, MaxlagSamplesRoundsUp) {
    CorrelationParams p;
    p.cc_sampling_rate = 3.0;
    p.maxlag = 10.1;
    ASSERT_EQ(p.maxlagSamples(), 31u);
    p.maxlag = 10.0;
    ASSERT_EQ(p.maxlagSamples(), 30u);
}

TEST(Config, RejectsInvalidParams) {
    std::string error;
    CorrelationParams p;

    p.overlap = 1.0;
    ASSERT_FALSE(p.validate(error));

    p = CorrelationParams();
    p.corr_duration = 200;
    p.maxlag = 100;
    ASSERT_FALSE(p.validate(error));

    p = CorrelationParams();
    p.windsorizing = -2;
    ASSERT_FALSE(p.validate(error));

    p = CorrelationParams();
    p.components_to_compute = {"Z"};
    ASSERT_FALSE(p.validate(error));

    Config config;
    config.set("ccf.whitening", "sometimes");
    ASSERT_FALSE(loadCorrelationParams(config, p, error));
    ASSERT_TRUE(error.find("whitening") != std::string::npos);
}

TEST(Config, RequiredComponents) {
    CorrelationParams p;
    p.components_to_compute = {"ZZ", "RT"};
    auto comps = p.requiredComponents();
    ASSERT_EQ(comps.size(), 3u);
    ASSERT_EQ(comps.count('Z'), 1u);
    ASSERT_EQ(comps.count('E'), 1u);
    ASSERT_EQ(comps.count('N'), 1u);
}

TEST(Config, FilterBands) {
    Config config;
    config.loadFromString(
        "[filter.3]\nlow = 1.0\nhigh = 2.0\nused = false\n"
        "[filter.1]\nlow = 0.1\nhigh = 0.5\n");

    std::vector<FilterBand> bands;
    std::string error;
    ASSERT_TRUE(loadFilterBands(config, bands, error));
    ASSERT_EQ(bands.size(), 2u);
    ASSERT_EQ(bands[0].id, 1);
    ASSERT_FALSE(bands[1].used);
    ASSERT_EQ(usedFilterBands(bands).size(), 1u);

    Config bad;
    bad.loadFromString("[filter.1]\nlow = 2.0\nhigh = 1.0\n");
    ASSERT_FALSE(loadFilterBands(bad, bands, error));
}

TEST(Config, EnumNames) {
    WhiteningMode mode;
    ASSERT_TRUE(parseWhiteningMode("N", mode));
    ASSERT_TRUE(mode == WhiteningMode::None);
    ASSERT_TRUE(parseWhiteningMode("all", mode));
    ASSERT_EQ(whiteningModeToString(mode), std::string("A"));

    StackMethod method;
    ASSERT_TRUE(parseStackMethod("linear", method));
    ASSERT_FALSE(parseStackMethod("median", method));
    ASSERT_EQ(stackMethodToString(StackMethod::PhaseWeighted), std::string("pws"));
}

// ============================================================================
// Logger Tests
// ============================================================================

TEST(Logger, ParseLevel) {
    LogLevel level = LogLevel::INFO;
    ASSERT_TRUE(Logger::parseLevel("debug", level));
    ASSERT_TRUE(level == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parseLevel("WARN", level));
    ASSERT_TRUE(level == LogLevel::WARN);
    ASSERT_FALSE(Logger::parseLevel("loud", level));
}

TEST(Logger, LevelGatesOutput) {
    LogLevel saved = Logger::level();
    Logger::setLevel(LogLevel::WARN);
    ASSERT_TRUE(Logger::enabled(LogLevel::ERROR));
    ASSERT_FALSE(Logger::enabled(LogLevel::DEBUG));
    Logger::setLevel(saved);
}

// ============================================================================
// SyntheticNoiseSource Tests
// ============================================================================

namespace {

SyntheticOptions quietOptions() {
    SyntheticOptions o;
    o.sampling_rate = 10.0;
    o.duration = 100.0;
    o.noise_level = 0.0;
    o.seed = 3;
    return o;
}

const Waveform* findTrace(const WaveformBundle& b, const std::string& sta, char comp) {
    for (const auto& tr : b.traces()) {
        if (tr.streamId().station == sta && tr.streamId().component() == comp) return &tr;
    }
    return nullptr;
}

} // anonymous namespace

TEST(SyntheticNoiseSource, DelayedCopiesOfOneWavefield) {
    SyntheticOptions o = quietOptions();
    o.delays["XX.S02"] = 0.5;
    SyntheticNoiseSource source(o);

    WaveformBundle b = source.getBundle({"XX.S01", "XX.S02"}, {'Z'}, "2024-01-01");
    ASSERT_EQ(b.traceCount(), 2u);
    const Waveform* s1 = findTrace(b, "S01", 'Z');
    const Waveform* s2 = findTrace(b, "S02", 'Z');
    ASSERT_TRUE(s1 != nullptr && s2 != nullptr);
    ASSERT_EQ(s1->sampleCount(), 1000u);
    ASSERT_EQ(s2->streamId().channel, std::string("BHZ"));
    ASSERT_TRUE(s1->startTime() == dayStart("2024-01-01"));

    for (size_t i = 5; i < 1000; i++) {
        ASSERT_NEAR(s2->data()[i], s1->data()[i - 5], 1e-12);
    }
}

TEST(SyntheticNoiseSource, DeterministicPerDay) {
    SyntheticNoiseSource source(quietOptions());
    WaveformBundle a = source.getBundle({"XX.S01"}, {'Z'}, "2024-01-01");
    WaveformBundle b = source.getBundle({"XX.S01"}, {'Z'}, "2024-01-01");
    WaveformBundle c = source.getBundle({"XX.S01"}, {'Z'}, "2024-01-02");

    ASSERT_NEAR(a.traces()[0].data()[17], b.traces()[0].data()[17], 0.0);
    ASSERT_TRUE(a.traces()[0].data() != c.traces()[0].data());
}

TEST(SyntheticNoiseSource, GapsSplitTraces) {
    SyntheticOptions o = quietOptions();
    GapPattern gap;
    gap.netsta = "XX.S01";
    gap.component = 'N';
    gap.offset = 10;
    gap.length = 5;
    o.gaps.push_back(gap);
    SyntheticNoiseSource source(o);

    WaveformBundle b = source.getBundle({"XX.S01"}, {'N', 'Z'}, "2024-01-01");
    ASSERT_EQ(b.traceCount(), 3u);
    ASSERT_EQ(b.channels().size(), 2u);

    // Sorted: BHN pieces first, in time order
    ASSERT_EQ(b.traces()[0].sampleCount(), 100u);
    ASSERT_EQ(b.traces()[1].sampleCount(), 850u);
    ASSERT_TRUE(b.traces()[1].startTime() == dayStart("2024-01-01") + secondsToDuration(15));
    ASSERT_EQ(b.traces()[2].sampleCount(), 1000u);
}

TEST(SyntheticNoiseSource, EmptyDaysAndComponents) {
    SyntheticOptions o = quietOptions();
    o.empty_days.insert("2024-01-02");
    o.available_components = {'Z'};
    SyntheticNoiseSource source(o);

    ASSERT_TRUE(source.getBundle({"XX.S01"}, {'Z'}, "2024-01-02").empty());
    ASSERT_TRUE(source.getBundle({"XX.S01"}, {'Z'}, "not-a-day").empty());
    ASSERT_EQ(source.getBundle({"XX.S01"}, {'E', 'N', 'Z'}, "2024-01-01").traceCount(), 1u);
}

TEST(SyntheticNoiseSource, FromConfig) {
    Config cfg;
    cfg.loadFromString(
        "[synthetic]\n"
        "stations = XX.S01, XX.S02:4.5\n"
        "components = z, n\n"
        "seed = 11\n"
        "noise_level = 0.25\n");

    SyntheticOptions o;
    std::set<std::string> stations;
    std::string error;
    ASSERT_TRUE(SyntheticNoiseSource::fromConfig(cfg, 20.0, o, stations, error));
    ASSERT_EQ(stations.size(), 2u);
    ASSERT_NEAR(o.delays["XX.S02"], 4.5, 1e-12);
    ASSERT_EQ(o.delays.count("XX.S01"), 0u);
    ASSERT_EQ(o.seed, 11u);
    ASSERT_NEAR(o.noise_level, 0.25, 1e-12);
    ASSERT_NEAR(o.sampling_rate, 20.0, 1e-12);
    ASSERT_EQ(o.available_components.count('N'), 1u);

    Config bad;
    bad.loadFromString("[synthetic]\nstations = S01\n");
    ASSERT_FALSE(SyntheticNoiseSource::fromConfig(bad, 20.0, o, stations, error));
    ASSERT_FALSE(error.empty());
}
