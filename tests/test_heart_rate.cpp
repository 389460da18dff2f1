#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>

#include "oralsense_core.h"
#include "test_signals.h"

using namespace oralsense;
using oralsense::synth::constant;
using oralsense::synth::kPi;
using oralsense::synth::sine;

namespace {

constexpr double kFs = 50.0;
constexpr double k72BpmHz = 1.2;

// 1 Hz spikes over a weaker 2.5 Hz tone: peaks say 60 BPM, the spectrum says 150
std::vector<double> spikesOverTone() {
    std::vector<double> x(150);
    for (size_t i = 0; i < x.size(); ++i) x[i] = 20.0 * std::sin(2.0 * kPi * 2.5 * i / kFs);
    for (size_t i = 10; i < x.size(); i += 50) x[i] = 200.0;
    return x;
}

} // namespace

TEST(TimeDomainHeartRate, RecoversSinusoidRate) {
    BiometricConfiguration cfg;
    auto hr = estimateHeartRateTimeDomain(sine(150, kFs, k72BpmHz, 100.0), cfg);
    ASSERT_TRUE(hr.has_value());
    EXPECT_NEAR(hr->bpm, 72, 1);
    EXPECT_GT(hr->quality, 0.5);
    EXPECT_LE(hr->quality, 1.0);
}

TEST(TimeDomainHeartRate, QualityCountsKeptIntervals) {
    BiometricConfiguration cfg;
    // 3 s at 72 BPM: four peaks, three intervals; relative amplitude saturates
    auto hr = estimateHeartRateTimeDomain(sine(150, kFs, k72BpmHz, 100.0), cfg);
    ASSERT_TRUE(hr.has_value());
    EXPECT_NEAR(hr->quality, 0.6 + 0.4 * 0.3, 1e-9);

    // three accepted peaks, but the 1.8 s gap is longer than 60/minBPM and is
    // dropped, leaving one interval
    std::vector<double> x = constant(150, 0.0);
    x[5] = 200.0;
    x[55] = 200.0;
    x[145] = 200.0;
    auto gated = estimateHeartRateTimeDomain(x, cfg);
    ASSERT_TRUE(gated.has_value());
    EXPECT_EQ(gated->bpm, 60);
    EXPECT_NEAR(gated->quality, 0.6 + 0.4 * 0.1, 1e-9);
}

TEST(TimeDomainHeartRate, UsesNewestWindowOnly) {
    BiometricConfiguration cfg;
    auto x = sine(400, kFs, 2.0, 100.0);
    const auto tailSine = sine(150, kFs, k72BpmHz, 100.0);
    std::copy(tailSine.begin(), tailSine.end(), x.end() - 150);
    auto hr = estimateHeartRateTimeDomain(x, cfg);
    ASSERT_TRUE(hr.has_value());
    EXPECT_NEAR(hr->bpm, 72, 1);
}

TEST(TimeDomainHeartRate, RejectsFlatOrShortWindows) {
    BiometricConfiguration cfg;
    EXPECT_FALSE(estimateHeartRateTimeDomain(constant(150, 5000.0), cfg).has_value());
    EXPECT_FALSE(estimateHeartRateTimeDomain(sine(149, kFs, k72BpmHz, 100.0), cfg).has_value());
    // sd below 1 ADC unit
    EXPECT_FALSE(estimateHeartRateTimeDomain(sine(150, kFs, k72BpmHz, 0.5), cfg).has_value());
}

TEST(TimeDomainHeartRate, RejectsOutOfBandRate) {
    BiometricConfiguration cfg;
    cfg.maxBPM = 60.0;
    EXPECT_FALSE(estimateHeartRateTimeDomain(sine(150, kFs, k72BpmHz, 100.0), cfg).has_value());
}

TEST(SpectralHeartRate, RecoversSinusoidRate) {
    KissFftPlan plan;
    auto hr = estimateHeartRateSpectral(sine(150, kFs, k72BpmHz, 100.0), kFs, 40.0, 180.0, plan);
    ASSERT_TRUE(hr.has_value());
    EXPECT_NEAR(hr->bpm, 72, 2);
    EXPECT_EQ(hr->source, HeartRateSource::Fft);
    EXPECT_GT(hr->quality, 0.0);

    auto longer = estimateHeartRateSpectral(sine(512, kFs, k72BpmHz, 100.0), kFs, 40.0, 180.0, plan);
    ASSERT_TRUE(longer.has_value());
    EXPECT_NEAR(longer->bpm, 72, 1);
}

TEST(SpectralHeartRate, PlanRebuiltOnlyOnSizeChange) {
    KissFftPlan plan;
    const auto x = sine(150, kFs, k72BpmHz, 100.0);
    estimateHeartRateSpectral(x, kFs, 40.0, 180.0, plan);
    estimateHeartRateSpectral(x, kFs, 40.0, 180.0, plan);
    EXPECT_EQ(plan.size(), 256);
    EXPECT_EQ(plan.allocations(), 1u);

    estimateHeartRateSpectral(sine(300, kFs, k72BpmHz, 100.0), kFs, 40.0, 180.0, plan);
    EXPECT_EQ(plan.size(), 512);
    EXPECT_EQ(plan.allocations(), 2u);
}

TEST(SpectralHeartRate, RejectsShortOrFlatInput) {
    KissFftPlan plan;
    EXPECT_FALSE(estimateHeartRateSpectral(sine(127, kFs, k72BpmHz, 100.0), kFs, 40.0, 180.0, plan).has_value());
    EXPECT_FALSE(estimateHeartRateSpectral(constant(256, 10.0), kFs, 40.0, 180.0, plan).has_value());
}

TEST(FftPlan, RejectsOddSizes) {
    KissFftPlan plan;
    EXPECT_EQ(plan.acquire(0), nullptr);
    EXPECT_EQ(plan.acquire(255), nullptr);
    EXPECT_NE(plan.acquire(256), nullptr);
    plan.release();
    EXPECT_EQ(plan.size(), 0);
}

TEST(SelectHeartRate, PrefersIrThenGreen) {
    BiometricConfiguration cfg;
    KissFftPlan plan;
    const auto pulse = sine(150, kFs, k72BpmHz, 100.0);
    const auto flat = constant(150, 0.0);

    auto ir = selectHeartRate(pulse, flat, cfg, plan);
    ASSERT_TRUE(ir.has_value());
    EXPECT_EQ(ir->source, HeartRateSource::Ir);
    EXPECT_NEAR(ir->bpm, 72, 1);

    auto green = selectHeartRate(flat, pulse, cfg, plan);
    ASSERT_TRUE(green.has_value());
    EXPECT_EQ(green->source, HeartRateSource::Green);
    EXPECT_NEAR(green->bpm, 72, 1);

    EXPECT_FALSE(selectHeartRate(flat, flat, cfg, plan).has_value());
}

TEST(SelectHeartRate, SpectrumOverridesDisagreeingPeaks) {
    BiometricConfiguration cfg;
    KissFftPlan plan;
    const auto x = spikesOverTone();

    auto td = estimateHeartRateTimeDomain(x, cfg);
    ASSERT_TRUE(td.has_value());
    EXPECT_EQ(td->bpm, 60);

    auto hr = selectHeartRate(x, constant(150, 0.0), cfg, plan);
    ASSERT_TRUE(hr.has_value());
    EXPECT_EQ(hr->source, HeartRateSource::Fft);
    EXPECT_NEAR(hr->bpm, 150, 3);
    EXPECT_NEAR(hr->quality, 0.8 * td->quality, 1e-9);
}

TEST(SelectHeartRate, SpectralFallbackWhenPeaksAreWeak) {
    BiometricConfiguration cfg;
    cfg.minHRQuality = 0.9;   // peak path quality tops out near 0.72 for this window
    KissFftPlan plan;
    const auto pulse = sine(512, kFs, k72BpmHz, 100.0);

    auto td = estimateHeartRateTimeDomain(pulse, cfg);
    ASSERT_TRUE(td.has_value());
    ASSERT_LT(td->quality, cfg.minHRQuality);

    auto hr = selectHeartRate(pulse, constant(512, 0.0), cfg, plan);
    ASSERT_TRUE(hr.has_value());
    EXPECT_EQ(hr->source, HeartRateSource::Fft);
    EXPECT_NEAR(hr->bpm, 72, 1);
    EXPECT_GE(hr->quality, 0.7 * cfg.minHRQuality);
}
