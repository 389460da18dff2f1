#include <gtest/gtest.h>

#include <cmath>

#include "oralsense_core.h"
#include "test_signals.h"

using namespace oralsense;
using oralsense::synth::constant;
using oralsense::synth::peakToPeak;
using oralsense::synth::sine;

TEST(Butterworth, LowPassUnityDcGain) {
    for (int order : {2, 4}) {
        ButterworthFilter lp(FilterType::LowPass, 50.0, 5.0, 0.0, order);
        ASSERT_TRUE(lp.valid());
        EXPECT_EQ(lp.sections().size(), static_cast<size_t>(order / 2));
        const auto y = lp.process(constant(500, 1.0));
        EXPECT_NEAR(y.back(), 1.0, 1e-6) << "order " << order;
    }
}

TEST(Butterworth, HighPassBlocksDcPassesNyquist) {
    ButterworthFilter hp(FilterType::HighPass, 50.0, 1.0);
    EXPECT_NEAR(hp.process(constant(1000, 3.0)).back(), 0.0, 1e-6);

    hp.reset();
    std::vector<double> alt(400);
    for (size_t i = 0; i < alt.size(); ++i) alt[i] = (i % 2) ? -1.0 : 1.0;
    const auto y = hp.process(alt);
    EXPECT_NEAR(std::fabs(y.back()), 1.0, 1e-3);
}

TEST(Butterworth, BandPassCenterGain) {
    ButterworthFilter bp(FilterType::BandPass, 50.0, 0.5, 8.0, 4);
    ASSERT_TRUE(bp.valid());
    EXPECT_EQ(bp.sections().size(), 2u);

    EXPECT_NEAR(bp.process(constant(2000, 100.0)).back(), 0.0, 1e-3);

    // geometric centre of the pre-warped band is 2 Hz at fs = 50
    bp.reset();
    const auto y = bp.process(sine(2000, 50.0, 2.0, 1.0));
    const double amp = 0.5 * peakToPeak(y, 1800);
    EXPECT_NEAR(amp, 1.0, 0.05);
}

TEST(Butterworth, InvalidCutoffIsPassThrough) {
    ButterworthFilter lp(FilterType::LowPass, 50.0, 30.0);
    EXPECT_FALSE(lp.valid());
    EXPECT_DOUBLE_EQ(lp.process(4.2), 4.2);

    ButterworthFilter bp(FilterType::BandPass, 50.0, 8.0, 0.5);
    EXPECT_FALSE(bp.valid());
}

TEST(Butterworth, FiltfiltIsZeroPhase) {
    ButterworthFilter lp(FilterType::LowPass, 50.0, 5.0);
    const auto x = sine(500, 50.0, 1.0, 1.0);
    const auto y = lp.filtfilt(x);
    ASSERT_EQ(y.size(), x.size());
    for (size_t i = 100; i < 400; ++i) EXPECT_NEAR(y[i], x[i], 0.02) << "sample " << i;

    // a causal pass lags the input
    lp.reset();
    const auto causal = lp.process(x);
    double maxErr = 0.0;
    for (size_t i = 100; i < 400; ++i) maxErr = std::max(maxErr, std::fabs(causal[i] - x[i]));
    EXPECT_GT(maxErr, 0.05);
}

TEST(Butterworth, FiltfiltLeavesShortInputUnchanged) {
    ButterworthFilter lp(FilterType::LowPass, 50.0, 5.0);
    const std::vector<double> x {1.0, 5.0, -2.0};
    EXPECT_EQ(lp.filtfilt(x), x);
}

TEST(RecursiveBandpass, ConstantInputStaysAtZero) {
    RecursiveBandpass f(0.05, 0.15);
    for (int i = 0; i < 100; ++i) EXPECT_DOUBLE_EQ(f.process(80000.0), 0.0);
}

TEST(RecursiveBandpass, StepDecaysAndResetReprimes) {
    RecursiveBandpass f(0.05, 0.15);
    f.process(0.0);
    double peak = 0.0;
    double y = 0.0;
    for (int i = 0; i < 400; ++i) {
        y = f.process(1000.0);
        peak = std::max(peak, std::fabs(y));
    }
    EXPECT_GT(peak, 1.0);
    EXPECT_LT(std::fabs(y), 1e-6);

    f.reset();
    EXPECT_DOUBLE_EQ(f.process(123.0), 0.0);
}
