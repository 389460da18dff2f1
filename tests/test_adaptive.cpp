#include <gtest/gtest.h>

#include <cmath>

#include "oralsense_adaptive.h"

using namespace oralsense;

TEST(MotionCompensator, ZeroReferencePassesSignalThrough) {
    MotionCompensator lms;
    EXPECT_DOUBLE_EQ(lms.filter(1234.0, 0.0), 1234.0);
    EXPECT_DOUBLE_EQ(lms.filter(-5.0, 0.0), -5.0);
}

TEST(MotionCompensator, CancelsPureArtifact) {
    MotionCompensator lms;
    const double c = 0.5;
    const double k = 3.0;
    double prev = 0.0;
    double out = 0.0;
    for (int i = 0; i < 500; ++i) {
        out = lms.filter(k * c, c);
        // once the reference history is full the error shrinks geometrically
        if (i > MotionCompensator::kOrder) {
            EXPECT_LE(std::fabs(out), std::fabs(prev) + 1e-12) << "iteration " << i;
        }
        prev = out;
    }
    EXPECT_LT(std::fabs(out), 1e-6);
}

TEST(MotionCompensator, AttenuatesHighShockReference) {
    MotionCompensator shock(0.01, 2.0);
    MotionCompensator open(0.01, 1e12);
    for (int i = 0; i < 100; ++i) {
        const double ref = (i % 2 == 0) ? 3.0 : -3.0;
        const double a = shock.filter(50.0, ref);
        const double b = open.filter(50.0, ref);
        if (shock.referenceVariance() > 2.0) {
            EXPECT_NEAR(a, b * MotionCompensator::kShockAttenuation, 1e-9 * (1.0 + std::fabs(b)));
        } else {
            EXPECT_DOUBLE_EQ(a, b);
        }
    }
    EXPECT_GT(shock.referenceVariance(), 2.0);
}

TEST(MotionCompensator, ResetClearsWeights) {
    MotionCompensator lms;
    for (int i = 0; i < 50; ++i) lms.filter(10.0, 1.0);
    EXPECT_NE(lms.weights()[0], 0.0);
    lms.reset();
    for (double w : lms.weights()) EXPECT_EQ(w, 0.0);
    EXPECT_DOUBLE_EQ(lms.filter(5.0, 0.0), 5.0);
}

TEST(ActivityClassifier, RelaxedAtBaselineMotionAboveThreshold) {
    ActivityClassifier cls;
    EXPECT_EQ(cls.classify(100000.0, 1.0), ActivityType::Relaxed);
    for (int i = 0; i < 20; ++i) EXPECT_EQ(cls.classify(100000.0, 1.0), ActivityType::Relaxed);
    EXPECT_EQ(cls.classify(100000.0, 2.0), ActivityType::Motion);
    EXPECT_EQ(cls.classify(5.0, 2.0), ActivityType::Motion);
}

TEST(ActivityClassifier, SteadyDeviationIsClenching) {
    ActivityClassifier cls;
    cls.classify(10000.0, 1.0);
    ActivityType last = ActivityType::Relaxed;
    for (int i = 0; i < 40; ++i) last = cls.classify(20000.0, 1.0);
    // history is flat once the step has filled it
    EXPECT_EQ(last, ActivityType::Clenching);
    // baseline is frozen while deviating
    EXPECT_DOUBLE_EQ(cls.baseline(), 10000.0);
}

TEST(ActivityClassifier, VaryingDeviationIsGrinding) {
    ActivityClassifier cls;
    cls.classify(10000.0, 1.0);
    ActivityType last = ActivityType::Relaxed;
    for (int i = 0; i < 40; ++i) last = cls.classify(i % 2 ? 20000.0 : 22000.0, 1.0);
    EXPECT_EQ(last, ActivityType::Grinding);
}

TEST(ActivityClassifier, ThresholdsFromConfiguration) {
    BiometricConfiguration cfg;
    cfg.motionThresholdG = 0.5;
    ActivityClassifier cls(cfg);
    EXPECT_EQ(cls.classify(1000.0, 1.4), ActivityType::Relaxed);
    EXPECT_EQ(cls.classify(1000.0, 1.6), ActivityType::Motion);
}

TEST(ActivityClassifier, ResetReseedsBaseline) {
    ActivityClassifier cls;
    cls.classify(10000.0, 1.0);
    EXPECT_EQ(cls.classify(50000.0, 1.0), ActivityType::Grinding);
    cls.reset();
    EXPECT_EQ(cls.classify(50000.0, 1.0), ActivityType::Relaxed);
    EXPECT_DOUBLE_EQ(cls.baseline(), 50000.0);
}
