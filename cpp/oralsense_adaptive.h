#pragma once

#include <array>
#include <cstddef>

#include "oralsense_buffer.h"
#include "oralsense_core.h"

namespace oralsense {

// Adaptive LMS noise canceller. The accelerometer-derived motion level is the
// noise reference; the error term is both the output and the update signal.
class MotionCompensator {
public:
    static constexpr size_t kOrder = 32;
    static constexpr double kShockAttenuation = 0.1;

    explicit MotionCompensator(double stepSize = 0.01, double shockVariance = 2.0);

    double filter(double signal, double noiseReference);
    void reset();

    const std::array<double, kOrder>& weights() const { return weights_; }
    // Population variance of the current reference history
    double referenceVariance() const;

private:
    double mu_;
    double shockVariance_;
    std::array<double, kOrder> weights_ {};
    CircularBuffer<double> history_;
};

// Per-sample jaw activity from IR deviation and accelerometer magnitude
class ActivityClassifier {
public:
    static constexpr size_t kHistorySize = 32;

    explicit ActivityClassifier(double motionThreshold = 1.15,
                                double deviationThreshold = 5000.0,
                                double grindingVarianceThreshold = 1000.0);
    explicit ActivityClassifier(const BiometricConfiguration& cfg);

    ActivityType classify(double ir, double accMagnitude);
    void reset();

    double baseline() const { return baseline_; }

private:
    double motionThreshold_;
    double deviationThreshold_;
    double grindingVarianceThreshold_;
    CircularBuffer<double> history_;
    double baseline_ {0.0};
    bool baselineSet_ {false};
};

} // namespace oralsense
