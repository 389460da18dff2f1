#include "oralsense_adaptive.h"

#include <cmath>

namespace oralsense {

namespace {

template <typename T>
double variance(const CircularBuffer<T>& buf) {
    const size_t n = buf.size();
    if (n == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) sum += buf.at(i);
    const double mu = sum / static_cast<double>(n);
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d = buf.at(i) - mu;
        acc += d * d;
    }
    return acc / static_cast<double>(n);
}

} // namespace

MotionCompensator::MotionCompensator(double stepSize, double shockVariance)
    : mu_(stepSize), shockVariance_(shockVariance), history_(kOrder) {
    reset();
}

double MotionCompensator::filter(double signal, double noiseReference) {
    history_.push_back(noiseReference);

    // weights_[0] pairs with the newest reference value
    double estimate = 0.0;
    for (size_t i = 0; i < kOrder; ++i) estimate += weights_[i] * history_.fromNewest(i);
    const double cleaned = signal - estimate;
    for (size_t i = 0; i < kOrder; ++i) weights_[i] += mu_ * cleaned * history_.fromNewest(i);

    if (variance(history_) > shockVariance_) return cleaned * kShockAttenuation;
    return cleaned;
}

void MotionCompensator::reset() {
    weights_.fill(0.0);
    history_.clear();
    for (size_t i = 0; i < kOrder; ++i) history_.push_back(0.0);
}

double MotionCompensator::referenceVariance() const { return variance(history_); }

ActivityClassifier::ActivityClassifier(double motionThreshold,
                                       double deviationThreshold,
                                       double grindingVarianceThreshold)
    : motionThreshold_(motionThreshold),
      deviationThreshold_(deviationThreshold),
      grindingVarianceThreshold_(grindingVarianceThreshold),
      history_(kHistorySize) {}

ActivityClassifier::ActivityClassifier(const BiometricConfiguration& cfg)
    : ActivityClassifier(1.0 + cfg.motionThresholdG,
                         cfg.activityDeviationThreshold,
                         cfg.grindingVarianceThreshold) {}

ActivityType ActivityClassifier::classify(double ir, double accMagnitude) {
    if (!baselineSet_) {
        baseline_ = ir;
        baselineSet_ = true;
    }
    history_.push_back(ir);

    if (accMagnitude > motionThreshold_) return ActivityType::Motion;

    if (std::fabs(ir - baseline_) > deviationThreshold_) {
        return variance(history_) > grindingVarianceThreshold_ ? ActivityType::Grinding
                                                               : ActivityType::Clenching;
    }
    // Drift tracking only while relaxed
    baseline_ = 0.95 * baseline_ + 0.05 * ir;
    return ActivityType::Relaxed;
}

void ActivityClassifier::reset() {
    history_.clear();
    baseline_ = 0.0;
    baselineSet_ = false;
}

} // namespace oralsense
