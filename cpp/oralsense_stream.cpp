#include "oralsense_stream.h"
#include "oralsense_log.h"
#include "oralsense_options.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace oralsense {

namespace {

size_t bufferCapacity(const BiometricConfiguration& cfg) {
    const int n = std::max(cfg.hrWindowSize(), cfg.spo2WindowSize());
    return n > 0 ? static_cast<size_t>(n) : 1u;
}

} // namespace

BiometricProcessor::BiometricProcessor(const BiometricConfiguration& cfg)
    : cfg_(cfg),
      ir_(bufferCapacity(cfg)),
      green_(bufferCapacity(cfg)),
      red_(bufferCapacity(cfg)),
      irDc_(bufferCapacity(cfg)),
      motion_(bufferCapacity(cfg)),
      irFilter_(cfg.alphaHP, cfg.alphaLP),
      greenFilter_(cfg.alphaHP, cfg.alphaLP),
      irCompensator_(cfg.lmsStepSize, cfg.lmsShockVariance),
      redCompensator_(cfg.lmsStepSize, cfg.lmsShockVariance),
      greenCompensator_(cfg.lmsStepSize, cfg.lmsShockVariance),
      classifier_(cfg) {
    logDebug("BiometricProcessor fs=%.1f hrWindow=%d spo2Window=%d",
             cfg_.sampleRate, cfg_.hrWindowSize(), cfg_.spo2WindowSize());
}

BiometricResult BiometricProcessor::process(double ir, double red, double green,
                                            double accelX, double accelY, double accelZ) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return processLocked(ir, red, green, accelX, accelY, accelZ);
}

BiometricResult BiometricProcessor::process(const RawSample& s) {
    return process(s.ir, s.red, s.green, s.accelX, s.accelY, s.accelZ);
}

BiometricResult BiometricProcessor::processLocked(double ir, double red, double green,
                                                  double accelX, double accelY, double accelZ) {
    const double gx = accelX / cfg_.accelLsbPerG;
    const double gy = accelY / cfg_.accelLsbPerG;
    const double gz = accelZ / cfg_.accelLsbPerG;
    const double magnitude = std::sqrt(gx * gx + gy * gy + gz * gz);
    const double motionLevel = std::fabs(magnitude - 1.0);

    const double cIr = irCompensator_.filter(ir, motionLevel);
    const double cRed = redCompensator_.filter(red, motionLevel);
    const double cGreen = greenCompensator_.filter(green, motionLevel);

    BiometricResult result;
    result.activity = classifier_.classify(cIr, 1.0 + motionLevel);
    result.motionLevel = motionLevel;
    result.method = ProcessingMethod::Realtime;

    ir_.push_back(irFilter_.process(cIr));
    green_.push_back(greenFilter_.process(cGreen));
    red_.push_back(cRed);
    irDc_.push_back(cIr);
    motion_.push_back(motionLevel);

    // Warm-up: activity and motion only
    if (irDc_.size() < static_cast<size_t>(cfg_.hrWindowSize())) return result;

    irDc_.snapshot(irDcScratch_);
    result.perfusionIndex = perfusionIndex(irDcScratch_);
    result.signalStrength = classifySignalStrength(result.perfusionIndex);

    const bool moving = result.activity == ActivityType::Motion;
    if (!moving) {
        ir_.snapshot(irScratch_);
        green_.snapshot(greenScratch_);
        result.heartRate = selectHeartRate(irScratch_, greenScratch_, cfg_, fftPlan_);
    }
    if (!moving && result.signalStrength != SignalStrength::None
                && result.signalStrength != SignalStrength::Weak) {
        red_.snapshot(redScratch_);
        result.spo2 = estimateSpO2(redScratch_, irDcScratch_, cfg_);
    }
    result.isWorn = isWornFrom(result.perfusionIndex, result.heartRate, cfg_);
    return result;
}

BiometricResult BiometricProcessor::processBatch(const std::vector<double>& ir,
                                                 const std::vector<double>& red,
                                                 const std::vector<double>& green,
                                                 const std::vector<double>& accelX,
                                                 const std::vector<double>& accelY,
                                                 const std::vector<double>& accelZ) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    resetLocked();
    const size_t n = std::min({ir.size(), red.size(), green.size(),
                               accelX.size(), accelY.size(), accelZ.size()});
    const size_t longest = std::max({ir.size(), red.size(), green.size(),
                                     accelX.size(), accelY.size(), accelZ.size()});
    if (longest != n) logDebug("processBatch: truncating %zu samples to %zu", longest, n);

    BiometricResult result;
    for (size_t i = 0; i < n; ++i) {
        result = processLocked(ir[i], red[i], green[i], accelX[i], accelY[i], accelZ[i]);
    }
    result.method = ProcessingMethod::Batch;
    return result;
}

BiometricResult BiometricProcessor::processBatch(const std::vector<RawSample>& samples) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    resetLocked();
    BiometricResult result;
    for (const auto& s : samples) {
        result = processLocked(s.ir, s.red, s.green, s.accelX, s.accelY, s.accelZ);
    }
    result.method = ProcessingMethod::Batch;
    return result;
}

void BiometricProcessor::reset() {
    std::lock_guard<std::mutex> lock(dataMutex_);
    resetLocked();
}

void BiometricProcessor::resetLocked() {
    ir_.clear();
    green_.clear();
    red_.clear();
    irDc_.clear();
    motion_.clear();
    irFilter_.reset();
    greenFilter_.reset();
    irCompensator_.reset();
    redCompensator_.reset();
    greenCompensator_.reset();
    classifier_.reset();
}

size_t BiometricProcessor::samplesBuffered() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return irDc_.size();
}

double BiometricProcessor::meanMotionLevel() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    if (motion_.empty()) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < motion_.size(); ++i) sum += motion_.at(i);
    return sum / static_cast<double>(motion_.size());
}

} // namespace oralsense

// ---------------------------------------------------------------------------
// C bridge

struct _os_bp_handle { oralsense::BiometricProcessor* p; };

void* os_bp_create(const oralsense::BiometricConfiguration* cfg) {
    oralsense::BiometricConfiguration c = cfg ? *cfg : oralsense::BiometricConfiguration::oralable();
    const char* code = nullptr;
    std::string msg;
    if (!oralsense::validateConfiguration(c, &code, &msg)) {
        oralsense::logWarning("os_bp_create rejected configuration: %s %s", code, msg.c_str());
        return nullptr;
    }
    auto* h = new _os_bp_handle();
    h->p = new oralsense::BiometricProcessor(c);
    return h;
}

int os_bp_process(void* h, double ir, double red, double green,
                  double accelX, double accelY, double accelZ,
                  oralsense::BiometricResult* out) {
    if (!h || !out) return 0;
    auto* S = reinterpret_cast<_os_bp_handle*>(h);
    *out = S->p->process(ir, red, green, accelX, accelY, accelZ);
    return 1;
}

void os_bp_reset(void* h) {
    if (!h) return; auto* S = reinterpret_cast<_os_bp_handle*>(h); S->p->reset();
}

void os_bp_destroy(void* h) {
    if (!h) return; auto* S = reinterpret_cast<_os_bp_handle*>(h); delete S->p; delete S;
}
