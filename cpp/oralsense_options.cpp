#include "oralsense_options.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace oralsense {

namespace {

inline bool isFinite(double x) {
    return std::isfinite(x) != 0;
}

inline bool fail(const char** err_code, std::string* err_msg, const char* code, const char* msg) {
    if (err_code) *err_code = code;
    if (err_msg) *err_msg = msg;
    return false;
}

struct Field {
    const char* name;
    double BiometricConfiguration::*member;
};

const Field kFields[] = {
    {"sampleRate", &BiometricConfiguration::sampleRate},
    {"hrWindowSeconds", &BiometricConfiguration::hrWindowSeconds},
    {"spo2WindowSeconds", &BiometricConfiguration::spo2WindowSeconds},
    {"minPerfusionIndex", &BiometricConfiguration::minPerfusionIndex},
    {"minHRQuality", &BiometricConfiguration::minHRQuality},
    {"motionThresholdG", &BiometricConfiguration::motionThresholdG},
    {"minBPM", &BiometricConfiguration::minBPM},
    {"maxBPM", &BiometricConfiguration::maxBPM},
    {"minSpO2", &BiometricConfiguration::minSpO2},
    {"maxSpO2", &BiometricConfiguration::maxSpO2},
    {"alphaLP", &BiometricConfiguration::alphaLP},
    {"alphaHP", &BiometricConfiguration::alphaHP},
    {"activityDeviationThreshold", &BiometricConfiguration::activityDeviationThreshold},
    {"grindingVarianceThreshold", &BiometricConfiguration::grindingVarianceThreshold},
    {"lmsStepSize", &BiometricConfiguration::lmsStepSize},
    {"lmsShockVariance", &BiometricConfiguration::lmsShockVariance},
    {"accelLsbPerG", &BiometricConfiguration::accelLsbPerG},
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool validWindow(double sec, double fs) {
    return isFinite(sec) && sec > 0.0 && sec <= 300.0 && static_cast<int>(fs * sec) >= 8;
}

} // namespace

bool validateConfiguration(const BiometricConfiguration& cfg,
                           const char** err_code,
                           std::string* err_msg) {
    // fs: 1..10000
    if (!isFinite(cfg.sampleRate) || cfg.sampleRate < 1.0 || cfg.sampleRate > 10000.0) {
        return fail(err_code, err_msg, "ORALSENSE_E001", "Invalid sample rate (1-10000 Hz)");
    }

    // windows: (0, 300] s and at least 8 samples
    if (!validWindow(cfg.hrWindowSeconds, cfg.sampleRate) || !validWindow(cfg.spo2WindowSeconds, cfg.sampleRate)) {
        return fail(err_code, err_msg, "ORALSENSE_E002", "Invalid window (0<sec<=300, >=8 samples)");
    }

    // BPM range: 20 <= minBPM < maxBPM <= 300
    if (!isFinite(cfg.minBPM) || !isFinite(cfg.maxBPM) || cfg.minBPM < 20.0 || cfg.maxBPM > 300.0 || !(cfg.minBPM < cfg.maxBPM)) {
        return fail(err_code, err_msg, "ORALSENSE_E003", "Invalid BPM range (20<=min<max<=300)");
    }

    // SpO2 range: 0 <= minSpO2 < maxSpO2 <= 100
    if (!isFinite(cfg.minSpO2) || !isFinite(cfg.maxSpO2) || cfg.minSpO2 < 0.0 || cfg.maxSpO2 > 100.0 || !(cfg.minSpO2 < cfg.maxSpO2)) {
        return fail(err_code, err_msg, "ORALSENSE_E004", "Invalid SpO2 range (0<=min<max<=100)");
    }

    // recursive filter coefficients: (0, 1]
    if (!isFinite(cfg.alphaLP) || !isFinite(cfg.alphaHP) || cfg.alphaLP <= 0.0 || cfg.alphaLP > 1.0 || cfg.alphaHP <= 0.0 || cfg.alphaHP > 1.0) {
        return fail(err_code, err_msg, "ORALSENSE_E005", "Invalid filter coefficient (0<alpha<=1)");
    }

    if (!isFinite(cfg.minPerfusionIndex) || !isFinite(cfg.minHRQuality) || cfg.minPerfusionIndex < 0.0 || cfg.minHRQuality < 0.0) {
        return fail(err_code, err_msg, "ORALSENSE_E006", "Invalid quality gate (finite, >=0)");
    }

    const double positives[] = {cfg.motionThresholdG, cfg.activityDeviationThreshold, cfg.grindingVarianceThreshold,
                                cfg.lmsStepSize, cfg.lmsShockVariance, cfg.accelLsbPerG};
    for (double v : positives) {
        if (!isFinite(v) || v <= 0.0) {
            return fail(err_code, err_msg, "ORALSENSE_E007", "Invalid motion/activity threshold (finite, >0)");
        }
    }
    return true;
}

bool applyConfigurationOverride(BiometricConfiguration& cfg,
                                const std::string& key,
                                const std::string& value,
                                const char** err_code,
                                std::string* err_msg) {
    const Field* field = nullptr;
    const std::string k = lower(key);
    for (const auto& f : kFields) {
        if (lower(f.name) == k) { field = &f; break; }
    }
    if (!field) {
        if (err_code) *err_code = "ORALSENSE_E010";
        if (err_msg) *err_msg = "Unknown configuration key: " + key;
        return false;
    }

    const char* begin = value.c_str();
    char* end = nullptr;
    const double v = std::strtod(begin, &end);
    if (value.empty() || end == begin || *end != '\0' || !isFinite(v)) {
        if (err_code) *err_code = "ORALSENSE_E011";
        if (err_msg) *err_msg = "Value for " + key + " is not a number: " + value;
        return false;
    }
    cfg.*(field->member) = v;
    return true;
}

std::optional<BiometricConfiguration> presetByName(const std::string& name) {
    const std::string n = lower(name);
    if (n == "oralable") return BiometricConfiguration::oralable();
    if (n == "anr") return BiometricConfiguration::anr();
    return std::nullopt;
}

std::vector<std::string> configurationKeys() {
    std::vector<std::string> keys;
    for (const auto& f : kFields) keys.emplace_back(f.name);
    return keys;
}

} // namespace oralsense
