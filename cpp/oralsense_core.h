#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "kiss_fftr.h"
#include "oralsense_buffer.h"

namespace oralsense {

// Per-session processing parameters. Held const by BiometricProcessor.
struct BiometricConfiguration {
    // Sample rate (must match device)
    double sampleRate = 50.0;

    // Analysis windows in seconds
    double hrWindowSeconds = 3.0;
    double spo2WindowSeconds = 3.0;

    // Quality gates
    double minPerfusionIndex = 0.001; // worn detection
    double minHRQuality = 0.5;        // valid HR output

    // Motion threshold in g above the 1 g gravity baseline
    double motionThresholdG = 0.15;

    // Physiological bounds
    double minBPM = 40.0;
    double maxBPM = 180.0;
    double minSpO2 = 70.0;
    double maxSpO2 = 100.0;

    // Live-path recursive filter
    double alphaLP = 0.15;
    double alphaHP = 0.05;

    // Activity classification (ADC units, tuned for 50 Hz / 3 s)
    double activityDeviationThreshold = 5000.0;
    double grindingVarianceThreshold = 1000.0;

    // LMS motion compensation
    double lmsStepSize = 0.01;
    double lmsShockVariance = 2.0;

    // Accelerometer scale (LIS2DTW12 at +-2 g)
    double accelLsbPerG = 16384.0;

    int hrWindowSize() const { return static_cast<int>(sampleRate * hrWindowSeconds); }
    int spo2WindowSize() const { return static_cast<int>(sampleRate * spo2WindowSeconds); }

    // Oralable device, 50 Hz
    static BiometricConfiguration oralable();
    // ANR MuscleSense device, 100 Hz
    static BiometricConfiguration anr();
};

enum class HeartRateSource { Ir, Green, Fft, Unavailable };
enum class SignalStrength { None, Weak, Moderate, Strong };
enum class ActivityType { Relaxed, Clenching, Grinding, Motion };
enum class ProcessingMethod { Realtime, Batch };

const char* toString(HeartRateSource s);
const char* toString(SignalStrength s);
const char* toString(ActivityType a);
const char* toString(ProcessingMethod m);

struct HeartRateEstimate {
    int bpm = 0;
    double quality = 0.0;   // 0..1
    HeartRateSource source = HeartRateSource::Ir;
};

struct SpO2Estimate {
    double percent = 0.0;   // one decimal
    double quality = 0.0;   // 0..1
};

// Composite output of one process()/processBatch() call.
// An absent heartRate/spo2 means "no valid reading", never a zero rate.
struct BiometricResult {
    std::optional<HeartRateEstimate> heartRate;
    std::optional<SpO2Estimate> spo2;
    double perfusionIndex = 0.0;
    SignalStrength signalStrength = SignalStrength::None;
    bool isWorn = false;
    ActivityType activity = ActivityType::Relaxed;
    double motionLevel = 0.0;
    ProcessingMethod method = ProcessingMethod::Realtime;

    HeartRateSource heartRateSource() const {
        return heartRate ? heartRate->source : HeartRateSource::Unavailable;
    }
};

bool operator==(const HeartRateEstimate& a, const HeartRateEstimate& b);
bool operator==(const SpO2Estimate& a, const SpO2Estimate& b);
bool operator==(const BiometricResult& a, const BiometricResult& b);
inline bool operator!=(const BiometricResult& a, const BiometricResult& b) { return !(a == b); }

// ---------------------------------------------------------------------------
// Filters

// Second-order section, Direct Form II Transposed
struct Biquad {
    double b0{0}, b1{0}, b2{0}, a1{0}, a2{0};
    double z1{0}, z2{0};

    inline double process(double in) {
        double out = in * b0 + z1;
        z1 = in * b1 + z2 - a1 * out;
        z2 = in * b2 - a2 * out;
        return out;
    }
    void reset() { z1 = 0.0; z2 = 0.0; }
};

enum class FilterType { LowPass, HighPass, BandPass };

// Butterworth IIR built from bilinear-transformed second-order sections.
// Orders above 2 cascade order/2 sections. Invalid cutoffs leave the filter
// as a pass-through (valid() == false).
class ButterworthFilter {
public:
    ButterworthFilter(FilterType type, double sampleRate, double cutoffLow,
                      double cutoffHigh = 0.0, int order = 2);

    double process(double x);
    std::vector<double> process(const std::vector<double>& x);
    // Zero-phase forward/backward filtering; state is reset before each pass
    std::vector<double> filtfilt(const std::vector<double>& x);
    void reset();

    bool valid() const { return !sections_.empty(); }
    FilterType type() const { return type_; }
    const std::vector<Biquad>& sections() const { return sections_; }

private:
    FilterType type_;
    std::vector<Biquad> sections_;
};

// Cheap live-path band limiter: first-order high-pass into first-order low-pass
class RecursiveBandpass {
public:
    explicit RecursiveBandpass(double alphaHP = 0.05, double alphaLP = 0.15)
        : alphaHP_(alphaHP), alphaLP_(alphaLP) {}

    inline double process(double x) {
        if (!primed_) { prev_ = x; primed_ = true; }
        hp_ = alphaHP_ * (hp_ + x - prev_);
        lp_ = lp_ + alphaLP_ * (hp_ - lp_);
        prev_ = x;
        return lp_;
    }
    void reset() { hp_ = 0.0; lp_ = 0.0; prev_ = 0.0; primed_ = false; }
    double highPass() const { return hp_; }
    double lowPass() const { return lp_; }

private:
    double alphaHP_;
    double alphaLP_;
    double hp_ {0.0};
    double lp_ {0.0};
    double prev_ {0.0};
    bool primed_ {false};
};

// ---------------------------------------------------------------------------
// FFT

// Owns one kiss_fftr plan, rebuilt only when the requested size changes.
class KissFftPlan {
public:
    KissFftPlan() = default;
    ~KissFftPlan();
    KissFftPlan(const KissFftPlan&) = delete;
    KissFftPlan& operator=(const KissFftPlan&) = delete;

    // Returns nullptr if allocation fails or nfft is not a positive even size
    kiss_fftr_cfg acquire(int nfft);
    void release();

    int size() const { return nfft_; }
    unsigned long long allocations() const { return allocations_; }

private:
    kiss_fftr_cfg cfg_ {nullptr};
    int nfft_ {0};
    unsigned long long allocations_ {0};
};

// ---------------------------------------------------------------------------
// Heart rate

constexpr int kSpectralMinSamples = 128;
constexpr double kCrossValidationToleranceBpm = 15.0;

// Adaptive-threshold peak detector over the newest hrWindowSize samples.
std::optional<HeartRateEstimate> estimateHeartRateTimeDomain(const std::vector<double>& window,
                                                             const BiometricConfiguration& cfg);

// Dominant in-band frequency of a Hann-windowed, zero-padded spectrum.
std::optional<HeartRateEstimate> estimateHeartRateSpectral(const std::vector<double>& window,
                                                           double sampleRate,
                                                           double minBPM,
                                                           double maxBPM,
                                                           KissFftPlan& plan);

// IR peaks -> green peaks -> spectral fallback, with FFT cross-validation.
std::optional<HeartRateEstimate> selectHeartRate(const std::vector<double>& ir,
                                                 const std::vector<double>& green,
                                                 const BiometricConfiguration& cfg,
                                                 KissFftPlan& plan);

// ---------------------------------------------------------------------------
// SpO2 and signal quality

constexpr double kMinRatioOfRatios = 0.4;
constexpr double kMaxRatioOfRatios = 3.4;

// Empirical calibration curve
double spo2FromRatio(double r);

std::optional<SpO2Estimate> estimateSpO2(const std::vector<double>& red,
                                         const std::vector<double>& ir,
                                         const BiometricConfiguration& cfg);

// (max - min) / mean; 0 for empty input or non-positive mean
double perfusionIndex(const std::vector<double>& signal);
SignalStrength classifySignalStrength(double perfusionIndex);
bool isWornFrom(double perfusionIndex, const std::optional<HeartRateEstimate>& hr,
                const BiometricConfiguration& cfg);

// ---------------------------------------------------------------------------
// Offline analysis

struct IrDcReading {
    double dc = 0.0;
    double rollingMean5s = 0.0;
    double shift5s = 0.0;   // positive = baseline dropped (occlusion / muscle activity)
};

// Low-pass IR baseline with a 5 s rolling mean and 1 s reference shift
class IrDcTracker {
public:
    explicit IrDcTracker(double sampleRate);

    IrDcReading process(double ir);
    const IrDcReading& current() const { return current_; }
    bool hasSignificantShift(double threshold = 1000.0) const { return current_.shift5s > threshold; }
    void reset();

private:
    ButterworthFilter lowpass_;
    CircularBuffer<double> dc_;
    size_t rollingSamples_;
    size_t referenceSamples_;
    IrDcReading current_ {};
};

// Beat-to-beat variability; intervals in ms
struct HrvMetrics {
    std::vector<double> rrList;   // kept intervals within the 40-180 BPM range
    double meanRR = 0.0;
    double sdnn = 0.0;
    double rmssd = 0.0;
    double sdsd = 0.0;
    double sd1 = 0.0;
    double sd2 = 0.0;
    double sd1sd2Ratio = 0.0;
};

struct RecordingAnalysis {
    std::optional<int> bpm;
    std::vector<int> peakIndices;   // relative to the analysed green window
    HrvMetrics hrv;
    IrDcReading irDc {};
    bool significantShift = false;
};

// RR list from successive peak indices. Variability metrics need at least two
// kept intervals and stay 0 otherwise.
HrvMetrics computeHrv(const std::vector<int>& peakIndices, double sampleRate);

// Local maxima that clear minProminence and sit minDistance apart
std::vector<int> findProminentPeaks(const std::vector<double>& signal, int minDistance, double minProminence);

// Zero-phase green-channel HR over the newest 10 s plus the IR DC baseline
RecordingAnalysis analyzeRecording(const std::vector<double>& green,
                                   const std::vector<double>& ir,
                                   double sampleRate);

} // namespace oralsense
