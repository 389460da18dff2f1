#include "oralsense_core.h"
#include "oralsense_log.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace oralsense {

namespace {

static constexpr double PI = 3.141592653589793238462643383279502884;

static inline double clamp(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

static double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

// Population standard deviation
static double std_pop(const std::vector<double>& v, double mu) {
    if (v.empty()) return 0.0;
    double acc = 0.0;
    for (double x : v) acc += (x - mu) * (x - mu);
    return std::sqrt(acc / static_cast<double>(v.size()));
}

static double median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    const size_t n = v.size();
    if (n % 2 == 1) return v[n / 2];
    return 0.5 * (v[n / 2 - 1] + v[n / 2]);
}

// Newest n values of v
static std::vector<double> newest(const std::vector<double>& v, size_t n) {
    if (v.size() <= n) return v;
    return std::vector<double>(v.end() - static_cast<std::ptrdiff_t>(n), v.end());
}

static int nextPow2(int n) {
    int p = 1;
    while (p < n) p <<= 1;
    return p;
}

static Biquad designLowHigh(FilterType type, double fs, double fc, double Q) {
    const double K = std::tan(PI * fc / fs);
    const double norm = 1.0 / (1.0 + K / Q + K * K);
    Biquad bi;
    if (type == FilterType::LowPass) {
        bi.b0 = K * K * norm;
        bi.b1 = 2.0 * bi.b0;
        bi.b2 = bi.b0;
    } else {
        bi.b0 = norm;
        bi.b1 = -2.0 * norm;
        bi.b2 = norm;
    }
    bi.a1 = 2.0 * (K * K - 1.0) * norm;
    bi.a2 = (1.0 - K / Q + K * K) * norm;
    return bi;
}

static Biquad designBandpass(double fs, double fLow, double fHigh) {
    const double wl = std::tan(PI * fLow / fs);
    const double wh = std::tan(PI * fHigh / fs);
    const double bw = wh - wl;
    const double w0sq = wl * wh;
    const double norm = 1.0 / (1.0 + bw + w0sq);
    Biquad bi;
    bi.b0 = bw * norm;
    bi.b1 = 0.0;
    bi.b2 = -bi.b0;
    bi.a1 = 2.0 * (w0sq - 1.0) * norm;
    bi.a2 = (1.0 - bw + w0sq) * norm;
    return bi;
}

} // namespace

// ---------------------------------------------------------------------------
// Configuration / result helpers

BiometricConfiguration BiometricConfiguration::oralable() {
    return BiometricConfiguration{};
}

BiometricConfiguration BiometricConfiguration::anr() {
    BiometricConfiguration c;
    c.sampleRate = 100.0;
    return c;
}

const char* toString(HeartRateSource s) {
    switch (s) {
        case HeartRateSource::Ir: return "ir";
        case HeartRateSource::Green: return "green";
        case HeartRateSource::Fft: return "fft";
        case HeartRateSource::Unavailable: break;
    }
    return "unavailable";
}

const char* toString(SignalStrength s) {
    switch (s) {
        case SignalStrength::Weak: return "weak";
        case SignalStrength::Moderate: return "moderate";
        case SignalStrength::Strong: return "strong";
        case SignalStrength::None: break;
    }
    return "none";
}

const char* toString(ActivityType a) {
    switch (a) {
        case ActivityType::Clenching: return "clenching";
        case ActivityType::Grinding: return "grinding";
        case ActivityType::Motion: return "motion";
        case ActivityType::Relaxed: break;
    }
    return "relaxed";
}

const char* toString(ProcessingMethod m) {
    return m == ProcessingMethod::Batch ? "batch" : "realtime";
}

bool operator==(const HeartRateEstimate& a, const HeartRateEstimate& b) {
    return a.bpm == b.bpm && a.quality == b.quality && a.source == b.source;
}

bool operator==(const SpO2Estimate& a, const SpO2Estimate& b) {
    return a.percent == b.percent && a.quality == b.quality;
}

bool operator==(const BiometricResult& a, const BiometricResult& b) {
    return a.heartRate == b.heartRate
        && a.spo2 == b.spo2
        && a.perfusionIndex == b.perfusionIndex
        && a.signalStrength == b.signalStrength
        && a.isWorn == b.isWorn
        && a.activity == b.activity
        && a.motionLevel == b.motionLevel
        && a.method == b.method;
}

// ---------------------------------------------------------------------------
// Butterworth

ButterworthFilter::ButterworthFilter(FilterType type, double sampleRate, double cutoffLow,
                                     double cutoffHigh, int order)
    : type_(type) {
    const double nyq = 0.5 * sampleRate;
    if (!(sampleRate > 0.0) || !(cutoffLow > 0.0) || cutoffLow >= nyq) return;
    if (type == FilterType::BandPass && (!(cutoffHigh > cutoffLow) || cutoffHigh >= nyq)) return;

    if (order < 2) order = 2;
    if (order % 2) ++order;
    const int nsec = order / 2;
    sections_.reserve(static_cast<size_t>(nsec));
    for (int k = 0; k < nsec; ++k) {
        if (type == FilterType::BandPass) {
            sections_.push_back(designBandpass(sampleRate, cutoffLow, cutoffHigh));
        } else {
            const double Q = 1.0 / (2.0 * std::cos(PI * (2.0 * k + 1.0) / (2.0 * order)));
            sections_.push_back(designLowHigh(type, sampleRate, cutoffLow, Q));
        }
    }
}

double ButterworthFilter::process(double x) {
    for (auto& s : sections_) x = s.process(x);
    return x;
}

std::vector<double> ButterworthFilter::process(const std::vector<double>& x) {
    std::vector<double> y(x.size());
    for (size_t i = 0; i < x.size(); ++i) y[i] = process(x[i]);
    return y;
}

std::vector<double> ButterworthFilter::filtfilt(const std::vector<double>& x) {
    if (x.size() <= 3 || sections_.empty()) return x;
    reset();
    std::vector<double> y = process(x);
    std::reverse(y.begin(), y.end());
    reset();
    y = process(y);
    std::reverse(y.begin(), y.end());
    reset();
    return y;
}

void ButterworthFilter::reset() {
    for (auto& s : sections_) s.reset();
}

// ---------------------------------------------------------------------------
// KissFFT plan

KissFftPlan::~KissFftPlan() { release(); }

kiss_fftr_cfg KissFftPlan::acquire(int nfft) {
    if (nfft <= 0 || (nfft % 2) != 0) return nullptr;
    if (cfg_ && nfft_ == nfft) return cfg_;
    release();
    cfg_ = kiss_fftr_alloc(nfft, 0, nullptr, nullptr);
    if (!cfg_) {
        logWarning("kiss_fftr_alloc failed (nfft=%d)", nfft);
        return nullptr;
    }
    nfft_ = nfft;
    ++allocations_;
    logDebug("Created kiss_fftr_cfg (nfft=%d)", nfft);
    return cfg_;
}

void KissFftPlan::release() {
    if (cfg_) kiss_fftr_free(cfg_);
    cfg_ = nullptr;
    nfft_ = 0;
}

// ---------------------------------------------------------------------------
// Heart rate

std::optional<HeartRateEstimate> estimateHeartRateTimeDomain(const std::vector<double>& window,
                                                             const BiometricConfiguration& cfg) {
    const int need = cfg.hrWindowSize();
    if (need < 3 || window.size() < static_cast<size_t>(need)) return std::nullopt;
    const std::vector<double> x = newest(window, static_cast<size_t>(need));
    const double fs = cfg.sampleRate;

    const double mu = mean(x);
    const double sd = std_pop(x, mu);
    if (sd < 1.0) return std::nullopt;

    const double thr = mu + 0.6 * sd;
    const double minInterval = 60.0 / cfg.maxBPM;
    const double maxInterval = 60.0 / cfg.minBPM;

    std::vector<int> peaks;
    const int n = static_cast<int>(x.size());
    for (int i = 1; i + 1 < n; ++i) {
        if (!(x[i] > x[i - 1] && x[i] > x[i + 1] && x[i] > thr)) continue;
        if (!peaks.empty() && (i - peaks.back()) / fs < minInterval) continue;
        peaks.push_back(i);
    }
    if (peaks.size() < 2) return std::nullopt;

    std::vector<double> intervals;
    intervals.reserve(peaks.size());
    for (size_t j = 1; j < peaks.size(); ++j) {
        const double dt = (peaks[j] - peaks[j - 1]) / fs;
        if (dt >= minInterval && dt <= maxInterval) intervals.push_back(dt);
    }
    if (intervals.empty()) return std::nullopt;

    const double med = median(intervals);
    const int bpm = static_cast<int>(std::lround(60.0 / med));
    if (bpm < cfg.minBPM || bpm > cfg.maxBPM) return std::nullopt;

    HeartRateEstimate est;
    est.bpm = bpm;
    est.quality = 0.6 * clamp(sd / std::max(1.0, std::fabs(mu)), 0.0, 1.0)
                + 0.4 * clamp(static_cast<double>(intervals.size()) / 10.0, 0.0, 1.0);
    est.source = HeartRateSource::Ir;
    return est;
}

std::optional<HeartRateEstimate> estimateHeartRateSpectral(const std::vector<double>& window,
                                                           double sampleRate,
                                                           double minBPM,
                                                           double maxBPM,
                                                           KissFftPlan& plan) {
    const int n = static_cast<int>(window.size());
    if (n < kSpectralMinSamples || !(sampleRate > 0.0)) return std::nullopt;

    const int nfft = nextPow2(n);
    kiss_fftr_cfg cfg = plan.acquire(nfft);
    if (!cfg) {
        logDebug("spectral HR skipped: no FFT plan (nfft=%d)", nfft);
        return std::nullopt;
    }

    // DC removal + Hann window, zero-padded to nfft
    const double mu = mean(window);
    std::vector<kiss_fft_scalar> in(static_cast<size_t>(nfft), 0);
    for (int i = 0; i < n; ++i) {
        const double w = 0.5 - 0.5 * std::cos(2.0 * PI * i / (n - 1));
        in[i] = static_cast<kiss_fft_scalar>((window[i] - mu) * w);
    }
    const int kmax = nfft / 2 + 1;
    std::vector<kiss_fft_cpx> out(static_cast<size_t>(kmax));
    kiss_fftr(cfg, in.data(), out.data());

    const int half = nfft / 2;
    std::vector<double> mag(static_cast<size_t>(half));
    for (int k = 0; k < half; ++k) {
        const double re = out[k].r;
        const double im = out[k].i;
        mag[k] = std::sqrt(re * re + im * im);
    }

    const double df = sampleRate / nfft;
    const int minBin = std::max(1, static_cast<int>(std::ceil(minBPM / 60.0 / df)));
    const int maxBin = std::min(half - 1, static_cast<int>(std::floor(maxBPM / 60.0 / df)));
    if (minBin >= maxBin) return std::nullopt;

    int peakBin = minBin;
    double peak = mag[minBin];
    double sum = 0.0;
    for (int k = minBin; k <= maxBin; ++k) {
        sum += mag[k];
        if (mag[k] > peak) { peak = mag[k]; peakBin = k; }
    }
    if (!(peak > 0.0)) return std::nullopt;

    double bin = peakBin;
    if (peakBin > minBin && peakBin < maxBin) {
        const double a = mag[peakBin - 1];
        const double b = mag[peakBin];
        const double c = mag[peakBin + 1];
        const double denom = a - 2.0 * b + c;
        if (std::fabs(denom) > 1e-12) bin += 0.5 * (a - c) / denom;
    }

    const int bpm = static_cast<int>(std::lround(bin * df * 60.0));
    if (bpm < minBPM || bpm > maxBPM) return std::nullopt;

    const double avg = sum / static_cast<double>(maxBin - minBin + 1);
    HeartRateEstimate est;
    est.bpm = bpm;
    est.quality = avg > 0.0 ? clamp((peak / avg - 1.0) / 4.0, 0.0, 1.0) : 0.0;
    est.source = HeartRateSource::Fft;
    return est;
}

namespace {

// Time-domain estimate on one channel, cross-checked against the spectrum
std::optional<HeartRateEstimate> validatedPeakRate(const std::vector<double>& x,
                                                   HeartRateSource source,
                                                   const BiometricConfiguration& cfg,
                                                   KissFftPlan& plan) {
    auto td = estimateHeartRateTimeDomain(x, cfg);
    if (!td || td->quality < cfg.minHRQuality) return std::nullopt;
    td->source = source;
    auto fft = estimateHeartRateSpectral(x, cfg.sampleRate, cfg.minBPM, cfg.maxBPM, plan);
    if (fft && std::abs(fft->bpm - td->bpm) > kCrossValidationToleranceBpm) {
        logDebug("HR override: %s peaks %d bpm vs spectrum %d bpm", toString(source), td->bpm, fft->bpm);
        HeartRateEstimate est;
        est.bpm = fft->bpm;
        est.quality = td->quality * 0.8;
        est.source = HeartRateSource::Fft;
        return est;
    }
    return td;
}

} // namespace

std::optional<HeartRateEstimate> selectHeartRate(const std::vector<double>& ir,
                                                 const std::vector<double>& green,
                                                 const BiometricConfiguration& cfg,
                                                 KissFftPlan& plan) {
    if (auto hr = validatedPeakRate(ir, HeartRateSource::Ir, cfg, plan)) return hr;
    if (auto hr = validatedPeakRate(green, HeartRateSource::Green, cfg, plan)) return hr;

    const double fallbackQuality = cfg.minHRQuality * 0.7;
    for (const auto* ch : {&ir, &green}) {
        auto fft = estimateHeartRateSpectral(*ch, cfg.sampleRate, cfg.minBPM, cfg.maxBPM, plan);
        if (fft && fft->quality >= fallbackQuality) {
            logDebug("HR spectral fallback (%s): %d bpm q=%.2f",
                     ch == &ir ? "ir" : "green", fft->bpm, fft->quality);
            return fft;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// SpO2 / perfusion

double spo2FromRatio(double r) {
    return -45.060 * r * r + 30.354 * r + 94.845;
}

std::optional<SpO2Estimate> estimateSpO2(const std::vector<double>& red,
                                         const std::vector<double>& ir,
                                         const BiometricConfiguration& cfg) {
    const int need = cfg.spo2WindowSize();
    if (need < 1) return std::nullopt;
    if (red.size() < static_cast<size_t>(need) || ir.size() < static_cast<size_t>(need)) return std::nullopt;
    const std::vector<double> r = newest(red, static_cast<size_t>(need));
    const std::vector<double> i = newest(ir, static_cast<size_t>(need));

    const double dcRed = mean(r);
    const double dcIr = mean(i);
    if (!(dcRed > 0.0) || !(dcIr > 0.0)) return std::nullopt;

    const auto [rMin, rMax] = std::minmax_element(r.begin(), r.end());
    const auto [iMin, iMax] = std::minmax_element(i.begin(), i.end());
    const double acRed = *rMax - *rMin;
    const double acIr = *iMax - *iMin;
    if (!(acRed > 0.0) || !(acIr > 0.0)) return std::nullopt;

    const double redRatio = acRed / dcRed;
    const double irRatio = acIr / dcIr;
    const double R = redRatio / irRatio;
    if (R < kMinRatioOfRatios || R > kMaxRatioOfRatios) return std::nullopt;

    const double spo2 = spo2FromRatio(R);
    if (spo2 < cfg.minSpO2 || spo2 > cfg.maxSpO2) return std::nullopt;

    SpO2Estimate est;
    est.percent = std::round(spo2 * 10.0) / 10.0;
    est.quality = clamp(((redRatio + irRatio) / 2.0) / 0.1, 0.0, 1.0);
    return est;
}

double perfusionIndex(const std::vector<double>& signal) {
    if (signal.empty()) return 0.0;
    const double mu = mean(signal);
    if (!(mu > 0.0)) return 0.0;
    const auto [lo, hi] = std::minmax_element(signal.begin(), signal.end());
    return (*hi - *lo) / mu;
}

SignalStrength classifySignalStrength(double pi) {
    if (pi < 0.0005) return SignalStrength::None;
    if (pi < 0.002) return SignalStrength::Weak;
    if (pi < 0.005) return SignalStrength::Moderate;
    return SignalStrength::Strong;
}

bool isWornFrom(double pi, const std::optional<HeartRateEstimate>& hr,
                const BiometricConfiguration& cfg) {
    return pi > cfg.minPerfusionIndex
        && hr.has_value()
        && hr->bpm > 0
        && hr->quality > cfg.minHRQuality;
}

// ---------------------------------------------------------------------------
// Offline analysis

IrDcTracker::IrDcTracker(double sampleRate)
    : lowpass_(FilterType::LowPass, sampleRate, 0.8, 0.0, 4),
      dc_(static_cast<size_t>(std::max(1.0, sampleRate * 60.0))),
      rollingSamples_(static_cast<size_t>(std::max(1.0, sampleRate * 5.0))),
      referenceSamples_(static_cast<size_t>(std::max(1.0, sampleRate * 1.0))) {}

IrDcReading IrDcTracker::process(double ir) {
    const double dc = lowpass_.process(ir);
    dc_.push_back(dc);

    const size_t n = std::min(rollingSamples_, dc_.size());
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) sum += dc_.fromNewest(i);
    const double rolling = sum / static_cast<double>(n);

    double shift = 0.0;
    const size_t ref = std::min(referenceSamples_, n);
    if (n >= rollingSamples_ && ref > 0) {
        // First second of the 5 s window is its oldest part
        double refSum = 0.0;
        for (size_t i = 0; i < ref; ++i) refSum += dc_.fromNewest(n - 1 - i);
        shift = refSum / static_cast<double>(ref) - rolling;
    }

    current_.dc = dc;
    current_.rollingMean5s = rolling;
    current_.shift5s = shift;
    return current_;
}

void IrDcTracker::reset() {
    lowpass_.reset();
    dc_.clear();
    current_ = IrDcReading{};
}

std::vector<int> findProminentPeaks(const std::vector<double>& signal, int minDistance, double minProminence) {
    std::vector<int> peaks;
    const int n = static_cast<int>(signal.size());
    if (n < 5) return peaks;
    if (minDistance < 1) minDistance = 1;
    for (int i = 2; i < n - 2; ++i) {
        const double cur = signal[i];
        if (!(cur > signal[i - 1] && cur > signal[i + 1])) continue;
        if (!(cur > signal[i - 2] && cur > signal[i + 2])) continue;

        const int l0 = std::max(0, i - minDistance);
        const int r1 = std::min(n, i + minDistance + 1);
        const double leftMin = *std::min_element(signal.begin() + l0, signal.begin() + i);
        const double rightMin = *std::min_element(signal.begin() + i + 1, signal.begin() + r1);
        if (cur - std::max(leftMin, rightMin) < minProminence) continue;

        if (!peaks.empty() && i - peaks.back() < minDistance) continue;
        peaks.push_back(i);
    }
    return peaks;
}

HrvMetrics computeHrv(const std::vector<int>& peakIndices, double sampleRate) {
    HrvMetrics m;
    if (!(sampleRate > 0.0) || peakIndices.size() < 2) return m;

    const double minRR = 60000.0 / 180.0;
    const double maxRR = 60000.0 / 40.0;
    for (size_t i = 1; i < peakIndices.size(); ++i) {
        const double rr = (peakIndices[i] - peakIndices[i - 1]) * 1000.0 / sampleRate;
        if (rr >= minRR && rr <= maxRR) m.rrList.push_back(rr);
    }
    if (m.rrList.empty()) return m;
    m.meanRR = mean(m.rrList);
    if (m.rrList.size() < 2) return m;

    m.sdnn = std_pop(m.rrList, m.meanRR);

    std::vector<double> diff;
    diff.reserve(m.rrList.size() - 1);
    double sumsq = 0.0;
    for (size_t i = 1; i < m.rrList.size(); ++i) {
        const double d = m.rrList[i] - m.rrList[i - 1];
        diff.push_back(d);
        sumsq += d * d;
    }
    m.rmssd = std::sqrt(sumsq / static_cast<double>(diff.size()));
    m.sdsd = std_pop(diff, mean(diff));

    // Poincare plot axes
    m.sd1 = m.rmssd / std::sqrt(2.0);
    m.sd2 = std::sqrt(std::max(0.0, 2.0 * m.sdnn * m.sdnn - 0.5 * m.sdsd * m.sdsd));
    m.sd1sd2Ratio = (m.sd2 > 1e-12) ? m.sd1 / m.sd2 : 0.0;
    return m;
}

RecordingAnalysis analyzeRecording(const std::vector<double>& green,
                                   const std::vector<double>& ir,
                                   double sampleRate) {
    RecordingAnalysis res;
    if (!(sampleRate > 0.0)) return res;

    IrDcTracker tracker(sampleRate);
    for (double v : ir) tracker.process(v);
    res.irDc = tracker.current();
    res.significantShift = tracker.hasSignificantShift();

    const size_t maxSamples = static_cast<size_t>(sampleRate * 10.0);
    const size_t minSamples = static_cast<size_t>(sampleRate * 3.0);
    std::vector<double> x = newest(green, maxSamples);
    if (x.size() < minSamples || x.size() < 5) return res;

    // constant detrend keeps the raw DC level out of the filter transients
    const double mu = mean(x);
    for (double& v : x) v -= mu;

    ButterworthFilter bp(FilterType::BandPass, sampleRate, 0.5, 8.0, 4);
    const std::vector<double> y = bp.filtfilt(x);
    const double sd = std_pop(y, mean(y));
    if (!(sd > 1.0)) return res;

    res.peakIndices = findProminentPeaks(y, static_cast<int>(0.4 * sampleRate), 0.5 * sd);
    if (res.peakIndices.size() < 2) return res;
    res.hrv = computeHrv(res.peakIndices, sampleRate);
    logDebug("analyzeRecording: %zu peaks, rr=%zu sdnn=%.1f rmssd=%.1f",
             res.peakIndices.size(), res.hrv.rrList.size(), res.hrv.sdnn, res.hrv.rmssd);

    const double minInterval = 60.0 / 180.0;
    const double maxInterval = 60.0 / 40.0;
    std::vector<double> intervals;
    for (size_t j = 1; j < res.peakIndices.size(); ++j) {
        const double dt = (res.peakIndices[j] - res.peakIndices[j - 1]) / sampleRate;
        if (dt >= minInterval && dt <= maxInterval) intervals.push_back(dt);
    }
    if (intervals.empty()) return res;

    const int bpm = static_cast<int>(std::lround(60.0 / median(intervals)));
    if (bpm >= 40 && bpm <= 180) res.bpm = bpm;
    return res;
}

} // namespace oralsense
