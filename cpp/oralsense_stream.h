#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "oralsense_adaptive.h"
#include "oralsense_buffer.h"
#include "oralsense_core.h"
#include "oralsense_wire.h"

namespace oralsense {

// Per-sample PPG/accelerometer pipeline. All public members are serialized on
// one mutex; the configuration is fixed at construction.
class BiometricProcessor {
public:
    explicit BiometricProcessor(const BiometricConfiguration& cfg = BiometricConfiguration::oralable());

    // Raw ADC counts; accelerometer in LSB
    BiometricResult process(double ir, double red, double green,
                            double accelX, double accelY, double accelZ);
    BiometricResult process(const RawSample& s);

    // Resets, replays up to the shortest input length, returns the last result
    BiometricResult processBatch(const std::vector<double>& ir,
                                 const std::vector<double>& red,
                                 const std::vector<double>& green,
                                 const std::vector<double>& accelX,
                                 const std::vector<double>& accelY,
                                 const std::vector<double>& accelZ);
    BiometricResult processBatch(const std::vector<RawSample>& samples);

    // Clears buffers and filter state. The FFT plan is kept.
    void reset();

    size_t samplesBuffered() const;
    // Mean |magnitude - 1 g| over the buffered window, 0 when empty
    double meanMotionLevel() const;
    const BiometricConfiguration& configuration() const { return cfg_; }

private:
    BiometricResult processLocked(double ir, double red, double green,
                                  double accelX, double accelY, double accelZ);
    void resetLocked();

    const BiometricConfiguration cfg_;
    mutable std::mutex dataMutex_;

    // ir/green are band-limited for HR; red/irDc keep the DC level for SpO2 and PI
    CircularBuffer<double> ir_;
    CircularBuffer<double> green_;
    CircularBuffer<double> red_;
    CircularBuffer<double> irDc_;
    CircularBuffer<double> motion_;

    RecursiveBandpass irFilter_;
    RecursiveBandpass greenFilter_;
    MotionCompensator irCompensator_;
    MotionCompensator redCompensator_;
    MotionCompensator greenCompensator_;
    ActivityClassifier classifier_;
    KissFftPlan fftPlan_;

    // Scratch snapshots reused across calls
    std::vector<double> irScratch_;
    std::vector<double> greenScratch_;
    std::vector<double> redScratch_;
    std::vector<double> irDcScratch_;
};

} // namespace oralsense

// Optional plain C bridge (symbols have C linkage; still compiled as C++)
extern "C" {
    // nullptr cfg uses the oralable preset; an invalid cfg returns nullptr
    void* os_bp_create(const oralsense::BiometricConfiguration* cfg);
    // Returns 1 and fills out on success, 0 on null arguments
    int   os_bp_process(void* h, double ir, double red, double green,
                        double accelX, double accelY, double accelZ,
                        oralsense::BiometricResult* out);
    void  os_bp_reset(void* h);
    void  os_bp_destroy(void* h);
}
