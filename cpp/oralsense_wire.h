// Wire-format decoding for sensor notification packets
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace oralsense {

// Packet layout (all little-endian)
constexpr size_t kFrameCounterBytes = 4;
constexpr size_t kPpgSampleBytes = 12;      // red u32, ir u32, green u32
constexpr size_t kAccelSampleBytes = 6;     // x i16, y i16, z i16
constexpr size_t kTemperatureBytes = 2;     // i16 centidegrees
constexpr size_t kBatteryBytes = 4;         // i32 millivolts
constexpr size_t kCombinedSampleBytes = kPpgSampleBytes + kAccelSampleBytes;

constexpr int32_t kBatteryMinMillivolts = 2500;
constexpr int32_t kBatteryMaxMillivolts = 4500;

struct PpgSample {
    int32_t red = 0;
    int32_t ir = 0;
    int32_t green = 0;
    double timestamp = 0.0;
};

struct AccelSample {
    int16_t x = 0;
    int16_t y = 0;
    int16_t z = 0;
    double timestamp = 0.0;
};

// One synchronized PPG + accelerometer tick
struct RawSample {
    int32_t red = 0;
    int32_t ir = 0;
    int32_t green = 0;
    int16_t accelX = 0;
    int16_t accelY = 0;
    int16_t accelZ = 0;
    double timestamp = 0.0;
};

template <typename T>
struct Frame {
    uint32_t frameCounter = 0;
    std::vector<T> samples;
};

using PpgFrame = Frame<PpgSample>;
using AccelFrame = Frame<AccelSample>;

struct TemperatureReading {
    uint32_t frameCounter = 0;
    double celsius = 0.0;
};

struct BatteryReading {
    int32_t millivolts = 0;
    int percent = 0;
};

// All decoders return std::nullopt when the buffer cannot hold a header plus
// one sample. Trailing bytes shorter than one sample are dropped.
std::optional<uint32_t> decodeFrameCounter(const uint8_t* data, size_t len);
std::optional<PpgFrame> decodePpgPacket(const uint8_t* data, size_t len, double timestamp = 0.0);
std::optional<AccelFrame> decodeAccelPacket(const uint8_t* data, size_t len, double timestamp = 0.0);
std::optional<TemperatureReading> decodeTemperaturePacket(const uint8_t* data, size_t len);
std::optional<BatteryReading> decodeBatteryPacket(const uint8_t* data, size_t len);
std::optional<RawSample> decodeCombinedSample(const uint8_t* data, size_t len, double timestamp = 0.0);

// Payload-only variants (no frame counter prefix)
std::vector<PpgSample> decodePpgSamples(const uint8_t* data, size_t len, double timestamp = 0.0);
std::vector<AccelSample> decodeAccelSamples(const uint8_t* data, size_t len, double timestamp = 0.0);

inline std::optional<PpgFrame> decodePpgPacket(const std::vector<uint8_t>& b, double ts = 0.0) { return decodePpgPacket(b.data(), b.size(), ts); }
inline std::optional<AccelFrame> decodeAccelPacket(const std::vector<uint8_t>& b, double ts = 0.0) { return decodeAccelPacket(b.data(), b.size(), ts); }
inline std::optional<TemperatureReading> decodeTemperaturePacket(const std::vector<uint8_t>& b) { return decodeTemperaturePacket(b.data(), b.size()); }
inline std::optional<BatteryReading> decodeBatteryPacket(const std::vector<uint8_t>& b) { return decodeBatteryPacket(b.data(), b.size()); }
inline std::optional<RawSample> decodeCombinedSample(const std::vector<uint8_t>& b, double ts = 0.0) { return decodeCombinedSample(b.data(), b.size(), ts); }

// 3000 mV -> 0 %, 4200 mV -> 100 %, clamped. Range validation is the caller's job.
int batteryPercentFromMillivolts(int32_t millivolts);

// Result of feeding one frame counter to FrameSequenceTracker
struct FrameGap {
    uint32_t expected = 0;
    uint32_t received = 0;
    uint32_t missing = 0;      // frames skipped before `received`
    bool duplicate = false;    // repeated or out-of-order counter
    bool resync = false;       // large backwards jump (device restart)
};

// Detects lost notifications from the per-packet frame counter.
class FrameSequenceTracker {
public:
    // Backwards jumps larger than this, or landing closer to zero than the
    // jump itself, are treated as a counter restart
    static constexpr uint32_t kResyncWindow = 1024;

    FrameGap observe(uint32_t frameCounter);
    void reset();

    bool started() const { return started_; }
    unsigned long long framesReceived() const { return framesReceived_; }
    unsigned long long framesMissing() const { return framesMissing_; }
    unsigned long long duplicates() const { return duplicates_; }
    unsigned long long resyncs() const { return resyncs_; }

private:
    bool started_ {false};
    uint32_t last_ {0};
    unsigned long long framesReceived_ {0};
    unsigned long long framesMissing_ {0};
    unsigned long long duplicates_ {0};
    unsigned long long resyncs_ {0};
};

} // namespace oralsense
