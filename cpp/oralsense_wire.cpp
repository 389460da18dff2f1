#include "oralsense_wire.h"
#include "oralsense_log.h"

#include <algorithm>

namespace oralsense {

namespace {

inline uint32_t readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
        | (static_cast<uint32_t>(p[1]) << 8)
        | (static_cast<uint32_t>(p[2]) << 16)
        | (static_cast<uint32_t>(p[3]) << 24);
}

inline int32_t readI32LE(const uint8_t* p) {
    return static_cast<int32_t>(readU32LE(p));
}

inline int16_t readI16LE(const uint8_t* p) {
    return static_cast<int16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
}

inline PpgSample readPpg(const uint8_t* p, double ts) {
    PpgSample s;
    s.red = readI32LE(p + 0);
    s.ir = readI32LE(p + 4);
    s.green = readI32LE(p + 8);
    s.timestamp = ts;
    return s;
}

inline AccelSample readAccel(const uint8_t* p, double ts) {
    AccelSample s;
    s.x = readI16LE(p + 0);
    s.y = readI16LE(p + 2);
    s.z = readI16LE(p + 4);
    s.timestamp = ts;
    return s;
}

} // namespace

std::optional<uint32_t> decodeFrameCounter(const uint8_t* data, size_t len) {
    if (!data || len < kFrameCounterBytes) return std::nullopt;
    return readU32LE(data);
}

std::vector<PpgSample> decodePpgSamples(const uint8_t* data, size_t len, double timestamp) {
    std::vector<PpgSample> out;
    if (!data) return out;
    const size_t count = len / kPpgSampleBytes;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) out.push_back(readPpg(data + i * kPpgSampleBytes, timestamp));
    return out;
}

std::vector<AccelSample> decodeAccelSamples(const uint8_t* data, size_t len, double timestamp) {
    std::vector<AccelSample> out;
    if (!data) return out;
    const size_t count = len / kAccelSampleBytes;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) out.push_back(readAccel(data + i * kAccelSampleBytes, timestamp));
    return out;
}

std::optional<PpgFrame> decodePpgPacket(const uint8_t* data, size_t len, double timestamp) {
    if (!data || len < kFrameCounterBytes + kPpgSampleBytes) return std::nullopt;
    PpgFrame frame;
    frame.frameCounter = *decodeFrameCounter(data, len);
    frame.samples = decodePpgSamples(data + kFrameCounterBytes, len - kFrameCounterBytes, timestamp);
    return frame;
}

std::optional<AccelFrame> decodeAccelPacket(const uint8_t* data, size_t len, double timestamp) {
    if (!data || len < kFrameCounterBytes + kAccelSampleBytes) return std::nullopt;
    AccelFrame frame;
    frame.frameCounter = *decodeFrameCounter(data, len);
    frame.samples = decodeAccelSamples(data + kFrameCounterBytes, len - kFrameCounterBytes, timestamp);
    return frame;
}

std::optional<TemperatureReading> decodeTemperaturePacket(const uint8_t* data, size_t len) {
    if (!data || len < kFrameCounterBytes + kTemperatureBytes) return std::nullopt;
    TemperatureReading t;
    t.frameCounter = *decodeFrameCounter(data, len);
    t.celsius = static_cast<double>(readI16LE(data + kFrameCounterBytes)) / 100.0;
    return t;
}

int batteryPercentFromMillivolts(int32_t millivolts) {
    const int32_t pct = (millivolts - 3000) * 100 / 1200;
    return static_cast<int>(std::clamp<int32_t>(pct, 0, 100));
}

std::optional<BatteryReading> decodeBatteryPacket(const uint8_t* data, size_t len) {
    if (!data || len < kBatteryBytes) return std::nullopt;
    const int32_t mv = readI32LE(data);
    if (mv < kBatteryMinMillivolts || mv > kBatteryMaxMillivolts) return std::nullopt;
    BatteryReading b;
    b.millivolts = mv;
    b.percent = batteryPercentFromMillivolts(mv);
    return b;
}

std::optional<RawSample> decodeCombinedSample(const uint8_t* data, size_t len, double timestamp) {
    if (!data || len < kCombinedSampleBytes) return std::nullopt;
    const PpgSample p = readPpg(data, timestamp);
    const AccelSample a = readAccel(data + kPpgSampleBytes, timestamp);
    RawSample s;
    s.red = p.red;
    s.ir = p.ir;
    s.green = p.green;
    s.accelX = a.x;
    s.accelY = a.y;
    s.accelZ = a.z;
    s.timestamp = timestamp;
    return s;
}

FrameGap FrameSequenceTracker::observe(uint32_t frameCounter) {
    FrameGap gap;
    gap.received = frameCounter;
    if (!started_) {
        started_ = true;
        last_ = frameCounter;
        gap.expected = frameCounter;
        ++framesReceived_;
        return gap;
    }
    const uint32_t expected = last_ + 1u;
    gap.expected = expected;
    const uint32_t ahead = frameCounter - expected;  // modular
    if (ahead < 0x80000000u) {
        gap.missing = ahead;
        if (ahead > 0) {
            framesMissing_ += ahead;
            logDebug("frame gap: expected %u got %u (%u missing)", expected, frameCounter, ahead);
        }
        last_ = frameCounter;
        ++framesReceived_;
        return gap;
    }
    // a counter that fell back below its own distance restarted from zero
    const uint32_t behind = last_ - frameCounter;
    if (behind < kResyncWindow && frameCounter >= behind) {
        gap.duplicate = true;
        ++duplicates_;
        return gap;
    }
    gap.resync = true;
    ++resyncs_;
    ++framesReceived_;
    last_ = frameCounter;
    logDebug("frame counter restarted: %u after %u", frameCounter, expected - 1u);
    return gap;
}

void FrameSequenceTracker::reset() {
    started_ = false;
    last_ = 0;
    framesReceived_ = 0;
    framesMissing_ = 0;
    duplicates_ = 0;
    resyncs_ = 0;
}

} // namespace oralsense
