// Recorded session loading (CSV) for offline replay
#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "oralsense_wire.h"

namespace oralsense {

struct SessionRecording {
    std::vector<double> red;
    std::vector<double> ir;
    std::vector<double> green;
    std::vector<double> accelX;
    std::vector<double> accelY;
    std::vector<double> accelZ;
    std::vector<double> timestamp;   // empty when the file has no timestamp column
    size_t skippedRows = 0;

    size_t size() const { return ir.size(); }
    bool hasTimestamps() const { return !timestamp.empty(); }
    std::vector<RawSample> toRawSamples() const;
};

// Header names are case-insensitive; '_' and ' ' are ignored, so "Accel_X",
// "accelx" and "ax" all select the same column. PPG_IR style names are accepted.
// Returns nullopt (and sets err) when a required column is missing or no row parses.
std::optional<SessionRecording> parseSessionCsv(std::istream& in, std::string* err);
std::optional<SessionRecording> loadSessionCsv(const std::string& path, std::string* err);

} // namespace oralsense
