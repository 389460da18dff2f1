#include "oralsense_session.h"
#include "oralsense_log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace oralsense {

namespace {

enum Column { kRed = 0, kIr, kGreen, kAx, kAy, kAz, kTimestamp, kColumnCount };

// Lowercase, drop separators
std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c == '_' || c == ' ' || c == '\t' || c == '\r' || c == '"') continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

int columnFor(const std::string& header) {
    const std::string h = normalize(header);
    if (h == "red" || h == "ppgred") return kRed;
    if (h == "ir" || h == "ppgir") return kIr;
    if (h == "green" || h == "ppggreen") return kGreen;
    if (h == "accelx" || h == "ax") return kAx;
    if (h == "accely" || h == "ay") return kAy;
    if (h == "accelz" || h == "az") return kAz;
    if (h == "timestamp" || h == "time" || h == "t") return kTimestamp;
    return -1;
}

// Comma separated, double quotes may wrap a field ("" escapes a quote)
std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> cols;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
            else quoted = !quoted;
        } else if (c == ',' && !quoted) {
            cols.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    cols.push_back(cur);
    return cols;
}

bool parseNumber(const std::string& field, double& out) {
    size_t b = 0, e = field.size();
    while (b < e && std::isspace(static_cast<unsigned char>(field[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(field[e - 1]))) --e;
    if (b == e) return false;
    const std::string s = field.substr(b, e - b);
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end && *end == '\0' && std::isfinite(out);
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::vector<RawSample> SessionRecording::toRawSamples() const {
    std::vector<RawSample> out(size());
    for (size_t i = 0; i < out.size(); ++i) {
        RawSample& s = out[i];
        s.red = static_cast<int32_t>(red[i]);
        s.ir = static_cast<int32_t>(ir[i]);
        s.green = static_cast<int32_t>(green[i]);
        s.accelX = static_cast<int16_t>(accelX[i]);
        s.accelY = static_cast<int16_t>(accelY[i]);
        s.accelZ = static_cast<int16_t>(accelZ[i]);
        s.timestamp = hasTimestamps() ? timestamp[i] : 0.0;
    }
    return out;
}

std::optional<SessionRecording> parseSessionCsv(std::istream& in, std::string* err) {
    std::string line;
    while (std::getline(in, line) && isBlank(line)) {}
    if (line.empty() || isBlank(line)) {
        if (err) *err = "session has no header row";
        return std::nullopt;
    }

    std::array<int, kColumnCount> index;
    index.fill(-1);
    const std::vector<std::string> header = splitCsvLine(line);
    for (size_t i = 0; i < header.size(); ++i) {
        const int c = columnFor(header[i]);
        if (c >= 0 && index[c] < 0) index[c] = static_cast<int>(i);
    }
    static const char* kRequired[] = {"red", "ir", "green", "accel_x", "accel_y", "accel_z"};
    for (int c = kRed; c <= kAz; ++c) {
        if (index[c] < 0) {
            if (err) *err = std::string("missing column: ") + kRequired[c];
            return std::nullopt;
        }
    }
    const bool withTs = index[kTimestamp] >= 0;
    const int lastCol = *std::max_element(index.begin(), index.end());

    SessionRecording rec;
    size_t lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (isBlank(line)) continue;
        const std::vector<std::string> fields = splitCsvLine(line);
        std::array<double, kColumnCount> v {};
        bool ok = static_cast<int>(fields.size()) > lastCol;
        for (int c = 0; ok && c < kColumnCount; ++c) {
            if (index[c] < 0) continue;
            ok = parseNumber(fields[static_cast<size_t>(index[c])], v[c]);
        }
        if (!ok) {
            ++rec.skippedRows;
            logDebug("session: skipping malformed row %zu", lineNo);
            continue;
        }
        rec.red.push_back(v[kRed]);
        rec.ir.push_back(v[kIr]);
        rec.green.push_back(v[kGreen]);
        rec.accelX.push_back(v[kAx]);
        rec.accelY.push_back(v[kAy]);
        rec.accelZ.push_back(v[kAz]);
        if (withTs) rec.timestamp.push_back(v[kTimestamp]);
    }

    if (rec.skippedRows > 0) logWarning("session: %zu malformed rows skipped", rec.skippedRows);
    if (rec.size() == 0) {
        if (err) *err = "session contains no samples";
        return std::nullopt;
    }
    return rec;
}

std::optional<SessionRecording> loadSessionCsv(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return std::nullopt;
    }
    return parseSessionCsv(in, err);
}

} // namespace oralsense
