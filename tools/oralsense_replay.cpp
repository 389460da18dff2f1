// Replays a recorded session through BiometricProcessor and prints JSON
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

#include "oralsense_core.h"
#include "oralsense_log.h"
#include "oralsense_options.h"
#include "oralsense_session.h"
#include "oralsense_stream.h"

using namespace oralsense;

static std::string to_json(const BiometricResult& r) {
    std::ostringstream os;
    auto kv = [&](const char* k, double v){ os << "\""<<k<<"\":"<<v; };
    auto ks = [&](const char* k, const char* v){ os << "\""<<k<<"\":\""<<v<<"\""; };
    os << "{";
    os << "\"heartRate\":";
    if (r.heartRate) {
        os << "{"; kv("bpm", r.heartRate->bpm); os << ","; kv("quality", r.heartRate->quality); os << ",";
        ks("source", toString(r.heartRate->source)); os << "}";
    } else {
        os << "null";
    }
    os << ",\"spo2\":";
    if (r.spo2) {
        os << "{"; kv("percent", r.spo2->percent); os << ","; kv("quality", r.spo2->quality); os << "}";
    } else {
        os << "null";
    }
    os << ","; kv("perfusionIndex", r.perfusionIndex);
    os << ","; ks("signalStrength", toString(r.signalStrength));
    os << ",\"isWorn\":" << (r.isWorn ? "true" : "false");
    os << ","; ks("activity", toString(r.activity));
    os << ","; kv("motionLevel", r.motionLevel);
    os << ","; ks("method", toString(r.method));
    os << "}";
    return os.str();
}

static std::string to_json(const RecordingAnalysis& a) {
    std::ostringstream os;
    os << "{\"bpm\":";
    if (a.bpm) os << *a.bpm; else os << "null";
    os << ",\"peakCount\":" << a.peakIndices.size();
    auto kv = [&](const char* k, double v){ os << "\""<<k<<"\":"<<v; };
    os << ",\"hrv\":{\"rrCount\":" << a.hrv.rrList.size() << ",";
    kv("meanRR", a.hrv.meanRR); os << ","; kv("sdnn", a.hrv.sdnn); os << ",";
    kv("rmssd", a.hrv.rmssd); os << ","; kv("sdsd", a.hrv.sdsd); os << ",";
    kv("sd1", a.hrv.sd1); os << ","; kv("sd2", a.hrv.sd2);
    os << "}";
    os << ",\"irDc\":{\"dc\":" << a.irDc.dc
       << ",\"rollingMean5s\":" << a.irDc.rollingMean5s
       << ",\"shift5s\":" << a.irDc.shift5s << "}";
    os << ",\"significantShift\":" << (a.significantShift ? "true" : "false");
    os << "}";
    return os.str();
}

static void usage(const char* argv0) {
    std::fprintf(stderr,
                 "usage: %s [--preset oralable|anr] [--set key=value]... [--stream] [--verbose] <session.csv>\n",
                 argv0);
}

int main(int argc, char** argv) {
    BiometricConfiguration cfg = BiometricConfiguration::oralable();
    std::string path;
    bool stream = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--preset") == 0 && i + 1 < argc) {
            auto preset = presetByName(argv[++i]);
            if (!preset) {
                std::fprintf(stderr, "unknown preset: %s\n", argv[i]);
                return 1;
            }
            cfg = *preset;
        } else if (std::strcmp(arg, "--set") == 0 && i + 1 < argc) {
            const std::string kvArg = argv[++i];
            const size_t eq = kvArg.find('=');
            if (eq == std::string::npos) {
                std::fprintf(stderr, "--set expects key=value, got %s\n", kvArg.c_str());
                return 1;
            }
            const char* code = nullptr;
            std::string msg;
            if (!applyConfigurationOverride(cfg, kvArg.substr(0, eq), kvArg.substr(eq + 1), &code, &msg)) {
                std::fprintf(stderr, "%s: %s\n", code, msg.c_str());
                return 1;
            }
        } else if (std::strcmp(arg, "--stream") == 0) {
            stream = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            setVerboseLogging(true);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            usage(argv[0]);
            return 1;
        } else if (path.empty()) {
            path = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (path.empty()) {
        usage(argv[0]);
        return 1;
    }

    const char* code = nullptr;
    std::string msg;
    if (!validateConfiguration(cfg, &code, &msg)) {
        std::fprintf(stderr, "%s: %s\n", code, msg.c_str());
        return 1;
    }

    std::string err;
    auto session = loadSessionCsv(path, &err);
    if (!session) {
        std::fprintf(stderr, "cannot load session: %s\n", err.c_str());
        return 2;
    }
    logDebug("loaded %zu samples (%zu rows skipped) from %s",
             session->size(), session->skippedRows, path.c_str());

    BiometricProcessor processor(cfg);
    BiometricResult last;
    if (stream) {
        const size_t every = static_cast<size_t>(cfg.sampleRate) > 0 ? static_cast<size_t>(cfg.sampleRate) : 1;
        for (size_t i = 0; i < session->size(); ++i) {
            last = processor.process(session->ir[i], session->red[i], session->green[i],
                                     session->accelX[i], session->accelY[i], session->accelZ[i]);
            if ((i + 1) % every == 0) std::cout << to_json(last) << "\n";
        }
    } else {
        last = processor.processBatch(session->ir, session->red, session->green,
                                      session->accelX, session->accelY, session->accelZ);
    }

    const RecordingAnalysis analysis = analyzeRecording(session->green, session->ir, cfg.sampleRate);
    std::cout << "{\"samples\":" << session->size()
              << ",\"skippedRows\":" << session->skippedRows
              << ",\"meanMotionLevel\":" << processor.meanMotionLevel()
              << ",\"result\":" << to_json(last)
              << ",\"recording\":" << to_json(analysis) << "}" << std::endl;
    return 0;
}
