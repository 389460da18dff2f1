// Configuration validation and textual overrides for tools and bridges
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "oralsense_core.h"

namespace oralsense {

// Returns false if the configuration is invalid. On failure, sets err_code
// (stable ORALSENSE_Exxx code) and err_msg (short reason). On success,
// err_code/msg are untouched. Validation only, no clamping.
bool validateConfiguration(const BiometricConfiguration& cfg,
                           const char** err_code,
                           std::string* err_msg);

// Sets one field by name ("sampleRate", "minBPM", ...). The value must parse
// as a finite number. The result is not validated here.
bool applyConfigurationOverride(BiometricConfiguration& cfg,
                                const std::string& key,
                                const std::string& value,
                                const char** err_code,
                                std::string* err_msg);

// "oralable" or "anr" (case-insensitive)
std::optional<BiometricConfiguration> presetByName(const std::string& name);

// Names accepted by applyConfigurationOverride
std::vector<std::string> configurationKeys();

} // namespace oralsense
