#pragma once

#include <string>
#include "Muffle.h"
#include "Sound/Occlusion/OcclusionSettings.hpp"

// JSON persistence for emitter occlusion settings.
//
// {
//   "maximumRange": 25.0, "dampenThreshold": 0.1, "smoothingRate": 3.0, "reverbThreshold": 0.1,
//   "falloffCurve": { "keys": [ { "time": 0.0, "value": 1.0, "interpolation": "linear" }, ... ] }
// }
//
// Missing members keep their defaults. The result is validated before it is returned.
class MUFFLE_API OcclusionSettingsIO {
public:
    // Throws ConfigurationError on malformed JSON, wrong member types or invalid values
    static OcclusionSettings FromJson(const std::string& json);

    // Throws ConfigurationError if the falloff curve is not a KeyframeCurve
    static std::string ToJson(const OcclusionSettings& settings);

    // File variants log failures and return false; out is untouched on failure
    static bool LoadSettings(const std::string& filePath, OcclusionSettings& out);
    static bool SaveSettings(const std::string& filePath, const OcclusionSettings& settings);
};
