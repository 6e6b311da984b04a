#include "pch.h"
#include "Sound/Occlusion/OcclusionSettings.hpp"
#include "Sound/Occlusion/OcclusionErrors.hpp"
#include "Logging.hpp"

namespace {
    [[noreturn]] void Reject(const std::string& message) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettings] ", message);
        throw ConfigurationError(message);
    }

    bool InUnitRange(float value) {
        return value >= 0.0f && value <= 1.0f; // false for NaN
    }
}

void OcclusionSettings::Validate() const {
    if (!falloffCurve) {
        Reject("falloffCurve is missing");
    }
    if (!std::isfinite(maximumRange) || maximumRange <= 0.0f) {
        Reject("maximumRange must be a positive finite value, got " + std::to_string(maximumRange));
    }
    if (!std::isfinite(smoothingRate) || smoothingRate <= 0.0f) {
        Reject("smoothingRate must be a positive finite value, got " + std::to_string(smoothingRate));
    }
    if (!InUnitRange(dampenThreshold)) {
        Reject("dampenThreshold must be within [0, 1], got " + std::to_string(dampenThreshold));
    }
    if (dampenThreshold == 0.0f) {
        // threshold ^ -1 for an unobstructed path would be an infinite boost
        Reject("dampenThreshold must be greater than 0");
    }
    if (!InUnitRange(reverbThreshold)) {
        Reject("reverbThreshold must be within [0, 1], got " + std::to_string(reverbThreshold));
    }

    auto keyframes = std::dynamic_pointer_cast<const KeyframeCurve>(falloffCurve);
    if (!keyframes) {
        return;
    }
    for (const CurveKeyframe& key : keyframes->GetKeys()) {
        if (!std::isfinite(key.time) || !std::isfinite(key.value)) {
            Reject("falloffCurve has a non-finite keyframe");
        }
    }
    if (!keyframes->IsNonIncreasing()) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[OcclusionSettings] falloffCurve gets louder with distance");
    }
    if (!keyframes->ValuesInUnitRange()) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[OcclusionSettings] falloffCurve has values outside [0, 1]");
    }
}
