#pragma once

#include <memory>
#include "Muffle.h"
#include "Sound/Occlusion/FalloffCurve.hpp"

// OcclusionSettings - per-emitter configuration, editable live
struct MUFFLE_API OcclusionSettings {
    // Volume falloff based on normalized distance (distance / maximumRange)
    std::shared_ptr<const IFalloffCurve> falloffCurve = KeyframeCurve::Linear(0.0f, 1.0f, 1.0f, 0.0f);

    // Dampening applied for each intersection (0.0 - 1.0, zero rejected)
    float dampenThreshold = 0.1f;

    // Distance the audio travels without any collisions before falling off fully
    float maximumRange = 25.0f;

    // How quickly output parameters converge toward their targets
    float smoothingRate = 3.0f;

    // Change in reverb intensity for each intersection (0.0 - 1.0).
    // Only used when the estimator has a reverb sink.
    float reverbThreshold = 0.1f;

    // Throws ConfigurationError describing the first invalid field.
    // Curves that rise with distance or leave [0,1] are only warned about.
    void Validate() const;

    static float GetDefaultDampenThreshold() { return 0.1f; }
    static float GetDefaultMaximumRange() { return 25.0f; }
    static float GetDefaultSmoothingRate() { return 3.0f; }
    static float GetDefaultReverbThreshold() { return 0.1f; }
};
