#pragma once

#include "Muffle.h"

// Maps the number of obstructions between emitter and listener to audio parameters.
//
// The first obstruction is free: both mappings use the exponent (count - 1), so
// a single hit leaves the volume untouched and the reverb dry, and an
// unobstructed path (count 0) boosts the volume by 1 / threshold. Threshold
// defaults are tuned against this offset.
class MUFFLE_API OcclusionModel {
public:
    // Reverb level range of the output, in millibels
    static constexpr float kReverbLevelMin = -10000.0f;
    static constexpr float kReverbLevelMax = 2000.0f;
    static constexpr float kReverbLevelSpan = 12000.0f;

    // threshold ^ (count - 1)
    static float Dampen(int obstructionCount, float threshold);

    // 1 - threshold ^ (count - 1), before rescaling
    static float ReverbIntensity(int obstructionCount, float threshold);

    // ReverbIntensity rescaled to millibels (intensity * 12000 - 10000) and
    // clamped to [-10000, 2000]
    static float ReverbLevel(int obstructionCount, float threshold);
};
