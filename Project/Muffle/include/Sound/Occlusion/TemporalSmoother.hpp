#pragma once

#include "Muffle.h"

// Exponential-style smoothing of an output parameter toward its target.
class MUFFLE_API TemporalSmoother {
public:
    // Moves current toward target by rate * deltaTime. The factor is NOT clamped:
    // a factor above 1 overshoots the target for that frame.
    // Exact at the ends: factor 0 returns current, factor 1 returns target.
    static float Smooth(float current, float target, float rate, float deltaTime);

    // Same interpolation with an explicit factor (the startup frame uses 1)
    static float Blend(float current, float target, float factor);
};
