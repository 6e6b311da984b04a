#pragma once

#include "Muffle.h"

class IFalloffCurve;

// Distance attenuation before occlusion is applied
class MUFFLE_API FalloffModel {
public:
    // Evaluates the curve at distance / maxRange. No clamping: distances past
    // maxRange follow the curve's own edge behaviour.
    // maxRange must be positive (checked when the settings are validated).
    static float Evaluate(float distance, float maxRange, const IFalloffCurve& curve);
};
