#include "pch.h"
#include "Sound/Occlusion/FalloffModel.hpp"
#include "Sound/Occlusion/FalloffCurve.hpp"

float FalloffModel::Evaluate(float distance, float maxRange, const IFalloffCurve& curve) {
    return curve.Evaluate(distance / maxRange);
}
