#include "pch.h"
#include "Sound/Occlusion/TemporalSmoother.hpp"

float TemporalSmoother::Smooth(float current, float target, float rate, float deltaTime) {
    return Blend(current, target, rate * deltaTime);
}

float TemporalSmoother::Blend(float current, float target, float factor) {
    // std::lerp extrapolates outside [0,1] and keeps lerp(a, a, t) == a
    return std::lerp(current, target, factor);
}
