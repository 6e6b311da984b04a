#include "pch.h"
#include "Sound/Occlusion/OcclusionModel.hpp"

float OcclusionModel::Dampen(int obstructionCount, float threshold) {
    return std::pow(threshold, static_cast<float>(obstructionCount - 1));
}

float OcclusionModel::ReverbIntensity(int obstructionCount, float threshold) {
    return 1.0f - std::pow(threshold, static_cast<float>(obstructionCount - 1));
}

float OcclusionModel::ReverbLevel(int obstructionCount, float threshold) {
    float level = ReverbIntensity(obstructionCount, threshold) * kReverbLevelSpan + kReverbLevelMin;
    // NaN cannot reach the output: thresholds are validated, and clamp keeps -inf finite
    return std::clamp(level, kReverbLevelMin, kReverbLevelMax);
}
