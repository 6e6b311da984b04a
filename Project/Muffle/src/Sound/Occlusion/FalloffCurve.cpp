#include "pch.h"
#include "Sound/Occlusion/FalloffCurve.hpp"

KeyframeCurve::KeyframeCurve(std::vector<CurveKeyframe> inKeys) {
    for (const CurveKeyframe& key : inKeys) {
        AddKey(key);
    }
}

std::shared_ptr<KeyframeCurve> KeyframeCurve::Linear(float timeStart, float valueStart, float timeEnd, float valueEnd) {
    auto curve = std::make_shared<KeyframeCurve>();
    curve->AddKey({ timeStart, valueStart, CurveInterpolation::Linear });
    curve->AddKey({ timeEnd, valueEnd, CurveInterpolation::Linear });
    return curve;
}

std::shared_ptr<KeyframeCurve> KeyframeCurve::EaseInOut(float timeStart, float valueStart, float timeEnd, float valueEnd) {
    auto curve = std::make_shared<KeyframeCurve>();
    curve->AddKey({ timeStart, valueStart, CurveInterpolation::Smooth });
    curve->AddKey({ timeEnd, valueEnd, CurveInterpolation::Smooth });
    return curve;
}

std::shared_ptr<KeyframeCurve> KeyframeCurve::Constant(float value) {
    auto curve = std::make_shared<KeyframeCurve>();
    curve->AddKey({ 0.0f, value, CurveInterpolation::Constant });
    return curve;
}

void KeyframeCurve::AddKey(const CurveKeyframe& key) {
    auto it = std::lower_bound(keys.begin(), keys.end(), key.time,
        [](const CurveKeyframe& k, float t) { return k.time < t; });

    if (it != keys.end() && it->time == key.time) {
        *it = key;
        return;
    }
    keys.insert(it, key);
}

/* Gets the index of the key that starts the segment containing x.
   Caller guarantees keys.front().time < x < keys.back().time */
size_t KeyframeCurve::GetSegmentIndex(float x) const {
    for (size_t index = 0; index + 1 < keys.size(); ++index) {
        if (x < keys[index + 1].time)
            return index;
    }
    return keys.size() - 2;
}

float KeyframeCurve::Evaluate(float x) const {
    if (keys.empty())
        return 1.0f;

    // Flat extrapolation on both sides; NaN input also lands on the first key
    if (!(x > keys.front().time))
        return keys.front().value;
    if (x >= keys.back().time)
        return keys.back().value;

    size_t k0 = GetSegmentIndex(x);
    const CurveKeyframe& from = keys[k0];
    const CurveKeyframe& to = keys[k0 + 1];

    float factor = (x - from.time) / (to.time - from.time);

    switch (from.interpolation) {
        case CurveInterpolation::Constant:
            return from.value;
        case CurveInterpolation::Smooth:
            factor = factor * factor * (3.0f - 2.0f * factor);
            break;
        case CurveInterpolation::Linear:
            break;
    }
    return std::lerp(from.value, to.value, factor);
}

bool KeyframeCurve::IsNonIncreasing() const {
    for (size_t i = 1; i < keys.size(); ++i) {
        if (keys[i].value > keys[i - 1].value)
            return false;
    }
    return true;
}

bool KeyframeCurve::ValuesInUnitRange() const {
    return std::all_of(keys.begin(), keys.end(),
        [](const CurveKeyframe& k) { return k.value >= 0.0f && k.value <= 1.0f; });
}

const char* CurveInterpolationToString(CurveInterpolation interpolation) {
    switch (interpolation) {
        case CurveInterpolation::Linear:   return "linear";
        case CurveInterpolation::Smooth:   return "smooth";
        case CurveInterpolation::Constant: return "constant";
    }
    return "linear";
}

bool CurveInterpolationFromString(const std::string& name, CurveInterpolation& out) {
    if (name == "linear")   { out = CurveInterpolation::Linear;   return true; }
    if (name == "smooth")   { out = CurveInterpolation::Smooth;   return true; }
    if (name == "constant") { out = CurveInterpolation::Constant; return true; }
    return false;
}
