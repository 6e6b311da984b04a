#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Muffle.h"

// Volume multiplier as a function of normalized distance (distance / maximumRange).
// Implementations are expected to return values in [0,1] and be non-increasing.
class MUFFLE_API IFalloffCurve {
public:
    virtual ~IFalloffCurve() = default;
    virtual float Evaluate(float x) const = 0;
};

enum class CurveInterpolation {
    Linear,     // straight line to the next key
    Smooth,     // smoothstep ease between this key and the next
    Constant    // hold this key's value until the next key
};

struct CurveKeyframe {
    float time = 0.0f;
    float value = 0.0f;
    CurveInterpolation interpolation = CurveInterpolation::Linear;
};

// Piecewise curve over sorted keyframes. Before the first key and after the last
// key the curve is flat.
class MUFFLE_API KeyframeCurve : public IFalloffCurve {
public:
    KeyframeCurve() = default;
    explicit KeyframeCurve(std::vector<CurveKeyframe> keys);

    static std::shared_ptr<KeyframeCurve> Linear(float timeStart, float valueStart, float timeEnd, float valueEnd);
    static std::shared_ptr<KeyframeCurve> EaseInOut(float timeStart, float valueStart, float timeEnd, float valueEnd);
    static std::shared_ptr<KeyframeCurve> Constant(float value);

    float Evaluate(float x) const override;

    // Keeps keys sorted by time; a key at an existing time replaces it
    void AddKey(const CurveKeyframe& key);
    const std::vector<CurveKeyframe>& GetKeys() const { return keys; }
    bool IsEmpty() const { return keys.empty(); }

    // True when no key is louder than the one before it
    bool IsNonIncreasing() const;
    bool ValuesInUnitRange() const;

private:
    std::vector<CurveKeyframe> keys;

    size_t GetSegmentIndex(float x) const;
};

MUFFLE_API const char* CurveInterpolationToString(CurveInterpolation interpolation);
MUFFLE_API bool CurveInterpolationFromString(const std::string& name, CurveInterpolation& out);
