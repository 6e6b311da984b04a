#pragma once

#include <cstdint>
#include <vector>
#include "Muffle.h"
#include "Math/Vector3D.hpp"

// ---------------------------------------------------------------------------
// Collaborators of the occlusion estimator. The host engine implements these
// (see Physics/JoltGeometryQuery.hpp and Sound/FMOD/ for the bundled bindings).
// ---------------------------------------------------------------------------

// One intersection along the emitter -> listener segment
struct ObstructionHit {
    Vector3D point;
    float distance = 0.0f;      // from the query origin
    uint64_t bodyId = 0;        // engine-specific identity, not used by the estimator
};

// Segment query against scene geometry.
class MUFFLE_API IGeometryQuery {
public:
    virtual ~IGeometryQuery() = default;

    // Returns the obstructions between origin and target, nearest first.
    // Hits farther than maxDistance from origin must not be reported.
    virtual std::vector<ObstructionHit> Query(const Vector3D& origin, const Vector3D& target, float maxDistance) = 0;
};

// World position of a scene object (emitter or listener transform)
class MUFFLE_API IPositionProvider {
public:
    virtual ~IPositionProvider() = default;
    virtual Vector3D GetPosition() const = 0;
};

// Position provider for objects the host moves by hand
class MUFFLE_API FixedPositionProvider : public IPositionProvider {
public:
    FixedPositionProvider() = default;
    explicit FixedPositionProvider(const Vector3D& pos) : position(pos) {}

    Vector3D GetPosition() const override { return position; }
    void SetPosition(const Vector3D& pos) { position = pos; }

private:
    Vector3D position;
};

// The audio source whose volume is driven by occlusion
class MUFFLE_API IAudioSourceSink {
public:
    virtual ~IAudioSourceSink() = default;

    virtual void SetVolume(float volume) = 0;

    // Called once at startup: the estimator owns distance attenuation, so the
    // backend's own distance rolloff must not be applied on top.
    virtual void DisableBuiltInRolloff() = 0;
};

enum class ReverbPresetMode {
    Off,    // effect bypassed
    User    // user-defined parameters, reverb level applied as given
};

// Optional reverb effect on the audio source
class MUFFLE_API IReverbFilterSink {
public:
    virtual ~IReverbFilterSink() = default;

    // level in millibels, [-10000 (dry), 2000 (max wet)]
    virtual void SetReverbLevel(float level, ReverbPresetMode mode = ReverbPresetMode::User) = 0;
};

// Debug rendering hook
class MUFFLE_API IGizmoDrawer {
public:
    virtual ~IGizmoDrawer() = default;
    virtual void DrawRay(const Vector3D& origin, const Vector3D& direction) = 0;
    virtual void DrawWireSphere(const Vector3D& center, float radius) = 0;
};
