#pragma once

#include <vector>
#include "Muffle.h"
#include "Math/Vector3D.hpp"
#include "Sound/Occlusion/OcclusionInterfaces.hpp"
#include "Sound/Occlusion/OcclusionSettings.hpp"

// Everything computed for one emitter on one frame (read-only, for tools and tests)
struct OcclusionFrame {
    float deltaTime = 0.0f;
    bool startup = false;

    float distance = 0.0f;
    int reportedObstructions = 0;   // records returned by the geometry query
    int obstructionCount = 0;       // records within the emitter -> listener segment

    float falloff = 0.0f;
    float dampen = 0.0f;
    float targetVolume = 0.0f;
    float volume = 0.0f;

    bool reverbApplied = false;
    float targetReverbLevel = 0.0f;
    float reverbLevel = 0.0f;
};

// Data for the editor gizmo: a ray toward the listener and the range sphere
struct OcclusionGizmo {
    Vector3D origin;
    Vector3D direction;     // unit vector, zero when emitter and listener coincide
    float maximumRange = 0.0f;
};

// OcclusionEstimator: drives one audio source's volume and reverb from the
// obstructions between it and the listener. Called once per frame by the host.
//
// Collaborators are not owned and must outlive the estimator. The reverb sink
// is optional; every other collaborator is required.
class MUFFLE_API OcclusionEstimator {
public:
    struct Collaborators {
        const IPositionProvider* emitter = nullptr;
        const IPositionProvider* listener = nullptr;
        IGeometryQuery* geometry = nullptr;
        IAudioSourceSink* source = nullptr;
        IReverbFilterSink* reverb = nullptr;
    };

    // Throws ConfigurationError for invalid settings and MissingCollaboratorError
    // for absent required collaborators.
    OcclusionEstimator(const OcclusionSettings& settings, const Collaborators& collaborators);
    ~OcclusionEstimator();

    OcclusionEstimator(const OcclusionEstimator&) = delete;
    OcclusionEstimator& operator=(const OcclusionEstimator&) = delete;

    // Startup frame: disables the source's own rolloff and jumps the outputs
    // straight to their targets. Calling Update() first starts implicitly.
    void Start();

    // Per-frame update. Never throws; a negative or non-finite deltaTime skips the frame.
    void Update(float deltaTime);

    bool IsStarted() const { return m_started; }

    // A disabled estimator writes nothing and keeps its smoothed state
    void SetEnabled(bool enabled) { m_enabled = enabled; }
    bool IsEnabled() const { return m_enabled; }

    const OcclusionSettings& GetSettings() const { return m_settings; }

    // Live edit. Invalid settings throw ConfigurationError and the previous
    // settings stay in effect.
    void SetSettings(const OcclusionSettings& settings);

    // Attach or detach (nullptr) the reverb effect
    void SetReverbSink(IReverbFilterSink* reverb) { m_reverb = reverb; }
    bool HasReverbSink() const { return m_reverb != nullptr; }

    float GetCurrentVolume() const { return m_currentVolume; }
    float GetCurrentReverbLevel() const { return m_currentReverbLevel; }
    const OcclusionFrame& GetLastFrame() const { return m_lastFrame; }

    // Debug visualization
    OcclusionGizmo GetDebugGizmo() const;
    void DrawGizmos(IGizmoDrawer& drawer) const;

private:
    void PerformOcclusion(float deltaTime, bool startup);
    static int CountObstructions(const std::vector<ObstructionHit>& hits, float segmentLength);

    OcclusionSettings m_settings;

    const IPositionProvider* m_emitter;
    const IPositionProvider* m_listener;
    IGeometryQuery* m_geometry;
    IAudioSourceSink* m_source;
    IReverbFilterSink* m_reverb;

    // Smoothed outputs, persisted across frames
    float m_currentVolume = 1.0f;
    float m_currentReverbLevel = 0.0f;

    OcclusionFrame m_lastFrame;
    bool m_started = false;
    bool m_enabled = true;
};
