#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include "Muffle.h"
#include "Sound/Occlusion/OcclusionEstimator.hpp"

using EmitterHandle = uint32_t;

// OcclusionSystem: owns the occlusion estimators of every emitter in the scene
// and updates them once per frame from the host's update loop.
class MUFFLE_API OcclusionSystem {
public:
    OcclusionSystem() = default;
    ~OcclusionSystem() = default;

    // Non-copyable
    OcclusionSystem(const OcclusionSystem&) = delete;
    OcclusionSystem& operator=(const OcclusionSystem&) = delete;

    // Creates an estimator for a new emitter. Throws like the OcclusionEstimator constructor.
    EmitterHandle AddEmitter(const OcclusionSettings& settings, const OcclusionEstimator::Collaborators& collaborators);

    // Destroys the estimator and its smoothed state. Returns false for unknown handles.
    bool RemoveEmitter(EmitterHandle handle);

    OcclusionEstimator* GetEmitter(EmitterHandle handle);
    const OcclusionEstimator* GetEmitter(EmitterHandle handle) const;
    size_t GetEmitterCount() const { return m_emitters.size(); }

    // Per-frame update - call from main loop. Emitters update in creation order.
    void Update(float deltaTime);

    void DrawGizmos(IGizmoDrawer& drawer) const;

    void Clear();

private:
    std::map<EmitterHandle, std::unique_ptr<OcclusionEstimator>> m_emitters;
    EmitterHandle m_nextHandle = 1;
};
