#include "pch.h"
#include "Sound/Occlusion/OcclusionSystem.hpp"
#include "Logging.hpp"

EmitterHandle OcclusionSystem::AddEmitter(const OcclusionSettings& settings, const OcclusionEstimator::Collaborators& collaborators) {
    auto estimator = std::make_unique<OcclusionEstimator>(settings, collaborators);

    EmitterHandle handle = m_nextHandle++;
    m_emitters.emplace(handle, std::move(estimator));

    MUFFLE_PRINT(MuffleLogging::LogLevel::Debug, "[OcclusionSystem] Added emitter ", handle, " (", m_emitters.size(), " total)");
    return handle;
}

bool OcclusionSystem::RemoveEmitter(EmitterHandle handle) {
    auto it = m_emitters.find(handle);
    if (it == m_emitters.end()) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[OcclusionSystem] RemoveEmitter: unknown handle ", handle);
        return false;
    }

    m_emitters.erase(it);
    MUFFLE_PRINT(MuffleLogging::LogLevel::Debug, "[OcclusionSystem] Removed emitter ", handle);
    return true;
}

OcclusionEstimator* OcclusionSystem::GetEmitter(EmitterHandle handle) {
    auto it = m_emitters.find(handle);
    return it != m_emitters.end() ? it->second.get() : nullptr;
}

const OcclusionEstimator* OcclusionSystem::GetEmitter(EmitterHandle handle) const {
    auto it = m_emitters.find(handle);
    return it != m_emitters.end() ? it->second.get() : nullptr;
}

void OcclusionSystem::Update(float deltaTime) {
    for (auto& [handle, estimator] : m_emitters) {
        estimator->Update(deltaTime);
    }
}

void OcclusionSystem::DrawGizmos(IGizmoDrawer& drawer) const {
    for (const auto& [handle, estimator] : m_emitters) {
        estimator->DrawGizmos(drawer);
    }
}

void OcclusionSystem::Clear() {
    m_emitters.clear();
}
