#include "pch.h"
#include "Sound/Occlusion/OcclusionEstimator.hpp"
#include "Sound/Occlusion/OcclusionErrors.hpp"
#include "Sound/Occlusion/FalloffModel.hpp"
#include "Sound/Occlusion/OcclusionModel.hpp"
#include "Sound/Occlusion/TemporalSmoother.hpp"
#include "Logging.hpp"

namespace {
    template <typename T>
    T* Require(T* collaborator, const char* name) {
        if (!collaborator) {
            MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionEstimator] Missing collaborator: ", name);
            throw MissingCollaboratorError(std::string("OcclusionEstimator requires a ") + name);
        }
        return collaborator;
    }
}

OcclusionEstimator::OcclusionEstimator(const OcclusionSettings& settings, const Collaborators& collaborators)
    : m_settings(settings)
    , m_emitter(Require(collaborators.emitter, "emitter position provider"))
    , m_listener(Require(collaborators.listener, "listener position provider"))
    , m_geometry(Require(collaborators.geometry, "geometry query"))
    , m_source(Require(collaborators.source, "audio source sink"))
    , m_reverb(collaborators.reverb)
{
    m_settings.Validate();
}

OcclusionEstimator::~OcclusionEstimator() = default;

void OcclusionEstimator::Start() {
    if (m_started) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Debug, "[OcclusionEstimator] Start() called twice, ignoring");
        return;
    }

    // Distance attenuation comes from the falloff curve only
    m_source->DisableBuiltInRolloff();

    PerformOcclusion(1.0f, true);
    m_started = true;

    MUFFLE_PRINT(MuffleLogging::LogLevel::Debug, "[OcclusionEstimator] Started. volume=", m_currentVolume,
        " reverb=", m_reverb ? "on" : "off");
}

void OcclusionEstimator::Update(float deltaTime) {
    if (!m_enabled) return;

    if (!m_started) {
        Start();
        return;
    }

    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[OcclusionEstimator] Skipping frame with invalid deltaTime ", deltaTime);
        return;
    }

    PerformOcclusion(deltaTime, false);
}

void OcclusionEstimator::SetSettings(const OcclusionSettings& settings) {
    settings.Validate();
    m_settings = settings;
}

int OcclusionEstimator::CountObstructions(const std::vector<ObstructionHit>& hits, float segmentLength) {
    // Nothing past the listener counts, even if the query reports it
    return static_cast<int>(std::count_if(hits.begin(), hits.end(),
        [segmentLength](const ObstructionHit& hit) { return hit.distance <= segmentLength; }));
}

void OcclusionEstimator::PerformOcclusion(float deltaTime, bool startup) {
    const Vector3D emitterPos = m_emitter->GetPosition();
    const Vector3D listenerPos = m_listener->GetPosition();

    OcclusionFrame frame;
    frame.deltaTime = deltaTime;
    frame.startup = startup;

    frame.distance = Vector3D::Distance(emitterPos, listenerPos);

    std::vector<ObstructionHit> hits = m_geometry->Query(emitterPos, listenerPos, frame.distance);
    frame.reportedObstructions = static_cast<int>(hits.size());
    frame.obstructionCount = CountObstructions(hits, frame.distance);

    frame.falloff = FalloffModel::Evaluate(frame.distance, m_settings.maximumRange, *m_settings.falloffCurve);
    frame.dampen = OcclusionModel::Dampen(frame.obstructionCount, m_settings.dampenThreshold);
    frame.targetVolume = frame.dampen * frame.falloff;

    // The startup frame is a full-weight jump so there is no fade-in
    if (startup) {
        m_currentVolume = TemporalSmoother::Blend(m_currentVolume, frame.targetVolume, 1.0f);
    }
    else {
        m_currentVolume = TemporalSmoother::Smooth(m_currentVolume, frame.targetVolume, m_settings.smoothingRate, deltaTime);
    }
    frame.volume = m_currentVolume;
    m_source->SetVolume(m_currentVolume);

    if (m_reverb) {
        frame.reverbApplied = true;
        frame.targetReverbLevel = OcclusionModel::ReverbLevel(frame.obstructionCount, m_settings.reverbThreshold);

        if (startup) {
            m_currentReverbLevel = TemporalSmoother::Blend(m_currentReverbLevel, frame.targetReverbLevel, 1.0f);
        }
        else {
            m_currentReverbLevel = TemporalSmoother::Smooth(m_currentReverbLevel, frame.targetReverbLevel, m_settings.smoothingRate, deltaTime);
        }
        frame.reverbLevel = m_currentReverbLevel;
        m_reverb->SetReverbLevel(m_currentReverbLevel, ReverbPresetMode::User);
    }
    else {
        frame.reverbLevel = m_currentReverbLevel;
    }

    m_lastFrame = frame;
}

OcclusionGizmo OcclusionEstimator::GetDebugGizmo() const {
    OcclusionGizmo gizmo;
    gizmo.origin = m_emitter->GetPosition();
    // Normalized() leaves a zero vector when emitter and listener coincide
    gizmo.direction = (m_listener->GetPosition() - gizmo.origin).Normalized();
    gizmo.maximumRange = m_settings.maximumRange;
    return gizmo;
}

void OcclusionEstimator::DrawGizmos(IGizmoDrawer& drawer) const {
    OcclusionGizmo gizmo = GetDebugGizmo();
    drawer.DrawRay(gizmo.origin, gizmo.direction);
    drawer.DrawWireSphere(gizmo.origin, gizmo.maximumRange);
}
