#pragma once

#include <vector>
#include <Jolt/Jolt.h>
#include <Jolt/Physics/Body/BodyID.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseLayer.h>
#include "Muffle.h"
#include "Sound/Occlusion/OcclusionInterfaces.hpp"

namespace JPH {
    class PhysicsSystem;
    class NarrowPhaseQuery;
}

// Segment query against a Jolt physics world.
//
// Reports one hit per body, nearest first. A ray that starts inside a collider
// does not hit it and back faces are ignored. Bodies on the host's pass-through
// layers (sensors, characters) and bodies passed to IgnoreBody (e.g. the
// emitter's own collider) never count.
class MUFFLE_API JoltGeometryQuery : public IGeometryQuery {
public:
    explicit JoltGeometryQuery(const JPH::PhysicsSystem& physics,
                               std::vector<JPH::ObjectLayer> passThroughLayers = {},
                               std::vector<JPH::BroadPhaseLayer> passThroughBroadPhaseLayers = {});

    std::vector<ObstructionHit> Query(const Vector3D& origin, const Vector3D& target, float maxDistance) override;

    void IgnoreBody(const JPH::BodyID& body);
    void StopIgnoringBody(const JPH::BodyID& body);

private:
    const JPH::NarrowPhaseQuery& m_query;
    std::vector<JPH::ObjectLayer> m_passThroughLayers;
    std::vector<JPH::BroadPhaseLayer> m_passThroughBroadPhaseLayers;
    std::vector<JPH::BodyID> m_ignoredBodies;
};
