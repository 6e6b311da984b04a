#include "pch.h"
#include "Physics/JoltGeometryQuery.hpp"
#include "Physics/CollisionFilters.hpp"

#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/NarrowPhaseQuery.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>

namespace {
    class IgnoredBodyFilter final : public JPH::BodyFilter {
    public:
        explicit IgnoredBodyFilter(const std::vector<JPH::BodyID>& ignored) : mIgnored(ignored) {}

        bool ShouldCollide(const JPH::BodyID& inBodyID) const override {
            return std::find(mIgnored.begin(), mIgnored.end(), inBodyID) == mIgnored.end();
        }

    private:
        const std::vector<JPH::BodyID>& mIgnored;
    };
}

JoltGeometryQuery::JoltGeometryQuery(const JPH::PhysicsSystem& physics,
                                     std::vector<JPH::ObjectLayer> passThroughLayers,
                                     std::vector<JPH::BroadPhaseLayer> passThroughBroadPhaseLayers)
    : m_query(physics.GetNarrowPhaseQuery())
    , m_passThroughLayers(std::move(passThroughLayers))
    , m_passThroughBroadPhaseLayers(std::move(passThroughBroadPhaseLayers)) {}

std::vector<ObstructionHit> JoltGeometryQuery::Query(const Vector3D& origin, const Vector3D& target, float maxDistance) {
    std::vector<ObstructionHit> result;

    Vector3D direction = (target - origin).Normalized();
    if (!(maxDistance > 0.0f) || direction.LengthSquared() == 0.0f) {
        return result; // emitter and listener coincide
    }

    JPH::RVec3 start(origin.x, origin.y, origin.z);
    JPH::Vec3 dir(direction.x, direction.y, direction.z);

    // The direction vector represents the full ray extent
    JPH::RRayCast ray(start, dir * maxDistance);

    JPH::RayCastSettings settings;
    settings.SetBackFaceMode(JPH::EBackFaceMode::IgnoreBackFaces);
    settings.mTreatConvexAsSolid = false;

    JPH::AllHitCollisionCollector<JPH::CastRayCollector> collector;
    OcclusionRayBroadPhaseFilter broadPhaseFilter(m_passThroughBroadPhaseLayers);
    OcclusionRayObjectFilter objectFilter(m_passThroughLayers);
    IgnoredBodyFilter bodyFilter(m_ignoredBodies);

    m_query.CastRay(ray, settings, collector, broadPhaseFilter, objectFilter, bodyFilter);
    collector.Sort();

    std::vector<JPH::BodyID> seen;
    for (const JPH::RayCastResult& hit : collector.mHits) {
        // Mesh colliders can report several triangles; a body counts once
        if (std::find(seen.begin(), seen.end(), hit.mBodyID) != seen.end()) continue;
        seen.push_back(hit.mBodyID);

        JPH::RVec3 hitPos = ray.GetPointOnRay(hit.mFraction);

        ObstructionHit obstruction;
        obstruction.point = Vector3D(static_cast<float>(hitPos.GetX()),
                                     static_cast<float>(hitPos.GetY()),
                                     static_cast<float>(hitPos.GetZ()));
        obstruction.distance = hit.mFraction * maxDistance;
        obstruction.bodyId = hit.mBodyID.GetIndexAndSequenceNumber();
        result.push_back(obstruction);
    }

    return result;
}

void JoltGeometryQuery::IgnoreBody(const JPH::BodyID& body) {
    if (std::find(m_ignoredBodies.begin(), m_ignoredBodies.end(), body) == m_ignoredBodies.end()) {
        m_ignoredBodies.push_back(body);
    }
}

void JoltGeometryQuery::StopIgnoringBody(const JPH::BodyID& body) {
    m_ignoredBodies.erase(std::remove(m_ignoredBodies.begin(), m_ignoredBodies.end(), body), m_ignoredBodies.end());
}
