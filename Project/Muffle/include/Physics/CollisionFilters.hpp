#pragma once

#include <algorithm>
#include <vector>
#include <Jolt/Jolt.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseLayer.h>

// Ray filters for occlusion queries. The host names the layers that never
// block sound (sensors, characters); everything else is solid geometry.

class OcclusionRayBroadPhaseFilter final : public JPH::BroadPhaseLayerFilter {
public:
    explicit OcclusionRayBroadPhaseFilter(const std::vector<JPH::BroadPhaseLayer>& blocked) : mBlocked(blocked) {}

    bool ShouldCollide(JPH::BroadPhaseLayer inLayer) const override {
        return std::find(mBlocked.begin(), mBlocked.end(), inLayer) == mBlocked.end();
    }

private:
    const std::vector<JPH::BroadPhaseLayer>& mBlocked;
};

class OcclusionRayObjectFilter final : public JPH::ObjectLayerFilter {
public:
    explicit OcclusionRayObjectFilter(const std::vector<JPH::ObjectLayer>& blocked) : mBlocked(blocked) {}

    bool ShouldCollide(JPH::ObjectLayer inLayer) const override {
        return std::find(mBlocked.begin(), mBlocked.end(), inLayer) == mBlocked.end();
    }

private:
    const std::vector<JPH::ObjectLayer>& mBlocked;
};
