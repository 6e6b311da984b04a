#include <cmath>
#include <iostream>
#include <limits>
#include "Sound/Occlusion/OcclusionEstimator.hpp"
#include "Sound/Occlusion/OcclusionErrors.hpp"
#include "TestSupport.hpp"

namespace {
  // Emitter at the origin, listener 10 units down +X, default settings
  struct Rig {
    FixedPositionProvider emitter{Vector3D(0.0f, 0.0f, 0.0f)};
    FixedPositionProvider listener{Vector3D(10.0f, 0.0f, 0.0f)};
    ScriptedGeometryQuery geometry;
    RecordingSourceSink source;
    RecordingReverbSink reverb;

    OcclusionEstimator::Collaborators Wiring(bool withReverb = true) {
      OcclusionEstimator::Collaborators c;
      c.emitter = &emitter;
      c.listener = &listener;
      c.geometry = &geometry;
      c.source = &source;
      c.reverb = withReverb ? &reverb : nullptr;
      return c;
    }
  };

  template <typename Error, typename Fn>
  void expectThrow(Fn&& fn, const std::string& what) {
    try {
      fn();
    } catch (const Error&) {
      return;
    }
    std::cerr << "FAIL: expected exception: " << what << "\n";
    ++g_failures;
  }
}

static void testStartupScenario() {
  Rig rig;
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  estimator.Start();

  // Clear line of sight: falloff 0.6 boosted by 1 / 0.1
  const OcclusionFrame& frame = estimator.GetLastFrame();
  check(frame.startup, "first frame is the startup frame");
  check(near(frame.distance, 10.0), "distance 10");
  check(near(frame.falloff, 0.6), "falloff 0.6 at 10 of 25");
  check(frame.obstructionCount == 0, "no obstructions");
  check(near(frame.dampen, 10.0, 1e-5), "unobstructed dampen is 1 / threshold");
  check(near(frame.targetVolume, 6.0, 1e-5), "unobstructed target is 6");
  check(rig.source.volumes.size() == 1, "one volume write at startup");
  check(rig.source.volumes.back() == frame.targetVolume, "startup volume jumps to target");
  check(rig.geometry.calls == 1, "one query per frame");
  check(near(rig.geometry.lastMaxDistance, 10.0), "query limited to the emitter -> listener distance");
}

static void testSingleObstruction() {
  Rig rig;
  rig.geometry.SetHits(1, 5.0f);
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  estimator.Start();

  check(estimator.GetLastFrame().obstructionCount == 1, "one obstruction");
  check(near(estimator.GetCurrentVolume(), 0.6, 1e-6), "one obstruction leaves plain falloff");
  check(rig.reverb.levels.size() == 1 && rig.reverb.levels.back() == -10000.0f, "one obstruction is fully dry");
  check(rig.reverb.modes.back() == ReverbPresetMode::User, "reverb written with the user preset");
}

static void testSingleObstructionDryAtAnyDistance() {
  // Listener on the emitter, inside range, on the range edge, far past it
  const float distances[] = {0.0f, 10.0f, 25.0f, 40.0f, 1000.0f};
  for (float distance : distances) {
    Rig rig;
    rig.listener.SetPosition(Vector3D(distance, 0.0f, 0.0f));
    rig.geometry.hitDistances = {distance * 0.5f};
    OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
    estimator.Start();
    estimator.Update(0.016f);

    check(estimator.GetLastFrame().obstructionCount == 1, "one obstruction at distance " + std::to_string(distance));
    check(estimator.GetLastFrame().targetReverbLevel == -10000.0f,
        "one obstruction targets a dry reverb at distance " + std::to_string(distance));
    check(rig.reverb.levels.size() == 2 && rig.reverb.levels[0] == -10000.0f && rig.reverb.levels[1] == -10000.0f,
        "one obstruction writes a dry reverb at distance " + std::to_string(distance));
  }
}

static void testSmoothingTowardHeavierOcclusion() {
  Rig rig;
  rig.geometry.SetHits(1, 5.0f);
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  estimator.Start();

  rig.geometry.SetHits(3, 2.0f);
  estimator.Update(0.1f);

  const OcclusionFrame& frame = estimator.GetLastFrame();
  check(!frame.startup, "second frame is not startup");
  check(frame.obstructionCount == 3, "three obstructions");
  check(near(frame.dampen, 0.01, 1e-7), "dampen 0.1^2");
  check(near(frame.targetVolume, 0.006, 1e-7), "target 0.006");

  // lerp(0.6, 0.006, 3 * 0.1)
  check(near(estimator.GetCurrentVolume(), 0.4218, 1e-5), "volume smoothed by rate * dt");
  check(near(rig.source.volumes.back(), 0.4218, 1e-5), "smoothed volume written");

  // lerp(-10000, 1880, 0.3)
  check(near(frame.targetReverbLevel, 1880.0, 0.05), "three obstructions reverb target");
  check(near(estimator.GetCurrentReverbLevel(), -6436.0, 0.05), "reverb smoothed by rate * dt");

  // Converges with repeated frames
  for (int i = 0; i < 400; ++i) estimator.Update(0.016f);
  check(near(estimator.GetCurrentVolume(), 0.006, 1e-5), "volume converges to target");
  check(near(estimator.GetCurrentReverbLevel(), 1880.0, 0.5), "reverb converges to target");
}

static void testLargeStepOvershoots() {
  Rig rig;
  rig.geometry.SetHits(1, 5.0f);
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring(false));
  estimator.Start();

  rig.geometry.SetHits(3, 2.0f);
  estimator.Update(1.0f);

  // rate * dt = 3, so the blend passes the target
  check(near(estimator.GetCurrentVolume(), 0.6 + (0.006 - 0.6) * 3.0, 1e-5), "large dt overshoots");
  check(estimator.GetCurrentVolume() < 0.0f, "overshoot written as is");
}

static void testDeterministicReplay() {
  const int counts[] = {0, 1, 4, 2, 2, 7, 0, 1};
  const float dts[] = {0.016f, 0.033f, 0.016f, 0.25f, 0.016f, 0.1f, 0.016f, 0.05f};

  auto run = [&](std::vector<float>& volumes, std::vector<float>& levels) {
    Rig rig;
    OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
    estimator.Start();
    for (size_t i = 0; i < 8; ++i) {
      rig.geometry.SetHits(counts[i], 1.0f);
      rig.listener.SetPosition(Vector3D(10.0f + static_cast<float>(i), 1.0f, 0.0f));
      estimator.Update(dts[i]);
    }
    volumes = rig.source.volumes;
    levels = rig.reverb.levels;
  };

  std::vector<float> v1, v2, l1, l2;
  run(v1, l1);
  run(v2, l2);
  check(v1.size() == 9 && l1.size() == 9, "startup plus eight frames");
  check(v1 == v2, "volume sequence replays identically");
  check(l1 == l2, "reverb sequence replays identically");
}

static void testMissingCollaborators() {
  Rig rig;
  OcclusionSettings settings;

  auto without = [&](auto clear) {
    OcclusionEstimator::Collaborators c = rig.Wiring();
    clear(c);
    OcclusionEstimator estimator(settings, c);
  };

  expectThrow<MissingCollaboratorError>([&] { without([](auto& c) { c.emitter = nullptr; }); }, "no emitter");
  expectThrow<MissingCollaboratorError>([&] { without([](auto& c) { c.listener = nullptr; }); }, "no listener");
  expectThrow<MissingCollaboratorError>([&] { without([](auto& c) { c.geometry = nullptr; }); }, "no geometry");
  expectThrow<MissingCollaboratorError>([&] { without([](auto& c) { c.source = nullptr; }); }, "no source");

  OcclusionSettings bad;
  bad.maximumRange = 0.0f;
  expectThrow<ConfigurationError>([&] { OcclusionEstimator e(bad, rig.Wiring()); }, "zero maximum range");
}

static void testReverbIsOptional() {
  Rig rig;
  rig.geometry.SetHits(2, 1.0f);
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring(false));
  check(!estimator.HasReverbSink(), "no reverb sink");
  estimator.Start();
  estimator.Update(0.016f);
  check(rig.reverb.levels.empty(), "no reverb writes without a sink");
  check(!estimator.GetLastFrame().reverbApplied, "frame records reverb as skipped");
  check(estimator.GetCurrentReverbLevel() == 0.0f, "reverb state untouched");

  // Attached later, it starts from the persisted level
  estimator.SetReverbSink(&rig.reverb);
  estimator.Update(0.1f);
  check(rig.reverb.levels.size() == 1, "reverb written once attached");
  float target = estimator.GetLastFrame().targetReverbLevel;
  check(near(rig.reverb.levels.back(), 0.3 * target, 0.05), "attached reverb smooths from 0");
}

static void testHitsPastListenerIgnored() {
  Rig rig;
  rig.geometry.hitDistances = {2.0f, 10.0f, 20.0f, 30.0f};
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  estimator.Start();
  check(estimator.GetLastFrame().reportedObstructions == 4, "all records reported");
  check(estimator.GetLastFrame().obstructionCount == 2, "records past the listener are not counted");
  check(near(estimator.GetCurrentVolume(), 0.06, 1e-6), "two obstructions dampen once");
}

static void testCoincidentEmitterAndListener() {
  Rig rig;
  rig.listener.SetPosition(Vector3D(0.0f, 0.0f, 0.0f));
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  estimator.Start();

  check(estimator.GetLastFrame().distance == 0.0f, "zero distance");
  check(estimator.GetLastFrame().falloff == 1.0f, "full volume at the emitter");
  check(rig.geometry.lastMaxDistance == 0.0f, "zero length query");

  OcclusionGizmo gizmo = estimator.GetDebugGizmo();
  check(gizmo.direction.x == 0.0f && gizmo.direction.y == 0.0f && gizmo.direction.z == 0.0f,
      "gizmo direction is zero for coincident positions");
}

static void testInvalidDeltaTimeSkipped() {
  Rig rig;
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  estimator.Start();
  estimator.Update(std::numeric_limits<float>::quiet_NaN());
  estimator.Update(-0.5f);
  estimator.Update(std::numeric_limits<float>::infinity());
  check(rig.source.volumes.size() == 1, "invalid frames write nothing");
  check(rig.geometry.calls == 1, "invalid frames query nothing");

  estimator.Update(0.0f);
  check(rig.source.volumes.size() == 2, "zero dt is a valid frame");
  check(rig.source.volumes[1] == rig.source.volumes[0], "zero dt keeps the volume");
}

static void testStartLifecycle() {
  Rig rig;
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  check(!estimator.IsStarted(), "not started after construction");
  check(estimator.GetCurrentVolume() == 1.0f, "initial volume 1");
  check(rig.source.volumes.empty(), "construction writes nothing");

  // Update before Start runs the startup frame
  estimator.Update(0.5f);
  check(estimator.IsStarted(), "update starts implicitly");
  check(estimator.GetLastFrame().startup, "implicit start is a startup frame");
  check(estimator.GetCurrentVolume() == estimator.GetLastFrame().targetVolume, "implicit start jumps to target");

  estimator.Start();
  estimator.Update(0.016f);
  check(rig.source.rolloffDisabledCalls == 1, "built-in rolloff disabled once");
  check(rig.source.volumes.size() == 2, "second Start is ignored");
}

static void testDisabledWritesNothing() {
  Rig rig;
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  estimator.SetEnabled(false);
  estimator.Update(0.016f);
  check(!estimator.IsStarted(), "disabled estimator does not start");
  check(rig.source.volumes.empty() && rig.geometry.calls == 0, "disabled estimator is inert");

  estimator.SetEnabled(true);
  estimator.Update(0.016f);
  check(estimator.IsStarted(), "re-enabled estimator starts");

  float held = estimator.GetCurrentVolume();
  estimator.SetEnabled(false);
  rig.geometry.SetHits(5, 1.0f);
  estimator.Update(0.016f);
  check(estimator.GetCurrentVolume() == held, "disabled estimator keeps its state");
}

static void testLiveSettingsEdit() {
  Rig rig;
  rig.geometry.SetHits(1, 5.0f);
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());
  estimator.Start();

  OcclusionSettings bad;
  bad.dampenThreshold = 1.5f;
  expectThrow<ConfigurationError>([&] { estimator.SetSettings(bad); }, "threshold above 1");
  check(estimator.GetSettings().dampenThreshold == 0.1f, "rejected edit keeps previous settings");

  OcclusionSettings wider;
  wider.maximumRange = 50.0f;
  estimator.SetSettings(wider);
  estimator.Update(0.016f);
  check(near(estimator.GetLastFrame().falloff, 0.8), "new range applies on the next frame");
  check(near(estimator.GetLastFrame().targetVolume, 0.8), "target follows new range");
}

static void testGizmo() {
  Rig rig;
  rig.emitter.SetPosition(Vector3D(1.0f, 2.0f, 3.0f));
  rig.listener.SetPosition(Vector3D(1.0f, 2.0f, 7.0f));
  OcclusionEstimator estimator(OcclusionSettings{}, rig.Wiring());

  RecordingGizmoDrawer drawer;
  estimator.DrawGizmos(drawer);
  check(drawer.rays == 1 && drawer.spheres == 1, "one ray and one sphere");
  check(drawer.lastRayOrigin.x == 1.0f && drawer.lastRayOrigin.y == 2.0f && drawer.lastRayOrigin.z == 3.0f,
      "ray starts at the emitter");
  check(near(drawer.lastRayDirection.z, 1.0) && drawer.lastRayDirection.x == 0.0f, "ray points at the listener");
  check(drawer.lastRadius == 25.0f, "sphere radius is the maximum range");
}

int main() {
  testStartupScenario();
  testSingleObstruction();
  testSingleObstructionDryAtAnyDistance();
  testSmoothingTowardHeavierOcclusion();
  testLargeStepOvershoots();
  testDeterministicReplay();
  testMissingCollaborators();
  testReverbIsOptional();
  testHitsPastListenerIgnored();
  testCoincidentEmitterAndListener();
  testInvalidDeltaTimeSkipped();
  testStartLifecycle();
  testDisabledWritesNothing();
  testLiveSettingsEdit();
  testGizmo();

  if (g_failures == 0) std::cout << "occlusion estimator: all checks passed\n";
  return g_failures == 0 ? 0 : 1;
}
