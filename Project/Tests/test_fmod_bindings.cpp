#include <fmod.h>
#include <fmod_dsp_effects.h>
#include <fmod_errors.h>

#include <iostream>
#include "Sound/FMOD/FmodChannelSink.hpp"
#include "Sound/FMOD/FmodReverbFilter.hpp"
#include "Sound/Occlusion/OcclusionEstimator.hpp"
#include "TestSupport.hpp"

namespace {
  bool ok(FMOD_RESULT res, const char* what) {
    if (res != FMOD_OK) {
      std::cerr << "FAIL: " << what << ": " << FMOD_ErrorString(res) << "\n";
      ++g_failures;
      return false;
    }
    return true;
  }

  float wetLevel(FMOD_DSP* dsp) {
    float value = 0.0f;
    FMOD_DSP_GetParameterFloat(dsp, FMOD_DSP_SFXREVERB_WETLEVEL, &value, nullptr, 0);
    return value;
  }
}

static void testConversion() {
  check(FmodReverbFilter::MillibelsToWetLevel(-10000.0f) == -80.0f, "dry level clamps to -80 dB");
  check(FmodReverbFilter::MillibelsToWetLevel(2000.0f) == 20.0f, "max wet level is 20 dB");
  check(near(FmodReverbFilter::MillibelsToWetLevel(-1500.0f), -15.0), "millibels to decibels");
  check(FmodReverbFilter::MillibelsToWetLevel(5000.0f) == 20.0f, "overshoot clamps to 20 dB");
}

static void testOnChannel(FMOD_SYSTEM* system) {
  FMOD_DSP* osc = nullptr;
  if (!ok(FMOD_System_CreateDSPByType(system, FMOD_DSP_TYPE_OSCILLATOR, &osc), "create oscillator")) return;

  FMOD_CHANNEL* channel = nullptr;
  if (!ok(FMOD_System_PlayDSP(system, osc, nullptr, true, &channel), "play oscillator")) {
    FMOD_DSP_Release(osc);
    return;
  }

  {
    FmodChannelSink sink(channel);
    sink.SetVolume(0.25f);
    float volume = 0.0f;
    ok(FMOD_Channel_GetVolume(channel, &volume), "get volume");
    check(near(volume, 0.25), "volume written to the channel");

    sink.DisableBuiltInRolloff();
    FMOD_MODE mode = 0;
    ok(FMOD_Channel_GetMode(channel, &mode), "get mode");
    check((mode & FMOD_3D_CUSTOMROLLOFF) != 0, "custom rolloff selected");
    check((mode & FMOD_3D_INVERSEROLLOFF) == 0, "inverse rolloff cleared");

    FmodReverbFilter reverb(system, channel);
    reverb.SetReverbLevel(-2500.0f);
    check(near(wetLevel(reverb.GetDSP()), -25.0, 1e-3), "wet level written in dB");

    FMOD_BOOL bypass = 1;
    FMOD_DSP_GetBypass(reverb.GetDSP(), &bypass);
    check(!bypass, "user preset runs the effect");

    reverb.SetReverbLevel(0.0f, ReverbPresetMode::Off);
    FMOD_DSP_GetBypass(reverb.GetDSP(), &bypass);
    check(bypass != 0, "off preset bypasses the effect");

    // Driven by an estimator: clear path at 10 of 25 with one wall
    FixedPositionProvider emitter(Vector3D(0.0f, 0.0f, 0.0f));
    FixedPositionProvider listener(Vector3D(10.0f, 0.0f, 0.0f));
    ScriptedGeometryQuery geometry;
    geometry.SetHits(1, 4.0f);
    OcclusionEstimator::Collaborators wiring;
    wiring.emitter = &emitter;
    wiring.listener = &listener;
    wiring.geometry = &geometry;
    wiring.source = &sink;
    wiring.reverb = &reverb;

    OcclusionEstimator estimator(OcclusionSettings{}, wiring);
    estimator.Start();
    ok(FMOD_Channel_GetVolume(channel, &volume), "get volume");
    check(near(volume, 0.6, 1e-5), "estimator volume reaches the channel");
    check(wetLevel(reverb.GetDSP()) == -80.0f, "single wall leaves the reverb dry");

    // Restarted sound: both bindings follow the new channel
    FMOD_DSP* osc2 = nullptr;
    FMOD_CHANNEL* channel2 = nullptr;
    if (ok(FMOD_System_CreateDSPByType(system, FMOD_DSP_TYPE_OSCILLATOR, &osc2), "create second oscillator")
        && ok(FMOD_System_PlayDSP(system, osc2, nullptr, true, &channel2), "play second oscillator")) {
      int firstBefore = 0, secondBefore = 0;
      ok(FMOD_Channel_GetNumDSPs(channel, &firstBefore), "count first channel DSPs");
      ok(FMOD_Channel_GetNumDSPs(channel2, &secondBefore), "count second channel DSPs");

      sink.SetChannel(channel2);
      reverb.SetChannel(channel2);
      check(sink.GetChannel() == channel2, "sink follows the new channel");

      FMOD_MODE mode2 = 0;
      ok(FMOD_Channel_GetMode(channel2, &mode2), "get new channel mode");
      check((mode2 & FMOD_3D_CUSTOMROLLOFF) != 0, "rolloff override re-applied to the new channel");

      int firstAfter = 0, secondAfter = 0;
      ok(FMOD_Channel_GetNumDSPs(channel, &firstAfter), "count first channel DSPs");
      ok(FMOD_Channel_GetNumDSPs(channel2, &secondAfter), "count second channel DSPs");
      check(firstAfter == firstBefore - 1, "reverb removed from the old channel");
      check(secondAfter == secondBefore + 1, "reverb added to the new channel");

      sink.SetVolume(0.4f);
      float volume2 = 0.0f;
      ok(FMOD_Channel_GetVolume(channel2, &volume2), "get new channel volume");
      check(near(volume2, 0.4), "volume reaches the new channel");

      // Detach before the channel goes away
      reverb.SetChannel(nullptr);
      int secondDetached = 0;
      ok(FMOD_Channel_GetNumDSPs(channel2, &secondDetached), "count second channel DSPs");
      check(secondDetached == secondBefore, "null channel detaches the reverb");
      FMOD_Channel_Stop(channel2);
    }
    if (osc2) FMOD_DSP_Release(osc2);

    // Sink without a channel drops writes
    FmodChannelSink detached;
    detached.SetVolume(0.5f);
    detached.DisableBuiltInRolloff();
    check(detached.GetChannel() == nullptr, "detached sink keeps no channel");
  }

  FMOD_Channel_Stop(channel);
  FMOD_DSP_Release(osc);
}

int main() {
  testConversion();

  FMOD_SYSTEM* system = nullptr;
  if (!ok(FMOD_System_Create(&system, FMOD_VERSION), "create system")) return 1;
  ok(FMOD_System_SetOutput(system, FMOD_OUTPUTTYPE_NOSOUND), "select no-sound output");
  if (ok(FMOD_System_Init(system, 32, FMOD_INIT_NORMAL, nullptr), "init system")) {
    testOnChannel(system);
  }
  FMOD_System_Release(system);

  return g_failures == 0 ? 0 : 1;
}
