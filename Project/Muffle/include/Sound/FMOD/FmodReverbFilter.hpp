#pragma once

#include "Muffle.h"
#include "Sound/Occlusion/OcclusionInterfaces.hpp"

// Forward declarations for FMOD types to keep header lightweight
typedef struct FMOD_SYSTEM FMOD_SYSTEM;
typedef struct FMOD_CHANNEL FMOD_CHANNEL;
typedef struct FMOD_DSP FMOD_DSP;

// Reverb effect on one FMOD channel, backed by an SFX reverb DSP.
//
// Reverb levels arrive in millibels ([-10000, 2000]) and are written to the
// DSP's wet level in decibels, clamped to what the DSP accepts ([-80, 20]).
class MUFFLE_API FmodReverbFilter : public IReverbFilterSink {
public:
    static constexpr float kWetLevelMinDb = -80.0f;
    static constexpr float kWetLevelMaxDb = 20.0f;

    // Creates the DSP and attaches it to the channel (if any).
    // Throws std::runtime_error when FMOD cannot create the DSP.
    FmodReverbFilter(FMOD_SYSTEM* system, FMOD_CHANNEL* channel);
    ~FmodReverbFilter() override;

    FmodReverbFilter(const FmodReverbFilter&) = delete;
    FmodReverbFilter& operator=(const FmodReverbFilter&) = delete;

    void SetReverbLevel(float level, ReverbPresetMode mode = ReverbPresetMode::User) override;

    // Moves the DSP to another channel (nullptr detaches)
    void SetChannel(FMOD_CHANNEL* channel);

    FMOD_DSP* GetDSP() const { return m_dsp; }

    static float MillibelsToWetLevel(float millibels);

private:
    void Attach();
    void Detach();

    FMOD_DSP* m_dsp = nullptr;
    FMOD_CHANNEL* m_channel = nullptr;
    bool m_attached = false;
};
