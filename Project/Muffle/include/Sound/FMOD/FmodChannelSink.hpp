#pragma once

#include "Muffle.h"
#include "Sound/Occlusion/OcclusionInterfaces.hpp"

// Forward declarations for FMOD types to keep header lightweight
typedef struct FMOD_CHANNEL FMOD_CHANNEL;

// Drives an FMOD channel's volume from the occlusion estimator.
// The channel may be swapped (or cleared) when the sound restarts; writes to a
// null channel are dropped.
class MUFFLE_API FmodChannelSink : public IAudioSourceSink {
public:
    explicit FmodChannelSink(FMOD_CHANNEL* channel = nullptr);
    ~FmodChannelSink() override = default;

    void SetVolume(float volume) override;

    // Replaces the channel's rolloff with a flat custom curve so only the
    // occlusion falloff attenuates with distance
    void DisableBuiltInRolloff() override;

    // Re-applies the rolloff override to the new channel if it was requested before
    void SetChannel(FMOD_CHANNEL* channel);
    FMOD_CHANNEL* GetChannel() const { return m_channel; }

private:
    void ApplyFlatRolloff();

    FMOD_CHANNEL* m_channel;
    bool m_rolloffDisabled = false;
};
