#include "pch.h"
#include "Sound/FMOD/FmodChannelSink.hpp"
#include "Logging.hpp"

#include <fmod.h>
#include <fmod_errors.h>

namespace {
    // Full volume at every distance. FMOD keeps a pointer to the points, so
    // they must outlive every channel using them.
    FMOD_VECTOR g_flatRolloff[2] = {
        { 0.0f, 1.0f, 0.0f },
        { 1.0f, 1.0f, 0.0f }
    };

    constexpr FMOD_MODE kRolloffModes = FMOD_3D_INVERSEROLLOFF | FMOD_3D_LINEARROLLOFF
        | FMOD_3D_LINEARSQUAREROLLOFF | FMOD_3D_INVERSETAPEREDROLLOFF | FMOD_3D_CUSTOMROLLOFF;
}

FmodChannelSink::FmodChannelSink(FMOD_CHANNEL* channel)
    : m_channel(channel) {}

void FmodChannelSink::SetVolume(float volume) {
    if (!m_channel) return;

    FMOD_RESULT res = FMOD_Channel_SetVolume(m_channel, volume);
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[FmodChannelSink] SetVolume failed: ", FMOD_ErrorString(res));
    }
}

void FmodChannelSink::DisableBuiltInRolloff() {
    m_rolloffDisabled = true;
    ApplyFlatRolloff();
}

void FmodChannelSink::SetChannel(FMOD_CHANNEL* channel) {
    m_channel = channel;
    if (m_rolloffDisabled) {
        ApplyFlatRolloff();
    }
}

void FmodChannelSink::ApplyFlatRolloff() {
    if (!m_channel) return;

    FMOD_MODE mode = 0;
    FMOD_RESULT res = FMOD_Channel_GetMode(m_channel, &mode);
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[FmodChannelSink] GetMode failed: ", FMOD_ErrorString(res));
        return;
    }

    mode = (mode & ~kRolloffModes) | FMOD_3D_CUSTOMROLLOFF;
    res = FMOD_Channel_SetMode(m_channel, mode);
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[FmodChannelSink] SetMode failed: ", FMOD_ErrorString(res));
        return;
    }

    res = FMOD_Channel_Set3DCustomRolloff(m_channel, g_flatRolloff, 2);
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[FmodChannelSink] Set3DCustomRolloff failed: ", FMOD_ErrorString(res));
    }
}
