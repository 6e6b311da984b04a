#include "pch.h"
#include "Sound/FMOD/FmodReverbFilter.hpp"
#include "Logging.hpp"

#include <fmod.h>
#include <fmod_dsp_effects.h>
#include <fmod_errors.h>

FmodReverbFilter::FmodReverbFilter(FMOD_SYSTEM* system, FMOD_CHANNEL* channel)
    : m_channel(channel)
{
    if (!system) {
        throw std::runtime_error("FmodReverbFilter requires an FMOD system");
    }

    FMOD_RESULT res = FMOD_System_CreateDSPByType(system, FMOD_DSP_TYPE_SFXREVERB, &m_dsp);
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[FmodReverbFilter] CreateDSPByType failed: ", FMOD_ErrorString(res));
        throw std::runtime_error(std::string("FMOD reverb DSP creation failed: ") + FMOD_ErrorString(res));
    }

    Attach();
}

FmodReverbFilter::~FmodReverbFilter() {
    Detach();
    if (m_dsp) {
        FMOD_RESULT res = FMOD_DSP_Release(m_dsp);
        if (res != FMOD_OK) {
            MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[FmodReverbFilter] DSP release failed: ", FMOD_ErrorString(res));
        }
        m_dsp = nullptr;
    }
}

float FmodReverbFilter::MillibelsToWetLevel(float millibels) {
    return std::clamp(millibels / 100.0f, kWetLevelMinDb, kWetLevelMaxDb);
}

void FmodReverbFilter::SetReverbLevel(float level, ReverbPresetMode mode) {
    FMOD_RESULT res = FMOD_DSP_SetBypass(m_dsp, mode == ReverbPresetMode::Off);
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[FmodReverbFilter] SetBypass failed: ", FMOD_ErrorString(res));
    }
    if (mode == ReverbPresetMode::Off) return;

    res = FMOD_DSP_SetParameterFloat(m_dsp, FMOD_DSP_SFXREVERB_WETLEVEL, MillibelsToWetLevel(level));
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[FmodReverbFilter] Setting wet level failed: ", FMOD_ErrorString(res));
    }
}

void FmodReverbFilter::SetChannel(FMOD_CHANNEL* channel) {
    Detach();
    m_channel = channel;
    Attach();
}

void FmodReverbFilter::Attach() {
    if (!m_channel || m_attached) return;

    FMOD_RESULT res = FMOD_Channel_AddDSP(m_channel, FMOD_CHANNELCONTROL_DSP_HEAD, m_dsp);
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[FmodReverbFilter] AddDSP failed: ", FMOD_ErrorString(res));
        return;
    }
    m_attached = true;
}

void FmodReverbFilter::Detach() {
    if (!m_channel || !m_attached) return;

    // Fails harmlessly when the channel has already been stolen or stopped
    FMOD_RESULT res = FMOD_Channel_RemoveDSP(m_channel, m_dsp);
    if (res != FMOD_OK) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Debug, "[FmodReverbFilter] RemoveDSP: ", FMOD_ErrorString(res));
    }
    m_attached = false;
}
