#pragma once

#include <string>
#include <sstream>
#include <type_traits>
#include <utility>

#include "Muffle.h"

namespace MuffleLogging {

    // Log levels matching spdlog levels
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    // Initialize the logging system. When logToFile is set, output is mirrored to logs/muffle.log
    bool MUFFLE_API Initialize(bool logToFile = true);

    // Shutdown the logging system
    void MUFFLE_API Shutdown();

    bool MUFFLE_API IsInitialized();

    // Messages below this level are dropped
    void MUFFLE_API SetLevel(LogLevel level);

    // Logging functions
    void MUFFLE_API LogTrace(const std::string& message);
    void MUFFLE_API LogDebug(const std::string& message);
    void MUFFLE_API LogInfo(const std::string& message);
    void MUFFLE_API LogWarn(const std::string& message);
    void MUFFLE_API LogError(const std::string& message);
    void MUFFLE_API LogCritical(const std::string& message);

    void MUFFLE_API LogInternal(LogLevel level, const std::string& message);

    namespace detail {
        template <typename... Args>
        std::string Concat(Args&&... args) {
            std::ostringstream oss;
            (oss << ... << std::forward<Args>(args));
            return oss.str();
        }
    }

    /**
     * @brief Streams every argument into one message and logs it.
     *
     * If the first argument is a LogLevel it selects the level, otherwise the
     * message is logged as Info.
     *
     * PrintOutput(LogLevel::Error, "[OcclusionSettings] maximumRange must be positive, got ", range);
     */
    template <typename First, typename... Rest>
    void PrintOutput(First&& first, Rest&&... rest) {
        if constexpr (std::is_same_v<std::decay_t<First>, LogLevel>) {
            LogInternal(first, detail::Concat(std::forward<Rest>(rest)...));
        }
        else {
            LogInternal(LogLevel::Info, detail::Concat(std::forward<First>(first), std::forward<Rest>(rest)...));
        }
    }

}

// Convenience macros for logging
#define MUFFLE_LOG_TRACE(msg)    MuffleLogging::LogTrace(msg)
#define MUFFLE_LOG_DEBUG(msg)    MuffleLogging::LogDebug(msg)
#define MUFFLE_LOG_INFO(msg)     MuffleLogging::LogInfo(msg)
#define MUFFLE_LOG_WARN(msg)     MuffleLogging::LogWarn(msg)
#define MUFFLE_LOG_ERROR(msg)    MuffleLogging::LogError(msg)
#define MUFFLE_LOG_CRITICAL(msg) MuffleLogging::LogCritical(msg)

#define MUFFLE_PRINT(...) MuffleLogging::PrintOutput(__VA_ARGS__)
