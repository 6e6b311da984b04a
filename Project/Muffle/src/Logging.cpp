#include "pch.h"
#include "Logging.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

namespace MuffleLogging {

    // Static instances, guarded by loggerMutex. Messages are written outside the
    // lock through a local copy of the logger; the sinks are thread-safe.
    static std::mutex loggerMutex;
    static std::shared_ptr<spdlog::logger> logger;
    static bool initialized = false;

    static std::shared_ptr<spdlog::logger> AcquireLogger() {
        std::lock_guard<std::mutex> lock(loggerMutex);
        return initialized ? logger : nullptr;
    }

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    static std::shared_ptr<spdlog::logger> CreateLogger(bool logToFile) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(console_sink);

            if (logToFile) {
                std::filesystem::create_directories("logs");

                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("logs/muffle.log", true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            }

            auto created = std::make_shared<spdlog::logger>("muffle", sinks.begin(), sinks.end());
            created->set_level(spdlog::level::trace);
            created->flush_on(spdlog::level::warn);
            return created;
        }
        catch (const std::exception& ex) {
            std::cerr << "Failed to initialize logging system: " << ex.what() << std::endl;
            return nullptr;
        }
    }

    bool Initialize(bool logToFile) {
        {
            std::lock_guard<std::mutex> lock(loggerMutex);
            if (initialized) {
                return true;
            }

            logger = CreateLogger(logToFile);
            if (!logger) {
                return false;
            }

            // Register as default logger
            spdlog::set_default_logger(logger);
            initialized = true;
        }

        LogInfo("Muffle logging system initialized");
        return true;
    }

    void Shutdown() {
        LogInfo("Shutting down logging system");

        std::lock_guard<std::mutex> lock(loggerMutex);
        if (!initialized) {
            return;
        }

        if (logger) {
            logger->flush();
            logger.reset();
        }

        spdlog::shutdown();
        initialized = false;
    }

    bool IsInitialized() {
        std::lock_guard<std::mutex> lock(loggerMutex);
        return initialized;
    }

    void SetLevel(LogLevel level) {
        std::shared_ptr<spdlog::logger> current = AcquireLogger();
        if (current) {
            current->set_level(ToSpdlogLevel(level));
        }
    }

    void LogInternal(LogLevel level, const std::string& message) {
        std::shared_ptr<spdlog::logger> current = AcquireLogger();
        if (!current) {
            // Logger not initialized or already destroyed - fail silently
            return;
        }

        // Callers often terminate with a newline; spdlog adds its own
        std::string text = message;
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
        if (text.empty()) {
            return;
        }

        current->log(ToSpdlogLevel(level), text);
    }

    // Public logging functions
    void LogTrace(const std::string& message) {
        LogInternal(LogLevel::Trace, message);
    }

    void LogDebug(const std::string& message) {
        LogInternal(LogLevel::Debug, message);
    }

    void LogInfo(const std::string& message) {
        LogInternal(LogLevel::Info, message);
    }

    void LogWarn(const std::string& message) {
        LogInternal(LogLevel::Warn, message);
    }

    void LogError(const std::string& message) {
        LogInternal(LogLevel::Error, message);
    }

    void LogCritical(const std::string& message) {
        LogInternal(LogLevel::Critical, message);
    }

}
