#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace Lodestone {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two named loggers share the same sinks: "LODESTONE" for the engine and
 * the building core, "APP" for executables and tools.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

    /**
     * @brief Get the engine logger, initializing a console logger on first use
     */
    static std::shared_ptr<spdlog::logger>& GetEngineLogger() {
        if (!s_initialized) {
            Initialize();
        }
        return s_engineLogger;
    }

    /**
     * @brief Get the application logger
     */
    static std::shared_ptr<spdlog::logger>& GetAppLogger() {
        if (!s_initialized) {
            Initialize();
        }
        return s_appLogger;
    }

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
};

} // namespace Lodestone

// Convenience macros for engine logging
#define LODESTONE_LOG_TRACE(...)    ::Lodestone::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define LODESTONE_LOG_DEBUG(...)    ::Lodestone::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define LODESTONE_LOG_INFO(...)     ::Lodestone::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define LODESTONE_LOG_WARN(...)     ::Lodestone::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define LODESTONE_LOG_ERROR(...)    ::Lodestone::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define LODESTONE_LOG_CRITICAL(...) ::Lodestone::Logger::GetEngineLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::Lodestone::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Lodestone::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Lodestone::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Lodestone::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Lodestone::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Lodestone::Logger::GetAppLogger()->critical(__VA_ARGS__)
