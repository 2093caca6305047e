#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>
#include <string_view>

namespace Forge {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two loggers share the same sinks: "FORGE" for the ability engine and
 * "APP" for tools built on top of it. Either can be used before
 * Initialize() is called; a console-only pair is created lazily.
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

    /**
     * @brief Set the minimum log level from its name ("trace", "info", "off", ...)
     */
    static void SetLevel(std::string_view levelName);

    static std::shared_ptr<spdlog::logger>& GetEngineLogger();
    static std::shared_ptr<spdlog::logger>& GetAppLogger();

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
};

} // namespace Forge

// Convenience macros for engine logging
#define FORGE_LOG_TRACE(...)    ::Forge::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define FORGE_LOG_DEBUG(...)    ::Forge::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define FORGE_LOG_INFO(...)     ::Forge::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define FORGE_LOG_WARN(...)     ::Forge::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define FORGE_LOG_ERROR(...)    ::Forge::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define FORGE_LOG_CRITICAL(...) ::Forge::Logger::GetEngineLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::Forge::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Forge::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Forge::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Forge::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Forge::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Forge::Logger::GetAppLogger()->critical(__VA_ARGS__)
