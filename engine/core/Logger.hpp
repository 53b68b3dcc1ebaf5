#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace GeoHex {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Provides the library and application loggers plus convenience macros.
 * Both loggers resolve to the spdlog default logger until Initialize() has
 * been called, so pure library code can log from unit tests.
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
     * @brief Parse a level name ("trace" .. "critical", "off")
     */
    static std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

    /**
     * @brief Get the library logger
     */
    static std::shared_ptr<spdlog::logger> GetEngineLogger();

    /**
     * @brief Get the application logger
     */
    static std::shared_ptr<spdlog::logger> GetAppLogger();

    static bool IsInitialized() { return s_initialized; }

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
};

} // namespace GeoHex

// Convenience macros for library logging
#define GEOHEX_LOG_TRACE(...)    ::GeoHex::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define GEOHEX_LOG_DEBUG(...)    ::GeoHex::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define GEOHEX_LOG_INFO(...)     ::GeoHex::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define GEOHEX_LOG_WARN(...)     ::GeoHex::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define GEOHEX_LOG_ERROR(...)    ::GeoHex::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define GEOHEX_LOG_CRITICAL(...) ::GeoHex::Logger::GetEngineLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::GeoHex::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::GeoHex::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::GeoHex::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::GeoHex::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::GeoHex::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::GeoHex::Logger::GetAppLogger()->critical(__VA_ARGS__)
