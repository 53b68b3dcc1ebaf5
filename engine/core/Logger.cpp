#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace GeoHex {

namespace {

constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name, const std::vector<spdlog::sink_ptr>& sinks) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (consoleOutput) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        sinks.back()->set_pattern("%^[%T] [%n] [%l]%$ %v");
    }

    std::string fileError;
    if (!logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, LOG_FILE_MAX_BYTES, LOG_FILE_COUNT));
            sinks.back()->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    s_engineLogger = MakeLogger("GEOHEX", sinks);
    s_appLogger = MakeLogger("APP", sinks);
    spdlog::set_default_logger(s_engineLogger);
    s_initialized = true;

    if (!fileError.empty()) {
        s_engineLogger->warn("Logging to console only, cannot open '{}': {}", logFile, fileError);
    }
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    const auto level = s_engineLogger->level();
    s_engineLogger->flush();
    s_appLogger->flush();
    s_engineLogger.reset();
    s_appLogger.reset();
    s_initialized = false;

    // drop_all() also clears the default logger the macros resolve to
    spdlog::drop_all();
    auto fallback = std::make_shared<spdlog::logger>(
        "", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    fallback->set_level(level);
    spdlog::set_default_logger(fallback);
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (!s_initialized) {
        spdlog::set_level(level);
        return;
    }
    s_engineLogger->set_level(level);
    s_appLogger->set_level(level);
}

std::optional<spdlog::level::level_enum> Logger::ParseLevel(std::string_view name) {
    // from_str() maps unknown names to off
    const auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

std::shared_ptr<spdlog::logger> Logger::GetEngineLogger() {
    return s_engineLogger ? s_engineLogger : spdlog::default_logger();
}

std::shared_ptr<spdlog::logger> Logger::GetAppLogger() {
    return s_appLogger ? s_appLogger : spdlog::default_logger();
}

} // namespace GeoHex
