#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Lodestone {

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
bool Logger::s_initialized = false;

namespace {

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name,
                                           const std::vector<spdlog::sink_ptr>& sinks) {
    // A previous Shutdown() drops the registry, but a host may have registered the name itself
    spdlog::drop(name);

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_engineLogger = MakeLogger("LODESTONE", sinks);
    s_appLogger = MakeLogger("APP", sinks);

    spdlog::set_default_logger(s_engineLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_engineLogger->flush();
    s_appLogger->flush();

    spdlog::drop_all();

    s_engineLogger.reset();
    s_appLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (s_engineLogger) {
        s_engineLogger->set_level(level);
    }
    if (s_appLogger) {
        s_appLogger->set_level(level);
    }
}

} // namespace Lodestone
