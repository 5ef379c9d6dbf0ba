/// @file logger.cpp
/// @brief Logger setup: NATAL and APP loggers sharing console and rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace natal::core
{

std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

std::shared_ptr<spdlog::logger> make_logger(const char* name, const std::vector<spdlog::sink_ptr>& sinks)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

void Logger::init(const LoggerConfig& config)
{
    if (is_initialized())
    {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
    console_sink->set_level(config.console_level);
    sinks.push_back(console_sink);

    if (config.file_enabled)
    {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path.string(), config.max_file_size, config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        file_sink->set_level(config.file_level);
        sinks.push_back(file_sink);
    }

    s_core_logger = make_logger("NATAL", sinks);
    s_app_logger  = make_logger("APP", sinks);

    s_core_logger->debug("Logger: Initialized (console {}, file {})",
                         spdlog::level::to_string_view(config.console_level),
                         config.file_enabled ? config.file_path.string() : std::string("off"));
}

void Logger::shutdown()
{
    if (!is_initialized())
    {
        return;
    }

    s_core_logger->flush();
    s_app_logger->flush();
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

const std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger ? s_core_logger : silent_logger();
}

const std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger ? s_app_logger : silent_logger();
}

const std::shared_ptr<spdlog::logger>& Logger::silent_logger()
{
    // Not registered with spdlog, so drop_all() leaves it alive
    static const std::shared_ptr<spdlog::logger> silent = std::make_shared<spdlog::logger>("NATAL_SILENT");
    return silent;
}

} // namespace natal::core
