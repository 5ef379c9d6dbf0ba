#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace natal::core
{
    /// @brief Sink setup for Logger::init().
    struct LoggerConfig
    {
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level    = spdlog::level::trace;
        bool                      file_enabled  = true;
        std::filesystem::path     file_path     = "natal.log";
        std::size_t               max_file_size = 5 * 1024 * 1024;
        std::size_t               max_files     = 3;
    };

    /// @brief Centralized logging facility for Natal.
    ///
    /// Provides two separate loggers:
    /// - **NATAL** (core): normalization, chart assembly, file loading
    /// - **APP**: executables and user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Before init() (and after shutdown()) both accessors return a logger
    /// with no sinks, so library code can log unconditionally.
    class Logger
    {
    public:
        /// @brief Initialize both loggers. A second call without shutdown() is ignored.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        [[nodiscard]] static bool is_initialized() { return s_core_logger != nullptr; }

        /// @brief Access the library-internal logger ("NATAL").
        [[nodiscard]] static const std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static const std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        [[nodiscard]] static const std::shared_ptr<spdlog::logger>& silent_logger();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace natal::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define NATAL_CORE_TRACE(...)    ::natal::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define NATAL_CORE_DEBUG(...)    ::natal::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define NATAL_CORE_INFO(...)     ::natal::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define NATAL_CORE_WARN(...)     ::natal::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define NATAL_CORE_ERROR(...)    ::natal::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define NATAL_CORE_CRITICAL(...) ::natal::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define NATAL_TRACE(...)         ::natal::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define NATAL_INFO(...)          ::natal::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define NATAL_WARN(...)          ::natal::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define NATAL_ERROR(...)         ::natal::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define NATAL_CRITICAL(...)      ::natal::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
