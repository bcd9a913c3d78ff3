/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include "core/export.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace ssw::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Performance = 3,
        Warn = 4,
        Error = 5,
        Critical = 6,
        Off = 7
    };

    enum class LogModule : uint8_t {
        Core = 0,
        Host = 1,
        Discovery = 2,
        Gimbal = 3,
        Apply = 4,
        Session = 5,
        Unknown = 6,
        Count = 7
    };

    // Accepts trace/debug/info/perf/warn/error/critical/off. Unknown strings map to Info.
    [[nodiscard]] SSW_LOGGER_API LogLevel parse_log_level(std::string_view level_str);

    class SSW_LOGGER_API Logger {
    public:
        static Logger& get();

        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "",
                  const std::string& filter_pattern = "");

        // Log a pre-formatted message (called by macros)
        void log(LogLevel level, const std::source_location& loc, std::string_view msg);

        // Module control
        void enable_module(LogModule module, bool enabled = true);
        void set_module_level(LogModule module, LogLevel level);
        void set_level(LogLevel level);
        void flush();

        bool is_enabled(LogLevel level) const {
            return static_cast<uint8_t>(level) >= global_level_.load(std::memory_order_relaxed);
        }

        // Runtime string logging for dynamically constructed messages
        void log_internal(LogLevel level, const std::source_location& loc, const std::string& msg) {
            if (static_cast<uint8_t>(level) < global_level_.load(std::memory_order_relaxed))
                return;
            log(level, loc, msg);
        }

        // Fast-path check BEFORE the std::format() call so disabled levels cost a load and a compare.
        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            if (static_cast<uint8_t>(level) < global_level_.load(std::memory_order_relaxed))
                return;

            log(level, loc, std::format(fmt, std::forward<Args>(args)...));
        }

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        struct Impl;
        std::unique_ptr<Impl> impl_;

        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Scoped timer for performance measurement
    class SSW_LOGGER_API ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Performance,
                             std::source_location loc = std::source_location::current());
        ~ScopedTimer();

    private:
        std::chrono::high_resolution_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
    };

} // namespace ssw::core

// Global macros
#define LOG_TRACE(...) \
    ::ssw::core::Logger::get().log_internal(::ssw::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::ssw::core::Logger::get().log_internal(::ssw::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::ssw::core::Logger::get().log_internal(::ssw::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_PERF(...) \
    ::ssw::core::Logger::get().log_internal(::ssw::core::LogLevel::Performance, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::ssw::core::Logger::get().log_internal(::ssw::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::ssw::core::Logger::get().log_internal(::ssw::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::ssw::core::Logger::get().log_internal(::ssw::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

// Helper macros to force expansion of __COUNTER__ before concatenation
#define _LOG_TIMER_CONCAT_IMPL(x, y)  x##y
#define _LOG_TIMER_MACRO_CONCAT(x, y) _LOG_TIMER_CONCAT_IMPL(x, y)

#define LOG_TIMER(name)       ::ssw::core::ScopedTimer _LOG_TIMER_MACRO_CONCAT(_timer_, __COUNTER__)(name)
#define LOG_TIMER_TRACE(name) ::ssw::core::ScopedTimer _LOG_TIMER_MACRO_CONCAT(_timer_, __COUNTER__)(name, ::ssw::core::LogLevel::Trace)
#define LOG_TIMER_DEBUG(name) ::ssw::core::ScopedTimer _LOG_TIMER_MACRO_CONCAT(_timer_, __COUNTER__)(name, ::ssw::core::LogLevel::Debug)
