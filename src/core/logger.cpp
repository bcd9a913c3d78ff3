/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <filesystem>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace ssw::core {

    namespace {

        constexpr std::string_view MODULE_NAMES[] = {
            "core", "host", "discovery", "gimbal", "apply", "session", "unknown"};

        spdlog::level::level_enum to_spdlog(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info:
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        // Modules are derived from the source path of the call site
        LogModule module_from_path(std::string_view path) {
            if (path.find("gimbal") != std::string_view::npos)
                return LogModule::Gimbal;
            if (path.find("discovery") != std::string_view::npos || path.find("option_cleaning") != std::string_view::npos)
                return LogModule::Discovery;
            if (path.find("switch_session") != std::string_view::npos)
                return LogModule::Session;
            if (path.find("engine") != std::string_view::npos)
                return LogModule::Apply;
            if (path.find("host") != std::string_view::npos)
                return LogModule::Host;
            if (path.find("core") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

    } // namespace

    LogLevel parse_log_level(const std::string_view level_str) {
        if (level_str == "trace")
            return LogLevel::Trace;
        if (level_str == "debug")
            return LogLevel::Debug;
        if (level_str == "info")
            return LogLevel::Info;
        if (level_str == "perf" || level_str == "performance")
            return LogLevel::Performance;
        if (level_str == "warn" || level_str == "warning")
            return LogLevel::Warn;
        if (level_str == "error")
            return LogLevel::Error;
        if (level_str == "critical")
            return LogLevel::Critical;
        if (level_str == "off")
            return LogLevel::Off;
        return LogLevel::Info; // Default
    }

    struct Logger::Impl {
        std::shared_ptr<spdlog::logger> logger;
        std::string filter_pattern;
        std::mutex mutex;
    };

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        for (auto& enabled : module_enabled_)
            enabled.store(true, std::memory_order_relaxed);
        for (auto& level : module_level_)
            level.store(static_cast<uint8_t>(LogLevel::Trace), std::memory_order_relaxed);
    }

    Logger::~Logger() {
        if (impl_ && impl_->logger)
            impl_->logger->flush();
    }

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::init(const LogLevel console_level, const std::string& log_file, const std::string& filter_pattern) {
        std::lock_guard lock(impl_->mutex);

        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog(console_level));
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        std::string file_error;
        if (!log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        impl_->logger = std::make_shared<spdlog::logger>("ssw", sinks.begin(), sinks.end());
        impl_->logger->set_level(spdlog::level::trace);
        impl_->logger->flush_on(spdlog::level::warn);
        impl_->filter_pattern = filter_pattern;
        if (!file_error.empty())
            impl_->logger->warn("Cannot open log file {}: {}", log_file, file_error);

        global_level_.store(static_cast<uint8_t>(console_level), std::memory_order_relaxed);
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        const auto module = module_from_path(loc.file_name());
        const auto module_idx = static_cast<size_t>(module);
        if (!module_enabled_[module_idx].load(std::memory_order_relaxed))
            return;
        if (static_cast<uint8_t>(level) < module_level_[module_idx].load(std::memory_order_relaxed))
            return;

        std::lock_guard lock(impl_->mutex);
        if (!impl_->logger) {
            // init() not called yet: fall back to the default spdlog logger
            impl_->logger = spdlog::default_logger();
        }
        if (!impl_->filter_pattern.empty() && msg.find(impl_->filter_pattern) == std::string_view::npos)
            return;

        const auto file = std::filesystem::path(loc.file_name()).filename().string();
        if (level == LogLevel::Performance) {
            impl_->logger->log(to_spdlog(level), "[{}] [perf] {} ({}:{})", MODULE_NAMES[module_idx], msg, file, loc.line());
        } else {
            impl_->logger->log(to_spdlog(level), "[{}] {} ({}:{})", MODULE_NAMES[module_idx], msg, file, loc.line());
        }
    }

    void Logger::enable_module(const LogModule module, const bool enabled) {
        module_enabled_[static_cast<size_t>(module)].store(enabled, std::memory_order_relaxed);
    }

    void Logger::set_module_level(const LogModule module, const LogLevel level) {
        module_level_[static_cast<size_t>(module)].store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    void Logger::set_level(const LogLevel level) {
        global_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
        std::lock_guard lock(impl_->mutex);
        if (impl_->logger) {
            for (auto& sink : impl_->logger->sinks())
                sink->set_level(to_spdlog(level));
        }
    }

    void Logger::flush() {
        std::lock_guard lock(impl_->mutex);
        if (impl_->logger)
            impl_->logger->flush();
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::high_resolution_clock::now()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {}

    ScopedTimer::~ScopedTimer() {
        const auto elapsed = std::chrono::duration<double, std::milli>(
                                 std::chrono::high_resolution_clock::now() - start_)
                                 .count();
        Logger::get().log_internal(level_, loc_, "{} took {:.3f} ms", name_, elapsed);
    }

} // namespace ssw::core
