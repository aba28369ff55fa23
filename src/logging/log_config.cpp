/*
 * log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration implementation

**************************************************/

#include "log_config.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/async.h>
#include <spdlog/sinks/callback_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using json = nlohmann::json;

namespace lexitrie::logging {

namespace {
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>
    logger_registry_;
std::vector<spdlog::sink_ptr> shared_sinks_;
LoggerConfig active_config_;
std::shared_mutex registry_mutex_;
}  // namespace

auto logLevelToString(LogLevel level) -> std::string {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
        case LogLevel::OFF: return "off";
    }
    return "info";
}

auto logLevelFromString(std::string_view name) -> LogLevel {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error" || name == "err") return LogLevel::ERROR;
    if (name == "critical" || name == "fatal") return LogLevel::CRITICAL;
    if (name == "off" || name == "none") return LogLevel::OFF;
    return LogLevel::INFO;
}

void LogConfig::initialize(const LoggerConfig& config) {
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already initialized
    }

    try {
        if (config.file_output) {
            auto const parent =
                std::filesystem::path(config.log_file_path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
        }

        if (config.async) {
            spdlog::init_thread_pool(config.queue_size, config.thread_count);
        }

        {
            std::unique_lock lock(registry_mutex_);
            active_config_ = config;
            shared_sinks_ = buildSinks(config);
            // Rebind loggers handed out before initialization
            for (auto& [name, logger] : logger_registry_) {
                logger->sinks() = shared_sinks_;
            }
        }

        setGlobalLevel(config.level);
        spdlog::flush_every(config.flush_interval);

        auto default_logger = getLogger(config.name);
        spdlog::set_default_logger(default_logger);

        spdlog::set_error_handler([](const std::string& msg) {
            error_count_.fetch_add(1, std::memory_order_relaxed);
            std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
        });

        LEXITRIE_LOG_DEBUG(default_logger, "Logging initialized at level {}",
                           logLevelToString(config.level));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        initialized_.store(false, std::memory_order_release);
        throw;
    }
}

void LogConfig::shutdown() {
    flushAll();
    {
        std::unique_lock lock(registry_mutex_);
        for (const auto& [name, logger] : logger_registry_) {
            spdlog::drop(name);
        }
        logger_registry_.clear();
        shared_sinks_.clear();
        active_config_ = LoggerConfig{};
    }
    // Dropping the default logger leaves spdlog without one
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
    global_level_.store(LogLevel::INFO, std::memory_order_release);
    initialized_.store(false, std::memory_order_release);
}

auto LogConfig::getLogger(std::string_view name)
    -> std::shared_ptr<spdlog::logger> {
    std::string nameStr{name};

    {
        std::shared_lock lock(registry_mutex_);
        if (auto it = logger_registry_.find(nameStr);
            it != logger_registry_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(registry_mutex_);
    if (auto it = logger_registry_.find(nameStr);
        it != logger_registry_.end()) {
        return it->second;
    }

    auto logger = createLogger(name);
    logger_registry_.emplace(std::move(nameStr), logger);
    return logger;
}

auto LogConfig::buildSinks(const LoggerConfig& config)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_output) {
        auto console_sink =
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(convertLevel(config.level));
        console_sink->set_pattern(config.pattern);
        sinks.push_back(console_sink);
    }

    if (config.file_output) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file_path, config.max_file_size, config.max_files);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern(
            "[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%n] %v");
        sinks.push_back(file_sink);
    }

    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>(
        [](const spdlog::details::log_msg& msg) {
            total_logs_.fetch_add(1, std::memory_order_relaxed);
            if (msg.level >= spdlog::level::err) {
                error_count_.fetch_add(1, std::memory_order_relaxed);
            }
        });
    callback_sink->set_level(spdlog::level::trace);
    sinks.push_back(callback_sink);

    return sinks;
}

// Expects registry_mutex_ to be held exclusively
auto LogConfig::createLogger(std::string_view name)
    -> std::shared_ptr<spdlog::logger> {
    try {
        if (shared_sinks_.empty()) {
            shared_sinks_ = buildSinks(active_config_);
        }

        std::shared_ptr<spdlog::logger> logger;
        if (active_config_.async && initialized_.load()) {
            logger = std::make_shared<spdlog::async_logger>(
                std::string{name}, shared_sinks_.begin(), shared_sinks_.end(),
                spdlog::thread_pool(), spdlog::async_overflow_policy::block);
        } else {
            logger = std::make_shared<spdlog::logger>(
                std::string{name}, shared_sinks_.begin(), shared_sinks_.end());
        }

        logger->set_level(convertLevel(globalLevel()));
        if (active_config_.flush_on_error) {
            logger->flush_on(spdlog::level::err);
        }

        if (!spdlog::get(std::string{name})) {
            spdlog::register_logger(logger);
        }
        return logger;
    } catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error("Failed to create logger '" +
                                 std::string{name} + "': " + e.what());
    }
}

void LogConfig::setGlobalLevel(LogLevel level) noexcept {
    global_level_.store(level, std::memory_order_release);
    spdlog::set_level(convertLevel(level));
}

void LogConfig::flushAll() noexcept {
    try {
        spdlog::apply_all(
            [](const std::shared_ptr<spdlog::logger>& l) { l->flush(); });
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to flush loggers: %s\n", e.what());
    }
}

auto LogConfig::getMetrics() -> json {
    std::vector<std::string> names;
    {
        std::shared_lock lock(registry_mutex_);
        for (const auto& entry : logger_registry_) {
            names.push_back(entry.first);
        }
    }
    std::sort(names.begin(), names.end());

    return {{"total_logs", total_logs_.load(std::memory_order_relaxed)},
            {"error_count", error_count_.load(std::memory_order_relaxed)},
            {"global_level", logLevelToString(globalLevel())},
            {"initialized", isInitialized()},
            {"registered_loggers", names.size()},
            {"logger_names", names}};
}

// LogLevel uses spdlog's numbering
static_assert(static_cast<int>(LogLevel::TRACE) == spdlog::level::trace);
static_assert(static_cast<int>(LogLevel::ERROR) == spdlog::level::err);
static_assert(static_cast<int>(LogLevel::OFF) == spdlog::level::off);

auto LogConfig::convertLevel(LogLevel level) noexcept
    -> spdlog::level::level_enum {
    return static_cast<spdlog::level::level_enum>(level);
}

auto LogConfig::convertLevel(spdlog::level::level_enum level) noexcept
    -> LogLevel {
    if (level < spdlog::level::trace || level >= spdlog::level::n_levels) {
        return LogLevel::INFO;
    }
    return static_cast<LogLevel>(level);
}

}  // namespace lexitrie::logging
