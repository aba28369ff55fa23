/*
 * log_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration shared by all lexitrie components

**************************************************/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lexitrie::logging {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

[[nodiscard]] auto logLevelToString(LogLevel level) -> std::string;

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn"/"warning",
 * "error"/"err", "critical"/"fatal", "off"/"none")
 *
 * Unknown names map to INFO.
 */
[[nodiscard]] auto logLevelFromString(std::string_view name) -> LogLevel;

struct LoggerConfig {
    std::string name{"lexitrie"};
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool async = false;
    std::size_t queue_size = 8192;
    std::size_t thread_count = 1;
    bool console_output = true;
    bool file_output = false;
    std::string log_file_path = "logs/lexitrie.log";
    std::size_t max_file_size = 1048576 * 10;  // 10MB
    std::size_t max_files = 5;
    bool flush_on_error = true;
    std::chrono::seconds flush_interval{3};
};

/**
 * @brief Process-wide spdlog setup
 *
 * initialize() builds the sink set once and installs the default logger.
 * Component loggers obtained through getLogger() share those sinks, so a
 * single configuration controls every component. Before initialize() is
 * called, getLogger() falls back to a colored console sink.
 */
class LogConfig {
public:
    /**
     * @brief Build the shared sinks and install the default logger
     *
     * Calls after the first successful one are ignored until shutdown().
     * On failure the error is reported on stderr and rethrown.
     */
    static void initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Drop every registered logger and the shared sinks
     *
     * The global level returns to INFO. A later initialize() call starts
     * from scratch.
     */
    static void shutdown();

    [[nodiscard]] static auto isInitialized() noexcept -> bool {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Named component logger, e.g. "lexitrie.corpus"
     *
     * The first call for a name creates the logger on the shared sinks and
     * registers it with spdlog; later calls return the same instance.
     */
    static auto getLogger(std::string_view name)
        -> std::shared_ptr<spdlog::logger>;

    // Applies to every registered logger
    static void setGlobalLevel(LogLevel level) noexcept;

    [[nodiscard]] static auto globalLevel() noexcept -> LogLevel {
        return global_level_.load(std::memory_order_acquire);
    }

    static void flushAll() noexcept;

    /**
     * @brief Message counters, global level and registered logger names
     */
    [[nodiscard]] static auto getMetrics() -> nlohmann::json;

    static auto convertLevel(LogLevel level) noexcept
        -> spdlog::level::level_enum;
    static auto convertLevel(spdlog::level::level_enum level) noexcept
        -> LogLevel;

private:
    static auto buildSinks(const LoggerConfig& config)
        -> std::vector<spdlog::sink_ptr>;
    static auto createLogger(std::string_view name)
        -> std::shared_ptr<spdlog::logger>;

    static inline std::atomic<bool> initialized_{false};
    static inline std::atomic<LogLevel> global_level_{LogLevel::INFO};
    static inline std::atomic<std::uint64_t> total_logs_{0};
    static inline std::atomic<std::uint64_t> error_count_{0};
};

// Each macro evaluates its logger argument once
#define LEXITRIE_LOG_TRACE(logger, ...)                               \
    do {                                                              \
        auto&& lexitrie_log_target_ = (logger);                       \
        if (lexitrie_log_target_ &&                                   \
            lexitrie_log_target_->should_log(spdlog::level::trace)) { \
            lexitrie_log_target_->trace(__VA_ARGS__);                 \
        }                                                             \
    } while (0)

#define LEXITRIE_LOG_DEBUG(logger, ...)                               \
    do {                                                              \
        auto&& lexitrie_log_target_ = (logger);                       \
        if (lexitrie_log_target_ &&                                   \
            lexitrie_log_target_->should_log(spdlog::level::debug)) { \
            lexitrie_log_target_->debug(__VA_ARGS__);                 \
        }                                                             \
    } while (0)

#define LEXITRIE_LOG_INFO(logger, ...)                               \
    do {                                                             \
        auto&& lexitrie_log_target_ = (logger);                      \
        if (lexitrie_log_target_ &&                                  \
            lexitrie_log_target_->should_log(spdlog::level::info)) { \
            lexitrie_log_target_->info(__VA_ARGS__);                 \
        }                                                            \
    } while (0)

#define LEXITRIE_LOG_WARN(logger, ...)                               \
    do {                                                             \
        auto&& lexitrie_log_target_ = (logger);                      \
        if (lexitrie_log_target_ &&                                  \
            lexitrie_log_target_->should_log(spdlog::level::warn)) { \
            lexitrie_log_target_->warn(__VA_ARGS__);                 \
        }                                                            \
    } while (0)

#define LEXITRIE_LOG_ERROR(logger, ...)                             \
    do {                                                            \
        auto&& lexitrie_log_target_ = (logger);                     \
        if (lexitrie_log_target_ &&                                 \
            lexitrie_log_target_->should_log(spdlog::level::err)) { \
            lexitrie_log_target_->error(__VA_ARGS__);               \
        }                                                           \
    } while (0)

}  // namespace lexitrie::logging
