/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration section

**************************************************/

#ifndef LEXITRIE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define LEXITRIE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"
#include "logging/log_config.hpp"

namespace lexitrie::config {

/**
 * @brief Logging configuration
 *
 * @example
 * ```json
 * {
 *   "lexitrie": {
 *     "logging": {
 *       "level": "debug",
 *       "enableConsole": true,
 *       "enableFile": true,
 *       "logFile": "logs/lexitrie.log",
 *       "maxFileSize": 10485760,
 *       "maxFiles": 5
 *     }
 *   }
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "/lexitrie/logging";

    std::string level{"info"};  ///< Global log level
    std::string pattern{"[%H:%M:%S.%e] [%^%l%$] [%n] %v"};

    bool enableConsole{true};  ///< Enable console output

    bool enableFile{false};                    ///< Enable file output
    std::string logFile{"logs/lexitrie.log"};  ///< Log file path
    size_t maxFileSize{10 * 1024 * 1024};      ///< Max file size before rotation (10 MB)
    size_t maxFiles{5};                        ///< Max number of rotated files

    bool asyncMode{false};         ///< Enable async logging
    size_t asyncQueueSize{8192};   ///< Async queue size

    /**
     * @brief Translate into the logger setup consumed by LogConfig
     */
    [[nodiscard]] logging::LoggerConfig toLoggerConfig() const {
        logging::LoggerConfig out;
        out.level = logging::logLevelFromString(level);
        out.pattern = pattern;
        out.console_output = enableConsole;
        out.file_output = enableFile;
        out.log_file_path = logFile;
        out.max_file_size = maxFileSize;
        out.max_files = maxFiles;
        out.async = asyncMode;
        out.queue_size = asyncQueueSize;
        return out;
    }

    [[nodiscard]] json serialize() const {
        return {{"level", level},
                {"pattern", pattern},
                {"enableConsole", enableConsole},
                {"enableFile", enableFile},
                {"logFile", logFile},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"asyncMode", asyncMode},
                {"asyncQueueSize", asyncQueueSize}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logFile = j.value("logFile", cfg.logFile);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.asyncMode = j.value("asyncMode", cfg.asyncMode);
        cfg.asyncQueueSize = j.value("asyncQueueSize", cfg.asyncQueueSize);

        if (cfg.enableFile && cfg.logFile.empty()) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "logging.logFile is required when file output is enabled");
        }
        if (cfg.maxFiles == 0 || cfg.maxFileSize == 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "logging.maxFiles and logging.maxFileSize must be positive");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema{{"type", "object"}};
        describe(schema, "level", "string", std::string{"info"},
                 "Global log level");
        constrain(schema, "level", "enum",
                  {"trace", "debug", "info", "warn", "error", "critical", "off"});
        describe(schema, "pattern", "string",
                 std::string{"[%H:%M:%S.%e] [%^%l%$] [%n] %v"});
        describe(schema, "enableConsole", "boolean", true);
        describe(schema, "enableFile", "boolean", false);
        describe(schema, "logFile", "string",
                 std::string{"logs/lexitrie.log"});
        describe(schema, "maxFileSize", "integer",
                 size_t{10 * 1024 * 1024});
        describe(schema, "maxFiles", "integer", size_t{5});
        describe(schema, "asyncMode", "boolean", false);
        describe(schema, "asyncQueueSize", "integer", size_t{8192});
        return schema;
    }
};

}  // namespace lexitrie::config

#endif  // LEXITRIE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
