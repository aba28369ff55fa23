/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Loading and saving of the lexitrie configuration document

**************************************************/

#include "config_loader.hpp"

#include <fstream>
#include <string>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "logging/log_config.hpp"

namespace lexitrie::config {

namespace {

auto logger() -> std::shared_ptr<spdlog::logger> {
    return logging::LogConfig::getLogger("lexitrie.config");
}

template <ConfigSectionDerived Section>
auto readSection(const json& document) -> Section {
    if (!Section::presentIn(document)) {
        LEXITRIE_LOG_DEBUG(logger(), "Section {} not present, using defaults",
                           Section::path());
    }
    return Section::fromDocument(document);
}

}  // namespace

auto LexitrieConfig::fromJson(const json& document) -> LexitrieConfig {
    if (!document.is_object()) {
        THROW_BAD_CONFIG_EXCEPTION("Configuration root must be a JSON object");
    }
    LexitrieConfig config;
    config.fuzzy = readSection<FuzzyConfig>(document);
    config.corpus = readSection<CorpusConfig>(document);
    config.storage = readSection<StorageConfig>(document);
    config.logging = readSection<LoggingConfig>(document);
    return config;
}

auto LexitrieConfig::toJson() const -> json {
    json document = json::object();
    fuzzy.writeTo(document);
    corpus.writeTo(document);
    storage.writeTo(document);
    logging.writeTo(document);
    return document;
}

auto LexitrieConfig::generateSchema() -> json {
    json schema{{"type", "object"}};
    auto& sections = schema["properties"]["lexitrie"];
    sections["type"] = "object";
    sections["properties"]["fuzzy"] = FuzzyConfig::schema();
    sections["properties"]["corpus"] = CorpusConfig::schema();
    sections["properties"]["storage"] = StorageConfig::schema();
    sections["properties"]["logging"] = LoggingConfig::schema();
    return schema;
}

auto ConfigLoader::loadFile(const std::filesystem::path& path)
    -> LexitrieConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_FAIL_TO_OPEN_FILE("Failed to open config file: " +
                                path.string());
    }

    json document;
    try {
        document = json::parse(file, nullptr, true, true);
    } catch (const json::parse_error& e) {
        THROW_BAD_CONFIG_EXCEPTION("Failed to parse " + path.string() + ": " +
                                   e.what());
    }

    auto config = LexitrieConfig::fromJson(document);
    LEXITRIE_LOG_INFO(logger(), "Loaded configuration from {}", path.string());
    return config;
}

auto ConfigLoader::loadString(std::string_view text) -> LexitrieConfig {
    json document;
    try {
        document = json::parse(text, nullptr, true, true);
    } catch (const json::parse_error& e) {
        THROW_BAD_CONFIG_EXCEPTION(std::string("Failed to parse configuration: ") +
                                   e.what());
    }
    return LexitrieConfig::fromJson(document);
}

void ConfigLoader::saveFile(const LexitrieConfig& config,
                            const std::filesystem::path& path, int indent) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        THROW_FAIL_TO_OPEN_FILE("Failed to open config file for writing: " +
                                path.string());
    }
    file << config.toJson().dump(indent) << '\n';
    LEXITRIE_LOG_INFO(logger(), "Saved configuration to {}", path.string());
}

}  // namespace lexitrie::config
