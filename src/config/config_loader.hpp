/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Loading and saving of the lexitrie configuration document

**************************************************/

#ifndef LEXITRIE_CONFIG_CONFIG_LOADER_HPP
#define LEXITRIE_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <string_view>

#include "sections/sections.hpp"

namespace lexitrie::config {

/**
 * @brief Every configuration section of the library
 *
 * Each section lives at its own JSON pointer (e.g. "/lexitrie/fuzzy").
 * Sections missing from a document keep their defaults.
 */
struct LexitrieConfig {
    FuzzyConfig fuzzy;
    CorpusConfig corpus;
    StorageConfig storage;
    LoggingConfig logging;

    /**
     * @throws BadConfigException if a section is malformed
     * @throws InvalidConfigException if a value is out of range
     */
    [[nodiscard]] static LexitrieConfig fromJson(const json& document);

    [[nodiscard]] json toJson() const;

    [[nodiscard]] static json generateSchema();
};

/**
 * @brief Reads and writes configuration documents
 *
 * Documents are JSON; comments are accepted on input.
 */
class ConfigLoader {
public:
    /**
     * @throws atom::error::FailToOpenFile if the file cannot be read
     * @throws BadConfigException if the document cannot be parsed
     */
    [[nodiscard]] static LexitrieConfig loadFile(
        const std::filesystem::path& path);

    /**
     * @throws BadConfigException if the document cannot be parsed
     */
    [[nodiscard]] static LexitrieConfig loadString(std::string_view text);

    /**
     * @throws atom::error::FailToOpenFile if the file cannot be written
     */
    static void saveFile(const LexitrieConfig& config,
                         const std::filesystem::path& path, int indent = 4);
};

}  // namespace lexitrie::config

#endif  // LEXITRIE_CONFIG_CONFIG_LOADER_HPP
