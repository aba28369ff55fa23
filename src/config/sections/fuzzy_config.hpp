/*
 * fuzzy_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Approximate matching configuration

**************************************************/

#ifndef LEXITRIE_CONFIG_SECTIONS_FUZZY_CONFIG_HPP
#define LEXITRIE_CONFIG_SECTIONS_FUZZY_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace lexitrie::config {

/**
 * @brief Settings for the edit candidate generator
 *
 * @example
 * ```json
 * {"lexitrie": {"fuzzy": {"alphabet": "abcdefghijklmnopqrstuvwxyz",
 *                         "defaultDistance": 2}}}
 * ```
 */
struct FuzzyConfig : ConfigSection<FuzzyConfig> {
    static constexpr std::string_view PATH = "/lexitrie/fuzzy";

    std::string alphabet{"abcdefghijklmnopqrstuvwxyz"};  ///< Insert/substitute symbols
    int defaultDistance{2};  ///< Distance used when the caller passes none

    [[nodiscard]] json serialize() const {
        return {{"alphabet", alphabet}, {"defaultDistance", defaultDistance}};
    }

    [[nodiscard]] static FuzzyConfig deserialize(const json& j) {
        FuzzyConfig cfg;
        cfg.alphabet = j.value("alphabet", cfg.alphabet);
        cfg.defaultDistance = j.value("defaultDistance", cfg.defaultDistance);

        if (cfg.alphabet.empty()) {
            THROW_INVALID_CONFIG_EXCEPTION("fuzzy.alphabet cannot be empty");
        }
        if (cfg.defaultDistance <= 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "fuzzy.defaultDistance must be positive, got " +
                std::to_string(cfg.defaultDistance));
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema{{"type", "object"}};
        describe(schema, "alphabet", "string",
                 std::string{"abcdefghijklmnopqrstuvwxyz"},
                 "Symbols used for substitutions and insertions");
        describe(schema, "defaultDistance", "integer", 2,
                 "Edit distance used by default");
        constrain(schema, "alphabet", "minLength", 1);
        constrain(schema, "defaultDistance", "minimum", 1);
        return schema;
    }
};

}  // namespace lexitrie::config

#endif  // LEXITRIE_CONFIG_SECTIONS_FUZZY_CONFIG_HPP
