#ifndef LEXITRIE_CONFIG_SECTIONS_CORPUS_CONFIG_HPP
#define LEXITRIE_CONFIG_SECTIONS_CORPUS_CONFIG_HPP

#include <cstdint>

#include "../core/config_section.hpp"

namespace lexitrie::config {

/**
 * @brief Settings for building word count tries from free text
 */
struct CorpusConfig : ConfigSection<CorpusConfig> {
    static constexpr std::string_view PATH = "/lexitrie/corpus";

    bool lowercase{true};       ///< Fold ASCII letters before counting
    std::uint64_t minCount{1};  ///< Words seen fewer times are not stored

    [[nodiscard]] json serialize() const {
        return {{"lowercase", lowercase}, {"minCount", minCount}};
    }

    [[nodiscard]] static CorpusConfig deserialize(const json& j) {
        CorpusConfig cfg;
        cfg.lowercase = j.value("lowercase", cfg.lowercase);
        if (j.contains("minCount")) {
            const auto& minCount = j.at("minCount");
            if (!minCount.is_number_integer() || minCount.get<std::int64_t>() < 1) {
                THROW_INVALID_CONFIG_EXCEPTION(
                    "corpus.minCount must be a positive integer");
            }
            cfg.minCount = minCount.get<std::uint64_t>();
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema{{"type", "object"}};
        describe(schema, "lowercase", "boolean", true,
                 "Fold ASCII letters to lowercase");
        describe(schema, "minCount", "integer", 1,
                 "Minimum occurrences for a word to be stored");
        constrain(schema, "minCount", "minimum", 1);
        return schema;
    }
};

}  // namespace lexitrie::config

#endif  // LEXITRIE_CONFIG_SECTIONS_CORPUS_CONFIG_HPP
