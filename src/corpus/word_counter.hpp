/*
 * word_counter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-7-12

Description: Word counting over free text and word count tries

**************************************************/

#ifndef LEXITRIE_CORPUS_WORD_COUNTER_HPP
#define LEXITRIE_CORPUS_WORD_COUNTER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/trie.hpp"

namespace lexitrie::config {
struct CorpusConfig;
}

namespace lexitrie::corpus {

/// Trie mapping each word of a corpus to its number of occurrences
using WordCountTrie = core::Trie<std::uint64_t>;

struct WordCount {
    std::string word;
    std::uint64_t count;

    bool operator==(const WordCount&) const = default;
};

struct CorpusOptions {
    bool lowercase = true;       ///< Fold ASCII letters before counting
    std::uint64_t minCount = 1;  ///< Skip words seen fewer times

    [[nodiscard]] static auto fromConfig(const config::CorpusConfig& config)
        -> CorpusOptions;
};

/**
 * @brief Split text into words
 *
 * A word is a maximal run of ASCII letters, digits, underscores and bytes
 * at or above 0x80, so UTF-8 encoded letters stay inside their word.
 */
[[nodiscard]] auto tokenize(std::string_view text, bool lowercase = true)
    -> std::vector<std::string>;

/**
 * @brief Count the words of @p text
 *
 * @return One entry per distinct word, in order of first occurrence
 */
[[nodiscard]] auto countWords(std::string_view text,
                              const CorpusOptions& options = {})
    -> std::vector<WordCount>;

/**
 * @brief Build a trie holding the word counts of @p text
 *
 * @example
 * ```cpp
 * auto trie = buildWordCountTrie("cat cats catacomb apple cats");
 * trie.get("cats");  // 2
 * ```
 */
[[nodiscard]] auto buildWordCountTrie(std::string_view text,
                                      const CorpusOptions& options = {})
    -> WordCountTrie;

/**
 * @brief Build a word count trie from the contents of a text file
 *
 * @throws atom::error::FailToOpenFile if the file cannot be read
 */
[[nodiscard]] auto loadWordCountTrie(const std::filesystem::path& path,
                                     const CorpusOptions& options = {})
    -> WordCountTrie;

}  // namespace lexitrie::corpus

#endif  // LEXITRIE_CORPUS_WORD_COUNTER_HPP
