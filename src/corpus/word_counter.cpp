/*
 * word_counter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-7-12

Description: Word counting over free text and word count tries

**************************************************/

#include "word_counter.hpp"

#include <fstream>
#include <iterator>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "config/sections/corpus_config.hpp"
#include "logging/log_config.hpp"

namespace lexitrie::corpus {

namespace {

auto logger() -> std::shared_ptr<spdlog::logger> {
    return logging::LogConfig::getLogger("lexitrie.corpus");
}

constexpr auto isWordByte(unsigned char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c >= 0x80;
}

constexpr auto foldCase(unsigned char c) noexcept -> char {
    return static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
}

}  // namespace

auto CorpusOptions::fromConfig(const config::CorpusConfig& config)
    -> CorpusOptions {
    return {config.lowercase, config.minCount};
}

auto tokenize(std::string_view text, bool lowercase)
    -> std::vector<std::string> {
    std::vector<std::string> words;
    std::string current;

    for (char ch : text) {
        auto const byte = static_cast<unsigned char>(ch);
        if (isWordByte(byte)) {
            current.push_back(lowercase ? foldCase(byte) : ch);
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

auto countWords(std::string_view text, const CorpusOptions& options)
    -> std::vector<WordCount> {
    std::vector<WordCount> counts;
    std::unordered_map<std::string, size_t> positions;

    for (auto& word : tokenize(text, options.lowercase)) {
        auto [it, inserted] = positions.try_emplace(word, counts.size());
        if (inserted) {
            counts.push_back({std::move(word), 1});
        } else {
            ++counts[it->second].count;
        }
    }

    if (options.minCount > 1) {
        std::erase_if(counts, [&options](const WordCount& entry) {
            return entry.count < options.minCount;
        });
    }
    return counts;
}

auto buildWordCountTrie(std::string_view text, const CorpusOptions& options)
    -> WordCountTrie {
    WordCountTrie trie;
    for (auto& [word, count] : countWords(text, options)) {
        trie.set(word, count);
    }
    LEXITRIE_LOG_DEBUG(logger(), "Built word count trie with {} words from {} bytes",
                       trie.size(), text.size());
    return trie;
}

auto loadWordCountTrie(const std::filesystem::path& path,
                       const CorpusOptions& options) -> WordCountTrie {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        THROW_FAIL_TO_OPEN_FILE("Failed to open corpus file: " + path.string());
    }
    std::string const text{std::istreambuf_iterator<char>(file),
                           std::istreambuf_iterator<char>()};

    LEXITRIE_LOG_INFO(logger(), "Read corpus {} ({} bytes)", path.string(),
                      text.size());
    return buildWordCountTrie(text, options);
}

}  // namespace lexitrie::corpus
