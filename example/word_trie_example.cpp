/*
 * word_trie_example.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Builds a word count trie from a text file and runs prefix and
approximate queries against it

*************************************************/

#include <exception>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config_loader.hpp"
#include "corpus/word_counter.hpp"
#include "fuzzy/approximate_match.hpp"
#include "fuzzy/edit_generator.hpp"
#include "io/trie_serializer.hpp"
#include "logging/log_config.hpp"

using namespace lexitrie;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0]
                  << " <corpus.txt> <query> [config.json] [archive]\n";
        return 1;
    }

    try {
        config::LexitrieConfig settings;
        if (argc > 3) {
            settings = config::ConfigLoader::loadFile(argv[3]);
        }
        logging::LogConfig::initialize(settings.logging.toLoggerConfig());

        auto const trie = corpus::loadWordCountTrie(
            argv[1], corpus::CorpusOptions::fromConfig(settings.corpus));
        std::string const query = argv[2];

        std::cout << "=== " << trie.size() << " distinct words ===\n";

        std::cout << "\nStored prefixes of '" << query << "':\n";
        for (const auto& [word, count] : trie.iterPrefixes(query)) {
            std::cout << "  " << word << " (" << count << ")\n";
        }

        std::cout << "\nWords starting with '" << query << "':\n";
        if (auto const completions = trie.findPrefix(query)) {
            for (const auto& word : *completions) {
                std::cout << "  " << word << " (" << trie.get(word) << ")\n";
            }
        } else {
            std::cout << "  (none)\n";
        }

        fuzzy::EditGenerator const generator(settings.fuzzy);
        std::cout << "\nWords within " << generator.defaultDistance()
                  << " edits of '" << query << "':\n";
        for (const auto& word :
             fuzzy::findWithinDistance(trie, query, generator)) {
            std::cout << "  " << word << "\n";
        }

        if (argc > 4) {
            io::TrieSerializer<std::uint64_t>::save(
                trie, argv[4], settings.storage.format, settings.storage.indent);
            std::cout << "\nSaved trie to " << argv[4] << "\n";
        }
    } catch (const std::exception& e) {
        spdlog::error("word_trie_example failed: {}", e.what());
        return 1;
    }

    logging::LogConfig::flushAll();
    return 0;
}
