#ifndef LEXITRIE_FUZZY_APPROXIMATE_MATCH_HPP
#define LEXITRIE_FUZZY_APPROXIMATE_MATCH_HPP

#include <concepts>
#include <set>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "core/trie.hpp"
#include "edit_generator.hpp"

namespace lexitrie::fuzzy {

/**
 * @brief Stored keys reachable from @p word by exactly @p distance edits
 *
 * Every candidate produced by editsN() is looked up in the trie. The cost is
 * driven by the size of the candidate set, not by the size of the trie.
 *
 * @throws atom::error::InvalidArgument if @p distance is not positive
 */
template <typename Value, core::KeyTraits Traits>
    requires std::same_as<typename Traits::Key, std::string>
[[nodiscard]] auto findWithinDistance(const core::Trie<Value, Traits>& trie,
                                      std::string_view word, int distance = 2,
                                      std::string_view alphabet =
                                          DEFAULT_ALPHABET)
    -> std::set<std::string> {
    std::set<std::string> matches;
    for (const auto& candidate : editsN(word, distance, alphabet)) {
        if (trie.contains(candidate)) {
            matches.insert(candidate);
        }
    }
    spdlog::debug("Approximate match for '{}' found {} keys", word,
                  matches.size());
    return matches;
}

template <typename Value, core::KeyTraits Traits>
    requires std::same_as<typename Traits::Key, std::string>
[[nodiscard]] auto findWithinDistance(const core::Trie<Value, Traits>& trie,
                                      std::string_view word,
                                      const EditGenerator& generator)
    -> std::set<std::string> {
    return findWithinDistance(trie, word, generator.defaultDistance(),
                              generator.alphabet());
}

}  // namespace lexitrie::fuzzy

#endif  // LEXITRIE_FUZZY_APPROXIMATE_MATCH_HPP
