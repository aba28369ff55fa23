#ifndef LEXITRIE_CORE_KEY_TRAITS_HPP
#define LEXITRIE_CORE_KEY_TRAITS_HPP

#include <concepts>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lexitrie::core {

/**
 * @brief Conversion policy between an external key and its symbol sequence
 *
 * A trie descends one symbol at a time. The traits type tells it how to
 * split a key into symbols and how to spell a key back from the symbols
 * accumulated along a path.
 *
 * @example
 * ```cpp
 * struct WordTraits {
 *     using Key = std::vector<std::string>;
 *     using Symbol = std::string;
 *     static auto toSymbols(const Key& key) -> std::vector<Symbol>;
 *     static auto fromSymbols(std::span<const Symbol> path) -> Key;
 * };
 * ```
 */
template <typename T>
concept KeyTraits = requires(const typename T::Key& key,
                             std::span<const typename T::Symbol> path,
                             const typename T::Symbol& a,
                             const typename T::Symbol& b) {
    typename T::Key;
    typename T::Symbol;
    {
        T::toSymbols(key)
    } -> std::convertible_to<std::vector<typename T::Symbol>>;
    { T::fromSymbols(path) } -> std::convertible_to<typename T::Key>;
    { a == b } -> std::convertible_to<bool>;
};

/**
 * @brief Character keys spelled back as joined strings
 */
struct StringKeyTraits {
    using Key = std::string;
    using Symbol = char;

    [[nodiscard]] static auto toSymbols(std::string_view key)
        -> std::vector<Symbol> {
        return {key.begin(), key.end()};
    }

    [[nodiscard]] static auto fromSymbols(std::span<const Symbol> path)
        -> Key {
        return {path.begin(), path.end()};
    }
};

/**
 * @brief Keys that are plain sequences of symbols (e.g. token lists)
 *
 * @tparam T Symbol type, must be equality comparable
 */
template <std::equality_comparable T>
struct SequenceKeyTraits {
    using Key = std::vector<T>;
    using Symbol = T;

    [[nodiscard]] static auto toSymbols(const Key& key) -> std::vector<Symbol> {
        return key;
    }

    [[nodiscard]] static auto fromSymbols(std::span<const Symbol> path)
        -> Key {
        return {path.begin(), path.end()};
    }
};

}  // namespace lexitrie::core

#endif  // LEXITRIE_CORE_KEY_TRAITS_HPP
