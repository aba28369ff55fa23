/*
 * edit_generator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-7-12

Description: Candidate generation for approximate string matching

**************************************************/

#ifndef LEXITRIE_FUZZY_EDIT_GENERATOR_HPP
#define LEXITRIE_FUZZY_EDIT_GENERATOR_HPP

#include <string>
#include <string_view>
#include <unordered_set>

namespace lexitrie::config {
struct FuzzyConfig;
}

namespace lexitrie::fuzzy {

/// Set of candidate strings produced by the edit functions
using EditSet = std::unordered_set<std::string>;

/// Lowercase Latin letters, the default insertion/substitution alphabet
inline constexpr std::string_view DEFAULT_ALPHABET =
    "abcdefghijklmnopqrstuvwxyz";

/**
 * @brief All strings one edit away from @p word
 *
 * An edit is one of: deleting a character, swapping two adjacent
 * characters, replacing a character by an alphabet symbol, or inserting an
 * alphabet symbol at any position. Replacing a character by itself is a
 * valid substitution, so @p word is part of the result whenever it is not
 * empty.
 *
 * @param word Source string
 * @param alphabet Symbols used for substitutions and insertions
 * @return Distinct candidates
 */
[[nodiscard]] auto edits1(std::string_view word,
                          std::string_view alphabet = DEFAULT_ALPHABET)
    -> EditSet;

/**
 * @brief All strings reachable from @p word by exactly @p distance
 * successive single edits
 *
 * The candidate set grows roughly as (54 * |word|)^distance for the default
 * alphabet; callers are expected to keep @p distance small.
 *
 * @throws atom::error::InvalidArgument if @p distance is not positive
 */
[[nodiscard]] auto editsN(std::string_view word, int distance,
                          std::string_view alphabet = DEFAULT_ALPHABET)
    -> EditSet;

/**
 * @brief Edit candidate generator bound to a fixed alphabet
 *
 * @example
 * ```cpp
 * EditGenerator generator("abc");
 * auto candidates = generator.generate("ab", 1);
 * ```
 */
class EditGenerator {
public:
    /**
     * @throws atom::error::InvalidArgument if @p alphabet is empty
     */
    explicit EditGenerator(std::string alphabet = std::string(DEFAULT_ALPHABET));

    explicit EditGenerator(const config::FuzzyConfig& config);

    [[nodiscard]] auto alphabet() const noexcept -> const std::string& {
        return alphabet_;
    }

    [[nodiscard]] auto defaultDistance() const noexcept -> int {
        return defaultDistance_;
    }

    [[nodiscard]] auto single(std::string_view word) const -> EditSet;

    [[nodiscard]] auto generate(std::string_view word, int distance) const
        -> EditSet;

    [[nodiscard]] auto generate(std::string_view word) const -> EditSet {
        return generate(word, defaultDistance_);
    }

private:
    std::string alphabet_;
    int defaultDistance_ = 2;
};

}  // namespace lexitrie::fuzzy

#endif  // LEXITRIE_FUZZY_EDIT_GENERATOR_HPP
