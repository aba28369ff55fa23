/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Trie Exception Types

**************************************************/

#ifndef LEXITRIE_EXCEPTION_EXCEPTION_HPP
#define LEXITRIE_EXCEPTION_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace lexitrie {

/**
 * @brief Base exception for trie errors
 */
class TrieException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

/**
 * @brief Thrown by lookups and removals when a key is not stored
 *
 * A key whose path exists only as a prefix of other keys is reported as
 * not found as well.
 */
class KeyNotFoundException : public TrieException {
    using TrieException::TrieException;
};

#define THROW_KEY_NOT_FOUND(...)                                          \
    throw lexitrie::KeyNotFoundException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                         ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Thrown when a persisted trie cannot be decoded
 */
class TrieSerializationException : public TrieException {
    using TrieException::TrieException;
};

#define THROW_TRIE_SERIALIZATION_EXCEPTION(...)        \
    throw lexitrie::TrieSerializationException(         \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace lexitrie

#endif  // LEXITRIE_EXCEPTION_EXCEPTION_HPP
