#ifndef LEXITRIE_IO_STORAGE_FORMAT_HPP
#define LEXITRIE_IO_STORAGE_FORMAT_HPP

#include <optional>
#include <string>
#include <string_view>

namespace lexitrie::io {

/**
 * @brief On-disk encodings supported by TrieSerializer
 */
enum class StorageFormat {
    JSON,     ///< Text JSON
    CBOR,     ///< Concise Binary Object Representation
    MSGPACK   ///< MessagePack
};

[[nodiscard]] inline auto storageFormatToString(StorageFormat format)
    -> std::string {
    switch (format) {
        case StorageFormat::JSON: return "json";
        case StorageFormat::CBOR: return "cbor";
        case StorageFormat::MSGPACK: return "msgpack";
    }
    return "json";
}

[[nodiscard]] inline auto storageFormatFromString(std::string_view name)
    -> std::optional<StorageFormat> {
    if (name == "json") return StorageFormat::JSON;
    if (name == "cbor") return StorageFormat::CBOR;
    if (name == "msgpack" || name == "messagepack") {
        return StorageFormat::MSGPACK;
    }
    return std::nullopt;
}

}  // namespace lexitrie::io

#endif  // LEXITRIE_IO_STORAGE_FORMAT_HPP
