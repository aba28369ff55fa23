#ifndef LEXITRIE_CONFIG_SECTIONS_STORAGE_CONFIG_HPP
#define LEXITRIE_CONFIG_SECTIONS_STORAGE_CONFIG_HPP

#include "../core/config_section.hpp"
#include "io/storage_format.hpp"

namespace lexitrie::config {

/**
 * @brief Settings for persisting tries to disk
 */
struct StorageConfig : ConfigSection<StorageConfig> {
    static constexpr std::string_view PATH = "/lexitrie/storage";

    io::StorageFormat format{io::StorageFormat::CBOR};
    int indent{-1};  ///< JSON indentation, -1 for compact output

    [[nodiscard]] json serialize() const {
        return {{"format", io::storageFormatToString(format)},
                {"indent", indent}};
    }

    [[nodiscard]] static StorageConfig deserialize(const json& j) {
        StorageConfig cfg;
        auto const name = j.value("format", std::string{"cbor"});
        auto const format = io::storageFormatFromString(name);
        if (!format) {
            THROW_INVALID_CONFIG_EXCEPTION("Unknown storage format: " + name);
        }
        cfg.format = *format;
        cfg.indent = j.value("indent", cfg.indent);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema{{"type", "object"}};
        describe(schema, "format", "string", std::string{"cbor"},
                 "Encoding of saved tries");
        constrain(schema, "format", "enum", {"json", "cbor", "msgpack"});
        describe(schema, "indent", "integer", -1,
                 "Indentation of JSON output, -1 for compact");
        return schema;
    }
};

}  // namespace lexitrie::config

#endif  // LEXITRIE_CONFIG_SECTIONS_STORAGE_CONFIG_HPP
