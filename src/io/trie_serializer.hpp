/*
 * trie_serializer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Persistence of tries as JSON, CBOR or MessagePack documents

**************************************************/

#ifndef LEXITRIE_IO_TRIE_SERIALIZER_HPP
#define LEXITRIE_IO_TRIE_SERIALIZER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "core/trie.hpp"
#include "exception/exception.hpp"
#include "storage_format.hpp"

namespace lexitrie::io {

using json = nlohmann::json;

/**
 * @brief Saves and restores complete tries
 *
 * A trie is written as one document holding a flat node list:
 *
 * ```json
 * {"format": "lexitrie", "version": 1, "size": 1,
 *  "nodes": [[-1, null, 1], [0, 99, 1, 7]]}
 * ```
 *
 * Nodes appear in depth-first pre-order. Each entry is
 * [parent index, symbol, subtree count] followed by the value when the node
 * has one; the root comes first with parent -1 and a null symbol. The list
 * stays two levels deep whatever the key length, and both directions walk
 * it with explicit stacks.
 *
 * Loading replays the entries through the regular node operations, so
 * parent links and counts are rebuilt rather than trusted; the stored
 * counts are only compared against the rebuilt ones to reject damaged
 * input.
 *
 * Value and Symbol must be convertible to and from nlohmann::json.
 *
 * @tparam Value Payload type of the trie
 * @tparam Traits Key conversion policy of the trie
 */
template <typename Value, core::KeyTraits Traits = core::StringKeyTraits>
class TrieSerializer {
public:
    using TrieType = core::Trie<Value, Traits>;
    using Node = typename TrieType::Node;
    using Symbol = typename TrieType::Symbol;

    static constexpr std::string_view FORMAT_TAG = "lexitrie";
    static constexpr int VERSION = 1;

    [[nodiscard]] static auto toJson(const TrieType& trie) -> json {
        return {{"format", std::string(FORMAT_TAG)},
                {"version", VERSION},
                {"size", trie.size()},
                {"nodes", writeNodes(trie.root())}};
    }

    /**
     * @throws TrieSerializationException if the document is not a valid
     * trie document
     */
    [[nodiscard]] static auto fromJson(const json& document) -> TrieType {
        TrieType trie;
        try {
            if (!document.is_object() ||
                document.value("format", std::string{}) != FORMAT_TAG) {
                THROW_TRIE_SERIALIZATION_EXCEPTION(
                    "Document is not a lexitrie archive");
            }
            auto const version = document.at("version").get<int>();
            if (version != VERSION) {
                THROW_TRIE_SERIALIZATION_EXCEPTION(
                    "Unsupported archive version " + std::to_string(version));
            }
            readNodes(document.at("nodes"), trie.root());
            if (document.at("size").get<std::size_t>() != trie.size()) {
                THROW_TRIE_SERIALIZATION_EXCEPTION(
                    "Archive size does not match its contents");
            }
        } catch (const json::exception& e) {
            THROW_TRIE_SERIALIZATION_EXCEPTION(
                std::string("Malformed trie archive: ") + e.what());
        }
        return trie;
    }

    [[nodiscard]] static auto encode(const TrieType& trie, StorageFormat format,
                                     int indent = -1)
        -> std::vector<std::uint8_t> {
        auto const document = toJson(trie);
        switch (format) {
            case StorageFormat::CBOR:
                return json::to_cbor(document);
            case StorageFormat::MSGPACK:
                return json::to_msgpack(document);
            case StorageFormat::JSON:
                break;
        }
        auto const text = document.dump(indent);
        return {text.begin(), text.end()};
    }

    /**
     * @throws TrieSerializationException if @p bytes cannot be decoded
     */
    [[nodiscard]] static auto decode(std::span<const std::uint8_t> bytes,
                                     StorageFormat format) -> TrieType {
        json document;
        try {
            switch (format) {
                case StorageFormat::CBOR:
                    document = json::from_cbor(bytes.begin(), bytes.end());
                    break;
                case StorageFormat::MSGPACK:
                    document = json::from_msgpack(bytes.begin(), bytes.end());
                    break;
                case StorageFormat::JSON:
                    document = json::parse(bytes.begin(), bytes.end());
                    break;
            }
        } catch (const json::parse_error& e) {
            THROW_TRIE_SERIALIZATION_EXCEPTION(
                "Cannot decode " + storageFormatToString(format) +
                " trie archive: " + e.what());
        }
        return fromJson(document);
    }

    /**
     * @brief Write @p trie to @p path, replacing any existing file
     *
     * @throws atom::error::FailToOpenFile if the file cannot be written
     */
    static void save(const TrieType& trie, const std::filesystem::path& path,
                     StorageFormat format = StorageFormat::CBOR,
                     int indent = -1) {
        auto const bytes = encode(trie, format, indent);

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            THROW_FAIL_TO_OPEN_FILE("Failed to open trie archive for writing: " +
                                    path.string());
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            THROW_FAIL_TO_OPEN_FILE("Failed to write trie archive: " +
                                    path.string());
        }

        spdlog::debug("Saved trie with {} keys to {} ({} bytes, {})",
                      trie.size(), path.string(), bytes.size(),
                      storageFormatToString(format));
    }

    /**
     * @throws atom::error::FailToOpenFile if the file cannot be read
     * @throws TrieSerializationException if the contents are not a trie
     */
    [[nodiscard]] static auto load(const std::filesystem::path& path,
                                   StorageFormat format = StorageFormat::CBOR)
        -> TrieType {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            THROW_FAIL_TO_OPEN_FILE("Failed to open trie archive: " +
                                    path.string());
        }
        std::vector<std::uint8_t> const bytes{
            std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()};

        auto trie = decode(bytes, format);
        spdlog::debug("Loaded trie with {} keys from {}", trie.size(),
                      path.string());
        return trie;
    }

private:
    static constexpr std::int64_t NO_PARENT = -1;

    static auto writeNodes(const Node& root) -> json {
        struct Pending {
            const Node* node;
            std::int64_t parent;
            json symbol;
        };

        json nodes = json::array();
        std::vector<Pending> stack;
        stack.push_back({&root, NO_PARENT, nullptr});
        while (!stack.empty()) {
            auto [node, parent, symbol] = std::move(stack.back());
            stack.pop_back();

            auto const index = static_cast<std::int64_t>(nodes.size());
            json entry = json::array({parent, std::move(symbol), node->count()});
            if (node->hasValue()) {
                entry.push_back(*node->value());
            }
            nodes.push_back(std::move(entry));

            // Reversed so that children pop in traversal order
            const auto& children = node->children();
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                stack.push_back({it->second.get(), index, json(it->first)});
            }
        }
        return nodes;
    }

    static void readNodes(const json& nodes, Node& root) {
        if (!nodes.is_array() || nodes.empty()) {
            THROW_TRIE_SERIALIZATION_EXCEPTION("Archive holds no root node");
        }

        std::vector<Node*> created;
        created.reserve(nodes.size());
        for (const auto& entry : nodes) {
            if (!entry.is_array() || entry.size() < 3 || entry.size() > 4) {
                THROW_TRIE_SERIALIZATION_EXCEPTION(
                    "Trie node must be a [parent, symbol, count, value] entry");
            }

            auto const parent = entry.at(0).template get<std::int64_t>();
            Node* node = nullptr;
            if (created.empty()) {
                if (parent != NO_PARENT) {
                    THROW_TRIE_SERIALIZATION_EXCEPTION(
                        "First archive node must be the root");
                }
                node = &root;
            } else {
                if (parent < 0 ||
                    static_cast<std::size_t>(parent) >= created.size()) {
                    THROW_TRIE_SERIALIZATION_EXCEPTION(
                        "Trie node refers to a parent not seen before it");
                }
                Node* owner = created[static_cast<std::size_t>(parent)];
                auto const symbol = entry.at(1).template get<Symbol>();
                if (owner->childFor(symbol) != nullptr) {
                    THROW_TRIE_SERIALIZATION_EXCEPTION("Duplicate trie edge");
                }
                node = &owner->childOrCreate(symbol);
            }

            if (entry.size() == 4) {
                node->attachValue(entry.at(3).template get<Value>());
            }
            created.push_back(node);
        }

        for (std::size_t i = 0; i < created.size(); ++i) {
            if (!created[i]->isRoot() && created[i]->isPrunable()) {
                THROW_TRIE_SERIALIZATION_EXCEPTION(
                    "Archive contains a node without value or children");
            }
            if (nodes[i].at(2).template get<std::size_t>() !=
                created[i]->count()) {
                THROW_TRIE_SERIALIZATION_EXCEPTION(
                    "Stored subtree count does not match its contents");
            }
        }
    }
};

}  // namespace lexitrie::io

#endif  // LEXITRIE_IO_TRIE_SERIALIZER_HPP
