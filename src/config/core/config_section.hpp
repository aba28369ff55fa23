/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: CRTP base for the sections of the lexitrie configuration document

**************************************************/

#ifndef LEXITRIE_CONFIG_CORE_CONFIG_SECTION_HPP
#define LEXITRIE_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "exception.hpp"

namespace lexitrie::config {

using json = nlohmann::json;

/**
 * @brief Requirements on a type stored in a ConfigSection
 */
template <typename T>
concept ConfigSectionDerived = requires(T section, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { section.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief Typed view of one object inside the configuration document
 *
 * A section lives at the JSON pointer Derived::PATH. Derived types provide
 * serialize(), a static deserialize() that reads fields with defaults and
 * throws InvalidConfigException for out-of-range values, and a static
 * generateSchema().
 *
 * @example
 * ```cpp
 * struct CorpusConfig : ConfigSection<CorpusConfig> {
 *     static constexpr std::string_view PATH = "/lexitrie/corpus";
 *
 *     bool lowercase = true;
 *
 *     [[nodiscard]] json serialize() const {
 *         return {{"lowercase", lowercase}};
 *     }
 *
 *     [[nodiscard]] static CorpusConfig deserialize(const json& j) {
 *         CorpusConfig cfg;
 *         cfg.lowercase = j.value("lowercase", cfg.lowercase);
 *         return cfg;
 *     }
 *
 *     [[nodiscard]] static json generateSchema();
 * };
 * ```
 *
 * @tparam Derived Concrete section type
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Parse the section object itself
     *
     * @throws BadConfigException if @p j is not an object or a field has
     * the wrong JSON type
     * @throws InvalidConfigException if a value is out of range
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        if (!j.is_object()) {
            THROW_BAD_CONFIG_EXCEPTION("Section " + std::string(path()) +
                                       " must be a JSON object");
        }
        try {
            return Derived::deserialize(j);
        } catch (const json::exception& e) {
            THROW_BAD_CONFIG_EXCEPTION("Malformed section " +
                                       std::string(path()) + ": " + e.what());
        }
    }

    // nullopt instead of BadConfigException or InvalidConfigException
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return fromJson(j);
        } catch (const BadConfigException&) {
            return std::nullopt;
        }
    }

    [[nodiscard]] static bool presentIn(const json& document) {
        return document.contains(pointer());
    }

    /**
     * @brief Read the section from a whole configuration document
     *
     * A document without the section yields the defaults.
     */
    [[nodiscard]] static Derived fromDocument(const json& document) {
        if (!presentIn(document)) {
            return defaults();
        }
        return fromJson(document.at(pointer()));
    }

    // Creates the intermediate objects on the way to PATH
    void writeTo(json& document) const { document[pointer()] = toJson(); }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Overlay the fields of @p other onto this section
     *
     * The merged result is validated again.
     */
    void merge(const Derived& other) {
        auto merged = toJson();
        merged.merge_patch(other.toJson());
        *static_cast<Derived*>(this) = fromJson(merged);
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Declare a property of the section schema
     */
    template <typename T>
    static void describe(json& schema, const std::string& name,
                         const std::string& type, const T& defaultValue,
                         const std::string& description = "") {
        auto& property = schema["properties"][name];
        property = {{"type", type}, {"default", defaultValue}};
        if (!description.empty()) {
            property["description"] = description;
        }
    }

    /**
     * @brief Attach a JSON Schema keyword (minimum, enum, ...) to a
     * property declared with describe()
     */
    static void constrain(json& schema, const std::string& name,
                          const std::string& keyword, json value) {
        schema["properties"][name][keyword] = std::move(value);
    }

private:
    static json::json_pointer pointer() {
        return json::json_pointer{std::string(path())};
    }
};

}  // namespace lexitrie::config

#endif  // LEXITRIE_CONFIG_CORE_CONFIG_SECTION_HPP
