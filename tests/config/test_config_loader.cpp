/**
 * @file test_config_loader.cpp
 * @brief Unit tests for configuration sections and the config loader
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "atom/error/exception.hpp"
#include "config/config_loader.hpp"
#include "corpus/word_counter.hpp"
#include "fuzzy/edit_generator.hpp"

namespace lexitrie::config::test {

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = fs::temp_directory_path() / "lexitrie_config_test";
        fs::create_directories(tempDir_);
    }

    void TearDown() override { fs::remove_all(tempDir_); }

    fs::path tempDir_;
};

// ============================================================================
// Sections
// ============================================================================

TEST_F(ConfigLoaderTest, SectionPaths) {
    EXPECT_EQ(FuzzyConfig::path(), "/lexitrie/fuzzy");
    EXPECT_EQ(CorpusConfig::path(), "/lexitrie/corpus");
    EXPECT_EQ(StorageConfig::path(), "/lexitrie/storage");
    EXPECT_EQ(LoggingConfig::path(), "/lexitrie/logging");
}

TEST_F(ConfigLoaderTest, SectionDefaults) {
    auto const fuzzy = FuzzyConfig::defaults();
    EXPECT_EQ(fuzzy.alphabet, "abcdefghijklmnopqrstuvwxyz");
    EXPECT_EQ(fuzzy.defaultDistance, 2);

    auto const corpus = CorpusConfig::defaults();
    EXPECT_TRUE(corpus.lowercase);
    EXPECT_EQ(corpus.minCount, 1);

    auto const storage = StorageConfig::defaults();
    EXPECT_EQ(storage.format, io::StorageFormat::CBOR);
    EXPECT_EQ(storage.indent, -1);

    EXPECT_EQ(FuzzyConfig::fromJson(json::object()), fuzzy);
}

TEST_F(ConfigLoaderTest, SectionRejectsNonObject) {
    EXPECT_THROW(static_cast<void>(FuzzyConfig::fromJson(json::array())),
                 BadConfigException);
    EXPECT_EQ(CorpusConfig::tryFromJson(json(42)), std::nullopt);
}

TEST_F(ConfigLoaderTest, SectionRejectsOutOfRangeValues) {
    EXPECT_THROW(
        static_cast<void>(FuzzyConfig::fromJson({{"defaultDistance", 0}})),
        InvalidConfigException);
    EXPECT_THROW(static_cast<void>(FuzzyConfig::fromJson({{"alphabet", ""}})),
                 InvalidConfigException);
    EXPECT_THROW(static_cast<void>(CorpusConfig::fromJson({{"minCount", 0}})),
                 InvalidConfigException);
    EXPECT_THROW(
        static_cast<void>(StorageConfig::fromJson({{"format", "yaml"}})),
        InvalidConfigException);
    EXPECT_THROW(static_cast<void>(LoggingConfig::fromJson({{"maxFiles", 0}})),
                 InvalidConfigException);
}

TEST_F(ConfigLoaderTest, TryFromJsonSwallowsTypeErrors) {
    EXPECT_EQ(FuzzyConfig::tryFromJson({{"alphabet", 5}}), std::nullopt);
    auto const parsed = FuzzyConfig::tryFromJson({{"alphabet", "xyz"}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->alphabet, "xyz");
}

TEST_F(ConfigLoaderTest, SectionReadsAndWritesItsPointer) {
    json document = json::object();
    EXPECT_FALSE(StorageConfig::presentIn(document));
    EXPECT_EQ(StorageConfig::fromDocument(document), StorageConfig::defaults());

    StorageConfig storage;
    storage.format = io::StorageFormat::JSON;
    storage.indent = 2;
    storage.writeTo(document);

    ASSERT_TRUE(StorageConfig::presentIn(document));
    EXPECT_EQ(document["lexitrie"]["storage"]["format"], "json");
    EXPECT_EQ(StorageConfig::fromDocument(document), storage);
}

TEST_F(ConfigLoaderTest, MergeOverridesValues) {
    FuzzyConfig base;
    FuzzyConfig other;
    other.defaultDistance = 1;

    base.merge(other);
    EXPECT_EQ(base.defaultDistance, 1);
    EXPECT_EQ(base.alphabet, other.alphabet);
}

TEST_F(ConfigLoaderTest, LoggingSectionTranslatesToLoggerConfig) {
    auto const section = LoggingConfig::fromJson(
        {{"level", "debug"}, {"enableFile", true}, {"maxFiles", 2}});
    auto const logger = section.toLoggerConfig();

    EXPECT_EQ(logger.level, logging::LogLevel::DEBUG);
    EXPECT_TRUE(logger.file_output);
    EXPECT_TRUE(logger.console_output);
    EXPECT_EQ(logger.max_files, 2);
    EXPECT_EQ(logger.log_file_path, "logs/lexitrie.log");
}

TEST_F(ConfigLoaderTest, SchemaDescribesSections) {
    auto const schema = LexitrieConfig::generateSchema();
    auto const& sections = schema["properties"]["lexitrie"]["properties"];
    ASSERT_TRUE(sections.contains("fuzzy"));
    ASSERT_TRUE(sections.contains("storage"));
    EXPECT_EQ(sections["fuzzy"]["properties"]["defaultDistance"]["minimum"], 1);
    EXPECT_EQ(sections["storage"]["properties"]["format"]["enum"].size(), 3);
    EXPECT_EQ(sections["logging"]["properties"]["level"]["default"], "info");
}

// ============================================================================
// Documents
// ============================================================================

TEST_F(ConfigLoaderTest, LoadStringWithComments) {
    auto const config = ConfigLoader::loadString(R"({
        // approximate matching
        "lexitrie": {
            "fuzzy": {"alphabet": "abc", "defaultDistance": 1},
            /* storage */
            "storage": {"format": "msgpack"}
        }
    })");

    EXPECT_EQ(config.fuzzy.alphabet, "abc");
    EXPECT_EQ(config.fuzzy.defaultDistance, 1);
    EXPECT_EQ(config.storage.format, io::StorageFormat::MSGPACK);
    EXPECT_EQ(config.corpus, CorpusConfig::defaults());
    EXPECT_EQ(config.logging, LoggingConfig::defaults());
}

TEST_F(ConfigLoaderTest, MissingSectionsUseDefaults) {
    auto const config = ConfigLoader::loadString("{}");
    EXPECT_EQ(config.fuzzy, FuzzyConfig::defaults());
    EXPECT_EQ(config.storage, StorageConfig::defaults());
}

TEST_F(ConfigLoaderTest, RejectsBadDocuments) {
    EXPECT_THROW(static_cast<void>(ConfigLoader::loadString("{ not json")),
                 BadConfigException);
    EXPECT_THROW(static_cast<void>(ConfigLoader::loadString("[1, 2]")),
                 BadConfigException);
    EXPECT_THROW(static_cast<void>(ConfigLoader::loadString(
                     R"({"lexitrie": {"fuzzy": {"alphabet": 5}}})")),
                 BadConfigException);
    EXPECT_THROW(static_cast<void>(ConfigLoader::loadString(
                     R"({"lexitrie": {"corpus": {"minCount": -2}}})")),
                 InvalidConfigException);
}

TEST_F(ConfigLoaderTest, SaveAndLoadFile) {
    LexitrieConfig config;
    config.fuzzy.defaultDistance = 3;
    config.corpus.lowercase = false;
    config.storage.format = io::StorageFormat::JSON;
    config.logging.level = "warn";

    auto const path = tempDir_ / "nested" / "lexitrie.json";
    ConfigLoader::saveFile(config, path);
    ASSERT_TRUE(fs::exists(path));

    auto const loaded = ConfigLoader::loadFile(path);
    EXPECT_EQ(loaded.fuzzy, config.fuzzy);
    EXPECT_EQ(loaded.corpus, config.corpus);
    EXPECT_EQ(loaded.storage, config.storage);
    EXPECT_EQ(loaded.logging, config.logging);
    EXPECT_EQ(loaded.toJson(), config.toJson());
}

TEST_F(ConfigLoaderTest, LoadFileErrors) {
    EXPECT_THROW(
        static_cast<void>(ConfigLoader::loadFile(tempDir_ / "absent.json")),
        atom::error::FailToOpenFile);

    auto const path = tempDir_ / "broken.json";
    std::ofstream(path) << "{\"lexitrie\": ";
    EXPECT_THROW(static_cast<void>(ConfigLoader::loadFile(path)),
                 BadConfigException);
}

// ============================================================================
// Consumers
// ============================================================================

TEST_F(ConfigLoaderTest, ConfigDrivesComponents) {
    auto const config = ConfigLoader::loadString(R"({"lexitrie": {
        "fuzzy": {"alphabet": "ab", "defaultDistance": 1},
        "corpus": {"lowercase": true, "minCount": 2}
    }})");

    fuzzy::EditGenerator generator(config.fuzzy);
    EXPECT_EQ(generator.generate("a"), fuzzy::edits1("a", "ab"));

    auto const trie = corpus::buildWordCountTrie(
        "Ab ab cd", corpus::CorpusOptions::fromConfig(config.corpus));
    EXPECT_EQ(trie.size(), 1);
    EXPECT_EQ(trie.get("ab"), 2);
}

}  // namespace lexitrie::config::test
