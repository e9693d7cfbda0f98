#include "dexcup/core/api/DexcupConfig.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using dexcup::core::api::DexcupConfig;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        directory_ = std::filesystem::temp_directory_path() / (std::string("dexcup_config_") + info->name());
        std::filesystem::remove_all(directory_);
        std::filesystem::create_directories(directory_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
    }

    std::string WriteConfig(const std::string& contents) const {
        const auto path = (directory_ / "dexcup.json").string();
        std::ofstream out(path, std::ios::trunc);
        out << contents;
        return path;
    }

    std::filesystem::path directory_;
};

}  // namespace

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    DexcupConfig config;
    std::string error;
    ASSERT_TRUE(DexcupConfig::LoadFromFile(WriteConfig(R"({"storage": {"type": "json_dir"}})"), config, &error))
        << error;
    EXPECT_EQ(config.storage.type, "json_dir");
    EXPECT_EQ(config.storage.directory, "data/tournaments");
    EXPECT_EQ(config.logging.max_log_lines, 2000);
    EXPECT_TRUE(config.logging.echo_stderr);
    EXPECT_EQ(config.format.playoff, "double-elimination");
    EXPECT_EQ(config.format.playoff_cutoff, 16);
    EXPECT_EQ(config.output.summary_json, "out/summary.json");
}

TEST_F(ConfigTest, ReadsEverySection) {
    const auto path = WriteConfig(R"({
        "storage": {"type": "memory", "directory": "unused"},
        "logging": {"max_log_lines": 50, "echo_stderr": false},
        "format": {"format": "swiss-tournament", "playoff": "single-elimination", "playoff_cutoff": 8},
        "output": {"standings_csv": "a.csv", "summary_json": "b.json"}
    })");
    DexcupConfig config;
    ASSERT_TRUE(DexcupConfig::LoadFromFile(path, config, nullptr));
    EXPECT_EQ(config.storage.directory, "unused");
    EXPECT_EQ(config.logging.max_log_lines, 50);
    EXPECT_FALSE(config.logging.echo_stderr);
    EXPECT_EQ(config.format.playoff, "single-elimination");
    EXPECT_EQ(config.format.playoff_cutoff, 8);
    EXPECT_EQ(config.output.standings_csv, "a.csv");
}

TEST_F(ConfigTest, SaveThenLoadKeepsValues) {
    DexcupConfig config;
    config.storage.type = "json_dir";
    config.storage.directory = (directory_ / "store").string();
    config.format.playoff.clear();
    config.format.playoff_cutoff = 0;

    const auto path = (directory_ / "nested" / "saved.json").string();
    std::string error;
    ASSERT_TRUE(DexcupConfig::SaveToFile(path, config, &error)) << error;

    DexcupConfig loaded;
    ASSERT_TRUE(DexcupConfig::LoadFromFile(path, loaded, &error)) << error;
    EXPECT_EQ(loaded.storage.directory, config.storage.directory);
    EXPECT_TRUE(loaded.format.playoff.empty());
    EXPECT_EQ(DexcupConfig::ToJsonString(loaded), DexcupConfig::ToJsonString(config));
}

TEST_F(ConfigTest, UnreadableFilesFail) {
    DexcupConfig config;
    std::string error;
    EXPECT_FALSE(DexcupConfig::LoadFromFile((directory_ / "absent.json").string(), config, &error));
    EXPECT_NE(error.find("Failed to open config"), std::string::npos);

    error.clear();
    EXPECT_FALSE(DexcupConfig::LoadFromFile(WriteConfig("{ broken"), config, &error));
    EXPECT_NE(error.find("Failed to parse JSON"), std::string::npos);

    error.clear();
    EXPECT_FALSE(DexcupConfig::LoadFromFile(WriteConfig(R"({"logging": {"max_log_lines": "many"}})"), config, &error));
    EXPECT_NE(error.find("Invalid config value"), std::string::npos);
}

TEST(ConfigValidateTest, Rules) {
    DexcupConfig config;
    std::string error;
    EXPECT_TRUE(DexcupConfig::Validate(config, &error));

    config.storage.type = "sqlite";
    EXPECT_FALSE(DexcupConfig::Validate(config, &error));
    EXPECT_NE(error.find("storage.type"), std::string::npos);

    config = DexcupConfig{};
    config.storage.type = "json_dir";
    config.storage.directory.clear();
    EXPECT_FALSE(DexcupConfig::Validate(config, nullptr));

    config = DexcupConfig{};
    config.logging.max_log_lines = 0;
    EXPECT_FALSE(DexcupConfig::Validate(config, nullptr));

    config = DexcupConfig{};
    config.format.format = "round-robin";
    EXPECT_FALSE(DexcupConfig::Validate(config, nullptr));

    config = DexcupConfig{};
    config.format.playoff = "triple-elimination";
    EXPECT_FALSE(DexcupConfig::Validate(config, nullptr));

    config = DexcupConfig{};
    config.format.playoff = "single-elimination";
    config.format.playoff_cutoff = 12;
    EXPECT_FALSE(DexcupConfig::Validate(config, &error));
    EXPECT_NE(error.find("power of two"), std::string::npos);
    config.format.playoff_cutoff = 4;
    EXPECT_TRUE(DexcupConfig::Validate(config, nullptr));

    config = DexcupConfig{};
    config.format.playoff_cutoff = 8;
    EXPECT_FALSE(DexcupConfig::Validate(config, &error));
    EXPECT_NE(error.find("16"), std::string::npos);
}
