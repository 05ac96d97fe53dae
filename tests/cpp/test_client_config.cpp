#include <gtest/gtest.h>
#include "config/client_config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace imgen_core;
using json = nlohmann::json;

// -----------------------------------------------------------------------------
// Test fixture managing a scratch config file
// -----------------------------------------------------------------------------
class ClientConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("imgen_client_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write_file(const std::string& contents) const {
        std::ofstream out(path_);
        out << contents;
    }

    std::filesystem::path path_;
};

// --------------------------------------------------------------------------
// In-memory documents
// --------------------------------------------------------------------------
TEST_F(ClientConfigTest, EmptyObjectKeepsDefaults) {
    const auto config = config::parse_client_config_json(json::object());
    EXPECT_EQ(config.log_level, spdlog::level::info);
    EXPECT_EQ(config.log_pattern, config::DEFAULT_LOG_PATTERN);
    EXPECT_FALSE(config.verbose);
    EXPECT_FALSE(config.is_opus);
    EXPECT_FALSE(config.stream);
    EXPECT_EQ(config.default_model, Model::V4_5);
    EXPECT_EQ(config.default_resolution, Resolution::NORMAL_SQUARE);
}

TEST_F(ClientConfigTest, ReadsEveryKey) {
    const json doc = {
        {"log_level", "debug"},
        {"log_pattern", "%v"},
        {"verbose", true},
        {"is_opus", true},
        {"stream", true},
        {"default_model", "nai-diffusion-3"},
        {"default_resolution", "normal_portrait"},
    };

    const auto config = config::parse_client_config_json(doc);
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_EQ(config.log_pattern, "%v");
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.is_opus);
    EXPECT_TRUE(config.stream);
    EXPECT_EQ(config.default_model, Model::V3);
    EXPECT_EQ(config.default_resolution, Resolution::NORMAL_PORTRAIT);
}

TEST_F(ClientConfigTest, RejectsInvalidValues) {
    EXPECT_THROW((void)config::parse_client_config_json(json::array()), config::ConfigParseError);
    EXPECT_THROW((void)config::parse_client_config_json(json{{"log_level", "loud"}}), config::ConfigParseError);
    EXPECT_THROW((void)config::parse_client_config_json(json{{"verbose", "yes"}}), config::ConfigParseError);
    EXPECT_THROW((void)config::parse_client_config_json(json{{"default_model", "nai-diffusion-9"}}),
                 config::ConfigParseError);
    EXPECT_NO_THROW((void)config::parse_client_config_json(json{{"log_level", "off"}}));
}

// --------------------------------------------------------------------------
// Files
// --------------------------------------------------------------------------
TEST_F(ClientConfigTest, ReadsFile) {
    write_file(R"({"log_level": "warning", "stream": true})");

    const auto config = config::parse_client_config(path_.string());
    EXPECT_EQ(config.log_level, spdlog::level::warn);
    EXPECT_TRUE(config.stream);
}

TEST_F(ClientConfigTest, MissingOrMalformedFile) {
    EXPECT_THROW((void)config::parse_client_config(path_.string()), config::ConfigParseError);

    write_file("{ not json");
    EXPECT_THROW((void)config::parse_client_config(path_.string()), config::ConfigParseError);
}

TEST_F(ClientConfigTest, ConfigureLoggingAppliesLevel) {
    const auto previous = spdlog::get_level();

    config::ClientConfig config;
    config.log_level = spdlog::level::err;
    config::configure_logging(config);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);

    config.log_level = previous;
    config.log_pattern = "%+";
    config::configure_logging(config);
}
