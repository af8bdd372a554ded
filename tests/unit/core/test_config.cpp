//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/config.hpp"

#include <gtest/gtest.h>
#include <fstream>

namespace gitmine
{
    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "gitmine_config_test";
            fs::remove_all(temp_dir_);
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }

        [[nodiscard]] fs::path create_test_file(const std::string& filename, const std::string& content) const {
            const fs::path path = temp_dir_ / filename;
            std::ofstream file(path);
            file << content;
            return path;
        }

        fs::path temp_dir_;
    };

    TEST_F(ConfigTest, DefaultConfig) {
        const auto config = Config::default_config();

        EXPECT_EQ(config.mining.days_back, 30);
        EXPECT_TRUE(config.mining.branch.empty());
        EXPECT_EQ(config.mining.fallback_branches, (std::vector<std::string>{"main", "master"}));
        EXPECT_TRUE(config.mining.contributors.empty());
        EXPECT_EQ(config.mining.parallel_jobs, 1);
        EXPECT_EQ(config.structure.max_depth, 2);
        EXPECT_EQ(config.structure.max_entries, 10);
        EXPECT_EQ(config.logging.level, "warn");
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST_F(ConfigTest, LoadFromString) {
        const auto result = Config::load_from_string(R"(
            [mining]
            days_back = 7
            branch = "develop"
            fallback_branches = ["trunk"]
            contributors = ["alice", "bob"]
            parallel_jobs = 4

            [structure]
            max_depth = 3
            max_entries = 25

            [logging]
            level = "debug"
        )");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& config = result.value();
        EXPECT_EQ(config.mining.days_back, 7);
        EXPECT_EQ(config.mining.branch, "develop");
        EXPECT_EQ(config.mining.fallback_branches, (std::vector<std::string>{"trunk"}));
        EXPECT_EQ(config.mining.contributors, (std::vector<std::string>{"alice", "bob"}));
        EXPECT_EQ(config.mining.parallel_jobs, 4);
        EXPECT_EQ(config.structure.max_depth, 3);
        EXPECT_EQ(config.structure.max_entries, 25);
        EXPECT_EQ(config.logging.level, "debug");
    }

    TEST_F(ConfigTest, MissingKeysKeepDefaults) {
        const auto result = Config::load_from_string("[mining]\ndays_back = 0\n");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().mining.days_back, 0);
        EXPECT_EQ(result.value().mining.parallel_jobs, 1);
        EXPECT_EQ(result.value().structure.max_entries, 10);
    }

    TEST_F(ConfigTest, EmptyDocumentIsDefault) {
        const auto result = Config::load_from_string("");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().mining.days_back, 30);
    }

    TEST_F(ConfigTest, MalformedToml) {
        const auto result = Config::load_from_string("[mining\ndays_back = ");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, WrongTypesAreListed) {
        const auto result = Config::load_from_string(R"(
            [mining]
            days_back = "thirty"
            contributors = ["alice", 3]
        )");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        const auto context = result.error().context().value_or("");
        EXPECT_NE(context.find("mining.days_back must be an integer"), std::string::npos);
        EXPECT_NE(context.find("mining.contributors must be an array of strings"), std::string::npos);
    }

    TEST_F(ConfigTest, SectionMustBeTable) {
        const auto result = Config::load_from_string("mining = 3\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().context().value_or("").find("[mining] must be a table"), std::string::npos);
    }

    TEST_F(ConfigTest, ValidationFailures) {
        const auto result = Config::load_from_string(R"(
            [mining]
            days_back = -1
            parallel_jobs = 0

            [logging]
            level = "loud"
        )");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(result.error().message(), "Configuration validation failed");
        const auto context = result.error().context().value_or("");
        EXPECT_NE(context.find("days_back"), std::string::npos);
        EXPECT_NE(context.find("parallel_jobs"), std::string::npos);
        EXPECT_NE(context.find("logging.level"), std::string::npos);
    }

    TEST_F(ConfigTest, ValuesBeyondIntRangeRejected) {
        const auto result = Config::load_from_string(R"(
            [mining]
            days_back = 3000000000
            parallel_jobs = 4294967297
        )");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "Configuration validation failed");
        const auto context = result.error().context().value_or("");
        EXPECT_NE(context.find("days_back"), std::string::npos);
        EXPECT_NE(context.find("parallel_jobs"), std::string::npos);
    }

    TEST_F(ConfigTest, IntMaxDaysBackAccepted) {
        Config config;
        config.mining.days_back = 2147483647;

        EXPECT_TRUE(config.validate().is_ok());
        EXPECT_EQ(config.to_options().days_back, 2147483647);
    }

    TEST_F(ConfigTest, EmptyFallbackNameRejected) {
        Config config;
        config.mining.fallback_branches = {"main", ""};

        EXPECT_TRUE(config.validate().is_err());
    }

    TEST_F(ConfigTest, LoadFromFile) {
        const auto path = create_test_file(".gitmine.toml", "[mining]\nbranch = \"main\"\n");

        const auto result = Config::load_from_file(path);

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().mining.branch, "main");
    }

    TEST_F(ConfigTest, LoadFromMissingFile) {
        const auto result = Config::load_from_file(temp_dir_ / "absent.toml");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST_F(ConfigTest, FileErrorsNameThePath) {
        const auto path = create_test_file("broken.toml", "[[[");

        const auto result = Config::load_from_file(path);

        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().context().value_or("").find("broken.toml"), std::string::npos);
    }

    TEST_F(ConfigTest, ToOptions) {
        Config config;
        config.mining.days_back = 14;
        config.mining.branch = "release";
        config.mining.contributors = {"alice", "alice", "bob"};
        config.mining.parallel_jobs = 8;
        config.structure.max_depth = 1;
        config.structure.max_entries = 5;

        const auto options = config.to_options();

        EXPECT_EQ(options.days_back, 14);
        EXPECT_EQ(options.branch, "release");
        ASSERT_TRUE(options.contributor_filter.has_value());
        EXPECT_EQ(options.contributor_filter->size(), 2u);
        EXPECT_EQ(options.parallel_jobs, 8u);
        EXPECT_EQ(options.structure_limits.max_depth, 1u);
        EXPECT_EQ(options.structure_limits.max_entries, 5u);
    }

    TEST_F(ConfigTest, DefaultOptionsUseFallbackAndNoFilter) {
        const auto options = Config::default_config().to_options();

        EXPECT_FALSE(options.branch.has_value());
        EXPECT_FALSE(options.contributor_filter.has_value());
        EXPECT_EQ(options.fallback_branches, (std::vector<std::string>{"main", "master"}));
    }

    TEST_F(ConfigTest, ToStringRoundTrips) {
        Config config;
        config.mining.days_back = 90;
        config.mining.contributors = {"carol"};
        config.logging.level = "info";

        const auto reloaded = Config::load_from_string(config.to_string());

        ASSERT_TRUE(reloaded.is_ok()) << reloaded.error().to_string();
        EXPECT_EQ(reloaded.value().mining.days_back, 90);
        EXPECT_EQ(reloaded.value().mining.contributors, (std::vector<std::string>{"carol"}));
        EXPECT_EQ(reloaded.value().logging.level, "info");
    }

}  // namespace gitmine
