// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/data/time_series_cache.hpp"
#include "fund_ngin/fund/fee_engine.hpp"

using namespace fund_ngin;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "fund_ngin_config_base_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write(const std::filesystem::path& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    CacheConfig config;
    config.batch_days = 30;
    config.max_retries = 5;
    config.backoff_multiplier = 1.5;

    std::filesystem::path file_path = test_dir / "nested" / "cache.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok()) << save_result.error()->what();
    ASSERT_TRUE(std::filesystem::exists(file_path));
    EXPECT_FALSE(std::filesystem::exists(file_path.string() + ".tmp"));

    CacheConfig loaded;
    auto load_result = loaded.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->what();
    EXPECT_EQ(loaded.batch_days, 30);
    EXPECT_EQ(loaded.max_retries, 5);
    EXPECT_DOUBLE_EQ(loaded.backoff_multiplier, 1.5);
}

TEST_F(ConfigBaseTest, PartialJsonKeepsDefaults) {
    FeeConfig config;
    ASSERT_TRUE(config.apply_json({{"performance_rate", 0.15}}).is_ok());

    EXPECT_DOUBLE_EQ(config.performance_rate, 0.15);
    EXPECT_DOUBLE_EQ(config.management_rate, 0.02);
    EXPECT_EQ(config.currency, "BRL");
    EXPECT_FALSE(config.initial_hwm.has_value());
}

TEST_F(ConfigBaseTest, MissingFileIsNotFound) {
    CacheConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    auto path = test_dir / "broken.json";
    write(path, "{ \"batch_days\": 10, ");

    CacheConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(config.batch_days, 100);
}

TEST_F(ConfigBaseTest, WrongValueTypeIsInvalidData) {
    CacheConfig config;
    auto result = config.apply_json({{"batch_days", "ten"}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);

    auto not_object = config.apply_json(nlohmann::json::array({1, 2}));
    ASSERT_TRUE(not_object.is_error());
    EXPECT_EQ(not_object.error()->code(), ErrorCode::INVALID_DATA);
}
