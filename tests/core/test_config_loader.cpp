#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "fund_ngin/core/config_loader.hpp"

using namespace fund_ngin;
using namespace fund_ngin::testing;

class ConfigLoaderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        base_dir = std::filesystem::temp_directory_path() / "fund_ngin_config_loader_test";
        std::filesystem::remove_all(base_dir);
        std::filesystem::create_directories(base_dir / "portfolios" / "growth");
        unsetenv("FUND_NGIN_DB_PASSWORD");
    }

    void TearDown() override {
        std::filesystem::remove_all(base_dir);
        unsetenv("FUND_NGIN_DB_PASSWORD");
        TestBase::TearDown();
    }

    void write(const std::filesystem::path& path, const nlohmann::json& j) {
        std::ofstream out(path);
        out << j.dump(2);
    }

    nlohmann::json defaults() const {
        return {{"base_currency", "BRL"},
                {"database", {{"host", "db.local"}, {"name", "funds"}, {"username", "svc"}}},
                {"cache", {{"batch_days", 100}, {"max_retries", 3}}},
                {"fees", {{"management_rate", 0.02}, {"performance_rate", 0.2}}}};
    }

    std::filesystem::path base_dir;
};

TEST_F(ConfigLoaderTest, PortfolioOverridesDefaultsKeyByKey) {
    write(base_dir / "defaults.json", defaults());
    write(base_dir / "portfolios" / "growth" / "portfolio.json",
          {{"fees", {{"performance_rate", 0.1}}}, {"cache", {{"batch_days", 50}}}});

    auto result = ConfigLoader::load(base_dir, "growth");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const FundConfig& config = result.value();
    EXPECT_EQ(config.portfolio_name, "growth");
    EXPECT_DOUBLE_EQ(config.fees.performance_rate, 0.1);
    EXPECT_DOUBLE_EQ(config.fees.management_rate, 0.02);
    EXPECT_EQ(config.cache.batch_days, 50);
    EXPECT_EQ(config.cache.max_retries, 3);
    EXPECT_EQ(config.database.host, "db.local");
}

TEST_F(ConfigLoaderTest, MissingDefaultsIsFileNotFound) {
    auto result = ConfigLoader::load(base_dir, "growth");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigLoaderTest, MalformedPortfolioFileIsParseError) {
    write(base_dir / "defaults.json", defaults());
    std::ofstream(base_dir / "portfolios" / "growth" / "portfolio.json") << "{ not json";

    auto result = ConfigLoader::load(base_dir, "growth");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigLoaderTest, ValidationRejectsOutOfRangeFees) {
    auto j = defaults();
    j["fees"]["performance_rate"] = 1.5;
    write(base_dir / "fund.json", j);

    auto result = ConfigLoader::load_file(base_dir / "fund.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConfigLoaderTest, ValidationRejectsBadCurrencyCode) {
    auto j = defaults();
    j["base_currency"] = "REAL";
    write(base_dir / "fund.json", j);

    auto result = ConfigLoader::load_file(base_dir / "fund.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConfigLoaderTest, BaseCurrencyFlowsIntoFeesAndFxWhenUnset) {
    nlohmann::json j = {{"portfolio_name", "usd_book"},
                        {"base_currency", "USD"},
                        {"database", {{"host", "localhost"}, {"name", "funds"}}}};
    auto result = ConfigLoader::extract_config(j);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().fees.currency, "USD");
    EXPECT_EQ(result.value().fx.base_currency, "USD");

    PortfolioConfig portfolio = result.value().portfolio_config();
    EXPECT_EQ(portfolio.name, "usd_book");
    EXPECT_EQ(portfolio.base_currency, "USD");
}

TEST_F(ConfigLoaderTest, PasswordFromEnvironment) {
    write(base_dir / "fund.json", defaults());
    setenv("FUND_NGIN_DB_PASSWORD", "s3cret", 1);

    auto result = ConfigLoader::load_file(base_dir / "fund.json");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().database.password, "s3cret");
}

TEST_F(ConfigLoaderTest, MergeJsonIsDeep) {
    nlohmann::json target = {{"a", {{"x", 1}, {"y", 2}}}, {"b", 1}};
    ConfigLoader::merge_json(target, {{"a", {{"y", 3}}}, {"c", true}});

    EXPECT_EQ(target["a"]["x"], 1);
    EXPECT_EQ(target["a"]["y"], 3);
    EXPECT_EQ(target["b"], 1);
    EXPECT_EQ(target["c"], true);
}
