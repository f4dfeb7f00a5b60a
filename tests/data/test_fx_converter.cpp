#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "fund_ngin/data/fx_converter.hpp"
#include "mock_market_data.hpp"

using namespace fund_ngin;
using namespace fund_ngin::testing;

class FxConverterTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        store = std::make_shared<InMemoryPriceStore>();
        cache = std::make_shared<TimeSeriesCache>(std::make_shared<SyntheticGateway>(), store,
                                                  fast_cache_config(),
                                                  std::make_shared<InstantSleeper>());
        FxConfig config;
        config.base_currency = "BRL";
        config.default_rates = {{"EURBRL", 5.5}};
        fx = std::make_unique<FxConverter>(cache, config);
        as_of = core::make_date(2024, 6, 28);
    }

    std::shared_ptr<InMemoryPriceStore> store;
    std::shared_ptr<TimeSeriesCache> cache;
    std::unique_ptr<FxConverter> fx;
    Timestamp as_of;
};

TEST_F(FxConverterTest, PairSymbolFollowsMarketConvention) {
    EXPECT_EQ(FxConverter::pair_symbol("USD", "BRL"), "USDBRL=X");
}

TEST_F(FxConverterTest, SameCurrencyIsIdentity) {
    auto rate = fx->rate("BRL", "BRL", as_of);
    ASSERT_TRUE(rate.is_ok());
    EXPECT_DOUBLE_EQ(rate.value().rate, 1.0);
    EXPECT_FALSE(rate.value().stale);
}

TEST_F(FxConverterTest, DirectPairFromCache) {
    store->put_close("USDBRL=X", core::make_date(2024, 6, 27), 5.45);

    auto rate = fx->rate("USD", "BRL", as_of);
    ASSERT_TRUE(rate.is_ok());
    EXPECT_DOUBLE_EQ(rate.value().rate, 5.45);
    EXPECT_EQ(rate.value().source, PriceSource::CACHE);
    EXPECT_EQ(*rate.value().rate_date, core::make_date(2024, 6, 27));

    auto money = fx->convert(Money(100.0, "USD"), "BRL", as_of);
    ASSERT_TRUE(money.is_ok());
    EXPECT_DOUBLE_EQ(money.value().amount, 545.0);
    EXPECT_EQ(money.value().currency, "BRL");
}

TEST_F(FxConverterTest, InversePairWhenDirectMissing) {
    store->put_close("USDBRL=X", core::make_date(2024, 6, 27), 5.0);

    auto rate = fx->rate("BRL", "USD", as_of);
    ASSERT_TRUE(rate.is_ok());
    EXPECT_DOUBLE_EQ(rate.value().rate, 0.2);
}

TEST_F(FxConverterTest, DefaultRateIsStaleFallback) {
    auto rate = fx->rate("EUR", "BRL", as_of);
    ASSERT_TRUE(rate.is_ok());
    EXPECT_DOUBLE_EQ(rate.value().rate, 5.5);
    EXPECT_EQ(rate.value().source, PriceSource::FALLBACK);
    EXPECT_TRUE(rate.value().stale);
}

TEST_F(FxConverterTest, CrossThroughBaseCurrency) {
    store->put_close("USDBRL=X", core::make_date(2024, 6, 27), 5.0);

    // EUR -> BRL from defaults, BRL -> USD from the inverse cached pair
    auto rate = fx->rate("EUR", "USD", as_of);
    ASSERT_TRUE(rate.is_ok());
    EXPECT_DOUBLE_EQ(rate.value().rate, 5.5 * 0.2);
    EXPECT_EQ(rate.value().source, PriceSource::FALLBACK);
}

TEST_F(FxConverterTest, UnknownPairFails) {
    auto rate = fx->rate("JPY", "BRL", as_of);
    ASSERT_TRUE(rate.is_error());
    EXPECT_EQ(rate.error()->code(), ErrorCode::DATA_NOT_FOUND);

    auto rates = fx->rates_to({"BRL", "EUR", "JPY"}, "BRL", as_of);
    EXPECT_EQ(rates.size(), 2u);
    EXPECT_EQ(rates.count("JPY"), 0u);
}
