#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../data/mock_market_data.hpp"
#include "fund_ngin/core/time_utils.hpp"
#include "fund_ngin/fund/nav_calculator.hpp"

using namespace fund_ngin;
using namespace fund_ngin::testing;

class NavCalculatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        jan1 = core::make_date(2024, 1, 1);
        jan2 = core::make_date(2024, 1, 2);
        jan10 = core::make_date(2024, 1, 10);

        store = std::make_shared<InMemoryPriceStore>();
        cache = std::make_shared<TimeSeriesCache>(std::make_shared<SyntheticGateway>(), store,
                                                  fast_cache_config(),
                                                  std::make_shared<InstantSleeper>());
        FxConfig fx_config;
        fx_config.default_rates.clear();
        fx = std::make_shared<FxConverter>(cache, fx_config);

        registry = std::make_shared<InvestorRegistry>();
        registry->ensure_investor("INV001", "Ana");
        registry->ensure_investor("INV002", "Bruno");
        cash = std::make_shared<CashLedger>(registry);
        equities = std::make_shared<PositionLedger>(AssetClass::EQUITY);
        crypto = std::make_shared<PositionLedger>(AssetClass::CRYPTO);
        bonds = std::make_shared<std::vector<BondPosition>>();
        fees = std::make_shared<FeeEngine>();

        store->put_close("USDBRL=X", jan1, 5.0);
        store->put_close("PETR4.SA", jan10, 35.0);
        store->put_close("BTC-USD", jan10, 50000.0);

        NavInputs inputs;
        inputs.equities = equities;
        inputs.crypto = crypto;
        inputs.bonds = bonds;
        inputs.bond_engine = std::make_shared<BondIndexationEngine>();
        inputs.cash = cash;
        inputs.fees = fees;
        inputs.cache = cache;
        inputs.fx = fx;
        inputs.base_currency = "BRL";
        calculator = std::make_unique<NavCalculator>(inputs);
    }

    void deposit(const std::string& investor, double amount) {
        CashFlow flow;
        flow.investor_id = investor;
        flow.date = jan1;
        flow.amount = Money(amount, "BRL");
        ASSERT_TRUE(cash->add_cash_flow(flow).is_ok());
    }

    void buy(PositionLedger& ledger, const std::string& symbol, double qty, double price) {
        Transaction txn;
        txn.symbol = symbol;
        txn.date = jan2;
        txn.signed_quantity = qty;
        txn.price = price;
        txn.market = "Nacional";
        ASSERT_TRUE(ledger.apply(txn).is_ok());
    }

    Timestamp jan1;
    Timestamp jan2;
    Timestamp jan10;
    std::shared_ptr<InMemoryPriceStore> store;
    std::shared_ptr<TimeSeriesCache> cache;
    std::shared_ptr<FxConverter> fx;
    std::shared_ptr<InvestorRegistry> registry;
    std::shared_ptr<CashLedger> cash;
    std::shared_ptr<PositionLedger> equities;
    std::shared_ptr<PositionLedger> crypto;
    std::shared_ptr<std::vector<BondPosition>> bonds;
    std::shared_ptr<FeeEngine> fees;
    std::unique_ptr<NavCalculator> calculator;
};

TEST_F(NavCalculatorTest, NavSumsBooksInBaseCurrency) {
    deposit("INV001", 60000.0);
    deposit("INV002", 40000.0);
    buy(*equities, "PETR4", 100, 30.0);
    buy(*crypto, "BTC", 0.1, 40000.0);

    auto snapshot = calculator->nav(jan10);
    ASSERT_TRUE(snapshot.is_ok()) << snapshot.error()->what();
    EXPECT_DOUBLE_EQ(snapshot.value().equity_value, 3500.0);
    EXPECT_DOUBLE_EQ(snapshot.value().crypto_value, 25000.0);
    EXPECT_DOUBLE_EQ(snapshot.value().cash_position, 100000.0);
    EXPECT_DOUBLE_EQ(snapshot.value().nav, 128500.0);
    EXPECT_EQ(snapshot.value().currency, "BRL");
    EXPECT_TRUE(snapshot.value().stale_symbols.empty());
}

TEST_F(NavCalculatorTest, OutstandingFeesReduceNav) {
    deposit("INV001", 10000.0);
    FeeRecord owed;
    owed.period_start = jan1;
    owed.period_end = jan2;
    owed.amount = 500.0;
    owed.currency = "BRL";
    owed.state = FeeState::CALCULATED;
    ASSERT_TRUE(fees->restore({owed}, std::nullopt).is_ok());

    auto snapshot = calculator->nav(jan10);
    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_DOUBLE_EQ(snapshot.value().outstanding_fees, 500.0);
    EXPECT_DOUBLE_EQ(snapshot.value().nav, 9500.0);
}

TEST_F(NavCalculatorTest, BondsIssuedAfterDateAreExcluded) {
    BondPosition bond;
    bond.title = "LTN";
    bond.indexer = Indexer::PREFIXADO;
    bond.quantity = 1;
    bond.principal = 10000.0;
    bond.issue_date = jan2;
    bonds->push_back(bond);

    EXPECT_DOUBLE_EQ(calculator->nav(jan1).value().bond_value, 0.0);
    EXPECT_DOUBLE_EQ(calculator->nav(jan2).value().bond_value, 10000.0);
}

TEST_F(NavCalculatorTest, UnpricedHoldingIsStale) {
    buy(*equities, "VALE3", 10, 60.0);

    auto snapshot = calculator->nav(jan10);
    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_DOUBLE_EQ(snapshot.value().equity_value, 600.0);
    ASSERT_EQ(snapshot.value().stale_symbols.size(), 1u);
    EXPECT_EQ(snapshot.value().stale_symbols[0], "VALE3");
}

TEST_F(NavCalculatorTest, SnapshotsAreMemoizedUntilInvalidated) {
    deposit("INV001", 1000.0);
    ASSERT_TRUE(calculator->nav(jan2).is_ok());
    ASSERT_TRUE(calculator->nav(jan10).is_ok());
    ASSERT_TRUE(calculator->nav(jan10).is_ok());
    EXPECT_EQ(calculator->cached_snapshots(), 2u);

    buy(*equities, "PETR4", 100, 30.0);
    EXPECT_DOUBLE_EQ(calculator->nav(jan10).value().nav, 1000.0);

    calculator->invalidate_from(jan10);
    EXPECT_EQ(calculator->cached_snapshots(), 1u);
    EXPECT_DOUBLE_EQ(calculator->nav(jan10).value().nav, 4500.0);

    calculator->invalidate_all();
    EXPECT_EQ(calculator->cached_snapshots(), 0u);
}

TEST_F(NavCalculatorTest, AllocationsSumToNav) {
    registry->ensure_investor("INV003", "Carla");
    deposit("INV001", 100.0);
    deposit("INV002", 100.0);
    deposit("INV003", 100.0);
    buy(*equities, "PETR4", 100, 30.0);

    auto snapshot = calculator->nav(jan10);
    ASSERT_TRUE(snapshot.is_ok());
    ASSERT_DOUBLE_EQ(snapshot.value().nav, 3800.0);

    auto allocations = calculator->allocate_to_investors(snapshot.value());
    ASSERT_TRUE(allocations.is_ok());
    ASSERT_EQ(allocations.value().size(), 3u);
    double total = 0.0;
    for (const auto& allocation : allocations.value()) {
        total += allocation.investor_nav;
        EXPECT_NEAR(allocation.investor_nav, 3800.0 / 3.0, 0.02);
    }
    EXPECT_NEAR(total, snapshot.value().nav, 1e-9);
    EXPECT_NEAR(allocations.value()[1].unrealized_gain, 1266.67 - 100.0, 1e-9);
}

TEST_F(NavCalculatorTest, AllocationWithoutContributionsFails) {
    CashFlow withdrawal;
    withdrawal.investor_id = "INV001";
    withdrawal.date = jan1;
    withdrawal.type = CashFlowType::WITHDRAWAL;
    withdrawal.amount = Money(100.0, "BRL");
    ASSERT_TRUE(cash->add_cash_flow(withdrawal).is_ok());

    auto snapshot = calculator->nav(jan10);
    ASSERT_TRUE(snapshot.is_ok());
    auto allocations = calculator->allocate_to_investors(snapshot.value());
    ASSERT_TRUE(allocations.is_error());
    EXPECT_EQ(allocations.error()->code(), ErrorCode::PRECONDITION_FAILED);
}

TEST_F(NavCalculatorTest, SeriesHasOnePointPerDay) {
    deposit("INV001", 1000.0);
    auto series = calculator->nav_series(jan1, jan10);
    ASSERT_TRUE(series.is_ok());
    ASSERT_EQ(series.value().size(), 10u);
    EXPECT_EQ(series.value().front().first, jan1);
    EXPECT_DOUBLE_EQ(series.value().back().second, 1000.0);

    EXPECT_TRUE(calculator->nav_series(jan10, jan1).is_error());
}
