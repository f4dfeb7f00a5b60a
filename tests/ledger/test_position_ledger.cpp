#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../data/mock_market_data.hpp"
#include "fund_ngin/core/time_utils.hpp"
#include "fund_ngin/ledger/position_ledger.hpp"

using namespace fund_ngin;
using namespace fund_ngin::testing;

namespace {

Transaction trade(const std::string& symbol, const Timestamp& date, double qty, double price,
                  const std::string& market = "Nacional") {
    Transaction txn;
    txn.asset_class = AssetClass::EQUITY;
    txn.symbol = symbol;
    txn.date = date;
    txn.signed_quantity = qty;
    txn.price = price;
    txn.market = market;
    return txn;
}

}  // namespace

class PositionLedgerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        jan2 = core::make_date(2024, 1, 2);
        jan10 = core::make_date(2024, 1, 10);
        feb1 = core::make_date(2024, 2, 1);
    }

    PositionLedger ledger{AssetClass::EQUITY};
    Timestamp jan2;
    Timestamp jan10;
    Timestamp feb1;
};

TEST_F(PositionLedgerTest, PartialSellRealizesAgainstAverageCost) {
    ASSERT_TRUE(ledger.apply(trade("MGLU3", jan2, 1500, 14.15)).is_ok());
    ASSERT_TRUE(ledger.apply(trade("MGLU3", jan10, -100, 15.60)).is_ok());

    auto position = ledger.position("MGLU3");
    ASSERT_TRUE(position.has_value());
    EXPECT_DOUBLE_EQ(position->quantity, 1400.0);
    EXPECT_DOUBLE_EQ(position->avg_cost, 14.15);
    EXPECT_NEAR(position->realized_pnl, 145.0, 1e-9);
    EXPECT_DOUBLE_EQ(position->last_trade_price, 15.60);
    EXPECT_EQ(position->currency, "BRL");
}

TEST_F(PositionLedgerTest, BuysAverageTheirCost) {
    ASSERT_TRUE(ledger.apply(trade("AAPL", jan2, 10, 100.0, "Internacional")).is_ok());
    ASSERT_TRUE(ledger.apply(trade("AAPL", jan10, 30, 120.0, "Internacional")).is_ok());

    auto position = ledger.position("AAPL");
    EXPECT_DOUBLE_EQ(position->quantity, 40.0);
    EXPECT_DOUBLE_EQ(position->avg_cost, 115.0);
    EXPECT_EQ(position->currency, "USD");
}

TEST_F(PositionLedgerTest, FullSellClosesPosition) {
    ASSERT_TRUE(ledger.apply(trade("VALE3", jan2, 100, 60.0)).is_ok());
    ASSERT_TRUE(ledger.apply(trade("VALE3", jan10, -100, 66.0)).is_ok());

    auto position = ledger.position("VALE3");
    EXPECT_FALSE(position->has_position());
    EXPECT_DOUBLE_EQ(position->realized_pnl, 600.0);
    EXPECT_TRUE(ledger.open_positions().empty());
    EXPECT_EQ(ledger.positions().size(), 1u);
}

TEST_F(PositionLedgerTest, OversellIsRejectedAndLeavesLedgerUnchanged) {
    ASSERT_TRUE(ledger.apply(trade("ITUB4", jan2, 50, 30.0)).is_ok());

    auto result = ledger.apply(trade("ITUB4", jan10, -80, 31.0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_POSITION);
    EXPECT_DOUBLE_EQ(ledger.position("ITUB4")->quantity, 50.0);
    EXPECT_EQ(ledger.transaction_count(), 1u);
}

TEST_F(PositionLedgerTest, AllowShortOpensShortAtSellPrice) {
    LedgerConfig config;
    config.oversell_policy = OversellPolicy::ALLOW_SHORT;
    PositionLedger shorting(AssetClass::EQUITY, config);

    ASSERT_TRUE(shorting.apply(trade("BBAS3", jan2, 50, 30.0)).is_ok());
    ASSERT_TRUE(shorting.apply(trade("BBAS3", jan10, -80, 32.0)).is_ok());

    auto position = shorting.position("BBAS3");
    EXPECT_DOUBLE_EQ(position->quantity, -30.0);
    EXPECT_DOUBLE_EQ(position->avg_cost, 32.0);
    EXPECT_DOUBLE_EQ(position->realized_pnl, 100.0);

    ASSERT_TRUE(shorting.apply(trade("BBAS3", feb1, 30, 30.0)).is_ok());
    EXPECT_FALSE(shorting.position("BBAS3")->has_position());
    EXPECT_DOUBLE_EQ(shorting.position("BBAS3")->realized_pnl, 160.0);
}

TEST_F(PositionLedgerTest, InvalidTransactionsAreRejected) {
    auto zero = ledger.apply(trade("PETR4", jan2, 0, 30.0));
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error()->code(), ErrorCode::INVALID_TRANSACTION);

    auto free = ledger.apply(trade("PETR4", jan2, 10, 0.0));
    ASSERT_TRUE(free.is_error());
    EXPECT_EQ(free.error()->code(), ErrorCode::INVALID_TRANSACTION);

    Transaction crypto = trade("BTC", jan2, 1, 40000.0);
    crypto.asset_class = AssetClass::CRYPTO;
    auto wrong_book = ledger.apply(crypto);
    ASSERT_TRUE(wrong_book.is_error());
    EXPECT_EQ(wrong_book.error()->code(), ErrorCode::INVALID_TRANSACTION);

    EXPECT_EQ(ledger.transaction_count(), 0u);
}

TEST_F(PositionLedgerTest, ReplayIsIndependentOfInputOrderAcrossDates) {
    std::vector<Transaction> chronological = {trade("WEGE3", jan2, 100, 40.0),
                                              trade("WEGE3", jan10, 50, 46.0),
                                              trade("WEGE3", feb1, -60, 50.0)};
    std::vector<Transaction> shuffled = {chronological[2], chronological[0], chronological[1]};

    auto a = PositionLedger::replay(chronological);
    auto b = PositionLedger::replay(shuffled);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_DOUBLE_EQ(a.value().quantity, b.value().quantity);
    EXPECT_DOUBLE_EQ(a.value().avg_cost, b.value().avg_cost);
    EXPECT_DOUBLE_EQ(a.value().realized_pnl, b.value().realized_pnl);
    EXPECT_DOUBLE_EQ(a.value().avg_cost, 42.0);
}

TEST_F(PositionLedgerTest, BackDatedTransactionRebuildsHistory) {
    ASSERT_TRUE(ledger.apply(trade("PETR4", jan2, 100, 30.0)).is_ok());
    ASSERT_TRUE(ledger.apply(trade("PETR4", feb1, -50, 36.0)).is_ok());
    EXPECT_DOUBLE_EQ(ledger.position("PETR4")->realized_pnl, 300.0);

    ASSERT_TRUE(ledger.apply(trade("PETR4", jan10, 100, 34.0)).is_ok());

    auto position = ledger.position("PETR4");
    EXPECT_DOUBLE_EQ(position->quantity, 150.0);
    EXPECT_DOUBLE_EQ(position->avg_cost, 32.0);
    EXPECT_DOUBLE_EQ(position->realized_pnl, 200.0);

    auto txns = ledger.transactions("PETR4");
    ASSERT_EQ(txns.size(), 3u);
    EXPECT_EQ(txns[1].date, jan10);
}

TEST_F(PositionLedgerTest, BackDatedSellThatBreaksHistoryIsRejected) {
    ASSERT_TRUE(ledger.apply(trade("PETR4", jan2, 100, 30.0)).is_ok());
    ASSERT_TRUE(ledger.apply(trade("PETR4", feb1, -100, 36.0)).is_ok());

    auto result = ledger.apply(trade("PETR4", jan10, -50, 33.0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_POSITION);
    EXPECT_EQ(ledger.transactions("PETR4").size(), 2u);
}

TEST_F(PositionLedgerTest, PositionAsOfReadsCheckpoints) {
    ASSERT_TRUE(ledger.apply(trade("PETR4", jan2, 100, 30.0)).is_ok());
    ASSERT_TRUE(ledger.apply(trade("PETR4", feb1, 100, 34.0)).is_ok());

    EXPECT_FALSE(ledger.position_as_of("PETR4", core::make_date(2024, 1, 1)).has_value());
    EXPECT_DOUBLE_EQ(ledger.position_as_of("PETR4", jan10)->quantity, 100.0);
    EXPECT_DOUBLE_EQ(ledger.position_as_of("PETR4", feb1)->quantity, 200.0);
    EXPECT_FALSE(ledger.position_as_of("UNKNOWN", feb1).has_value());
    EXPECT_EQ(*ledger.last_event_date(), feb1);
}

TEST_F(PositionLedgerTest, MarketSymbolFollowsQuoteConventions) {
    Position domestic;
    domestic.symbol = "PETR4";
    domestic.market = "Nacional";
    EXPECT_EQ(ledger.market_symbol(domestic), "PETR4.SA");

    Position foreign;
    foreign.symbol = "AAPL";
    foreign.market = "Internacional";
    EXPECT_EQ(ledger.market_symbol(foreign), "AAPL");

    PositionLedger crypto(AssetClass::CRYPTO);
    Position btc;
    btc.symbol = "BTC";
    EXPECT_EQ(crypto.market_symbol(btc), "BTC-USD");
    btc.symbol = "ETH-USD";
    EXPECT_EQ(crypto.market_symbol(btc), "ETH-USD");
}

TEST_F(PositionLedgerTest, ValuationUsesCachedCloseOrLastTrade) {
    auto store = std::make_shared<InMemoryPriceStore>();
    TimeSeriesCache cache(std::make_shared<SyntheticGateway>(), store, fast_cache_config(),
                          std::make_shared<InstantSleeper>());
    store->put_close("PETR4.SA", jan10, 35.0);

    ASSERT_TRUE(ledger.apply(trade("PETR4", jan2, 100, 30.0)).is_ok());
    ASSERT_TRUE(ledger.apply(trade("VALE3", jan2, 10, 60.0)).is_ok());

    auto petr = ledger.value("PETR4", jan10, cache);
    ASSERT_TRUE(petr.is_ok());
    EXPECT_DOUBLE_EQ(petr.value().market_value.amount, 3500.0);
    EXPECT_DOUBLE_EQ(petr.value().unrealized_pnl, 500.0);
    EXPECT_NEAR(petr.value().unrealized_pnl_pct, 16.6667, 1e-3);
    EXPECT_FALSE(petr.value().stale());

    auto vale = ledger.value("VALE3", jan10, cache);
    ASSERT_TRUE(vale.is_ok());
    EXPECT_DOUBLE_EQ(vale.value().quote.price, 60.0);
    EXPECT_EQ(vale.value().quote.source, PriceSource::FALLBACK);
    EXPECT_TRUE(vale.value().stale());

    auto all = ledger.value_open_positions(jan10, cache);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].position.symbol, "PETR4");
}

TEST_F(PositionLedgerTest, CopiesAreIndependent) {
    ASSERT_TRUE(ledger.apply(trade("PETR4", jan2, 100, 30.0)).is_ok());
    PositionLedger staged = ledger;
    ASSERT_TRUE(staged.apply(trade("PETR4", jan10, 100, 32.0)).is_ok());

    EXPECT_DOUBLE_EQ(ledger.position("PETR4")->quantity, 100.0);
    EXPECT_DOUBLE_EQ(staged.position("PETR4")->quantity, 200.0);
}
