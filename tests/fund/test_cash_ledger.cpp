#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../data/mock_market_data.hpp"
#include "fund_ngin/core/time_utils.hpp"
#include "fund_ngin/fund/cash_ledger.hpp"

using namespace fund_ngin;
using namespace fund_ngin::testing;

namespace {

CashFlow flow(const std::string& investor, const Timestamp& date, CashFlowType type,
              double amount, const std::string& currency = "BRL") {
    CashFlow f;
    f.investor_id = investor;
    f.date = date;
    f.type = type;
    f.amount = Money(amount, currency);
    return f;
}

}  // namespace

class InvestorRegistryTest : public TestBase {
protected:
    InvestorRegistry registry;
};

TEST_F(InvestorRegistryTest, RejectsDuplicateAndEmptyIds) {
    ASSERT_TRUE(registry.register_investor({"INV001", "Ana", InvestorStatus::ACTIVE}).is_ok());

    auto duplicate = registry.register_investor({"INV001", "Other", InvestorStatus::ACTIVE});
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto empty = registry.register_investor({"", "Nobody", InvestorStatus::ACTIVE});
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(InvestorRegistryTest, EnsureInvestorCreatesOnce) {
    EXPECT_TRUE(registry.ensure_investor("INV002", ""));
    EXPECT_FALSE(registry.ensure_investor("INV002", "Bruno"));
    EXPECT_EQ(registry.get("INV002").value().name, "INV002");
}

TEST_F(InvestorRegistryTest, StatusChangesAndUnknownIds) {
    registry.ensure_investor("INV003", "Carla");
    ASSERT_TRUE(registry.set_status("INV003", InvestorStatus::INACTIVE).is_ok());
    EXPECT_TRUE(registry.active().empty());
    EXPECT_EQ(registry.all().size(), 1u);

    auto unknown = registry.set_status("NOPE", InvestorStatus::ACTIVE);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::UNKNOWN_INVESTOR);
}

class CashLedgerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        registry = std::make_shared<InvestorRegistry>();
        registry->ensure_investor("INV001", "Ana");
        registry->ensure_investor("INV002", "Bruno");
        ledger = std::make_unique<CashLedger>(registry);

        store = std::make_shared<InMemoryPriceStore>();
        auto cache = std::make_shared<TimeSeriesCache>(std::make_shared<SyntheticGateway>(),
                                                       store, fast_cache_config(),
                                                       std::make_shared<InstantSleeper>());
        FxConfig fx_config;
        fx_config.default_rates.clear();
        fx = std::make_unique<FxConverter>(cache, fx_config);
    }

    std::shared_ptr<InvestorRegistry> registry;
    std::unique_ptr<CashLedger> ledger;
    std::shared_ptr<InMemoryPriceStore> store;
    std::unique_ptr<FxConverter> fx;
    Timestamp jan1 = core::make_date(2024, 1, 1);
    Timestamp feb1 = core::make_date(2024, 2, 1);
    Timestamp mar1 = core::make_date(2024, 3, 1);
};

TEST_F(CashLedgerTest, RejectsInvalidFlows) {
    auto zero = ledger->add_cash_flow(flow("INV001", jan1, CashFlowType::DEPOSIT, 0.0));
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto unknown = ledger->add_cash_flow(flow("GHOST", jan1, CashFlowType::DEPOSIT, 100.0));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::UNKNOWN_INVESTOR);

    ASSERT_TRUE(registry->set_status("INV002", InvestorStatus::INACTIVE).is_ok());
    auto inactive = ledger->add_cash_flow(flow("INV002", jan1, CashFlowType::DEPOSIT, 100.0));
    ASSERT_TRUE(inactive.is_error());
    EXPECT_EQ(inactive.error()->code(), ErrorCode::INACTIVE_INVESTOR);

    // Inactive investors can still take money out
    EXPECT_TRUE(
        ledger->add_cash_flow(flow("INV002", jan1, CashFlowType::WITHDRAWAL, 10.0)).is_ok());
    EXPECT_EQ(ledger->size(), 1u);
}

TEST_F(CashLedgerTest, CashPositionCountsFlowsUpToDate) {
    ASSERT_TRUE(ledger->add_cash_flow(flow("INV001", jan1, CashFlowType::DEPOSIT, 1000.0)).is_ok());
    ASSERT_TRUE(ledger->add_cash_flow(flow("INV002", feb1, CashFlowType::DEPOSIT, 500.0)).is_ok());
    ASSERT_TRUE(
        ledger->add_cash_flow(flow("INV001", mar1, CashFlowType::WITHDRAWAL, 200.0)).is_ok());

    EXPECT_DOUBLE_EQ(ledger->cash_position(jan1, "BRL", nullptr).value().amount, 1000.0);
    EXPECT_DOUBLE_EQ(ledger->cash_position(feb1, "BRL", nullptr).value().amount, 1500.0);
    EXPECT_DOUBLE_EQ(ledger->cash_position(mar1, "BRL", nullptr).value().amount, 1300.0);
}

TEST_F(CashLedgerTest, StakesSplitNetContribution) {
    ASSERT_TRUE(ledger->add_cash_flow(flow("INV001", jan1, CashFlowType::DEPOSIT, 600.0)).is_ok());
    ASSERT_TRUE(ledger->add_cash_flow(flow("INV002", jan1, CashFlowType::DEPOSIT, 400.0)).is_ok());

    auto stakes = ledger->stakes(feb1, "BRL", nullptr);
    ASSERT_TRUE(stakes.is_ok());
    ASSERT_EQ(stakes.value().size(), 2u);
    EXPECT_DOUBLE_EQ(stakes.value()[0].stake_pct, 60.0);
    EXPECT_DOUBLE_EQ(stakes.value()[1].stake_pct, 40.0);
    EXPECT_EQ(stakes.value()[0].name, "Ana");

    EXPECT_DOUBLE_EQ(ledger->stake_pct("INV002", feb1, "BRL", nullptr).value(), 40.0);
    EXPECT_EQ(ledger->stake_pct("GHOST", feb1, "BRL", nullptr).error()->code(),
              ErrorCode::UNKNOWN_INVESTOR);
}

TEST_F(CashLedgerTest, ForeignFlowsConvertAtTheirOwnDateForContributions) {
    store->put_close("USDBRL=X", jan1, 5.0);
    store->put_close("USDBRL=X", mar1, 5.5);
    ASSERT_TRUE(
        ledger->add_cash_flow(flow("INV001", jan1, CashFlowType::DEPOSIT, 100.0, "USD")).is_ok());

    auto contribution = ledger->net_contribution("INV001", mar1, "BRL", fx.get());
    ASSERT_TRUE(contribution.is_ok());
    EXPECT_DOUBLE_EQ(contribution.value().amount, 500.0);

    auto cash = ledger->cash_position(mar1, "BRL", fx.get());
    ASSERT_TRUE(cash.is_ok());
    EXPECT_DOUBLE_EQ(cash.value().amount, 550.0);

    auto without_fx = ledger->cash_position(mar1, "BRL", nullptr);
    ASSERT_TRUE(without_fx.is_error());
    EXPECT_EQ(without_fx.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(CashLedgerTest, HistoryIsCumulativePerDay) {
    ASSERT_TRUE(ledger->add_cash_flow(flow("INV001", jan1, CashFlowType::DEPOSIT, 100.0)).is_ok());
    ASSERT_TRUE(ledger->add_cash_flow(
                          flow("INV002", core::add_days(jan1, 2), CashFlowType::DEPOSIT, 50.0))
                    .is_ok());

    auto history = ledger->cash_history(jan1, core::add_days(jan1, 3), "BRL", nullptr);
    ASSERT_TRUE(history.is_ok());
    ASSERT_EQ(history.value().size(), 4u);
    EXPECT_DOUBLE_EQ(history.value()[1].cash_position, 100.0);
    EXPECT_DOUBLE_EQ(history.value()[2].cash_position, 150.0);

    auto mine = ledger->investor_history("INV002", jan1, core::add_days(jan1, 3), "BRL", nullptr);
    ASSERT_TRUE(mine.is_ok());
    EXPECT_DOUBLE_EQ(mine.value()[1].deposits, 0.0);
    EXPECT_DOUBLE_EQ(mine.value()[3].deposits, 50.0);
}

TEST_F(CashLedgerTest, FlowsAreKeptInDateOrder) {
    ASSERT_TRUE(ledger->add_cash_flow(flow("INV001", mar1, CashFlowType::DEPOSIT, 3.0)).is_ok());
    ASSERT_TRUE(ledger->add_cash_flow(flow("INV001", jan1, CashFlowType::DEPOSIT, 1.0)).is_ok());
    ASSERT_TRUE(ledger->add_cash_flow(flow("INV002", feb1, CashFlowType::DEPOSIT, 2.0)).is_ok());

    auto all = ledger->flows(jan1, mar1);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_DOUBLE_EQ(all[0].amount.amount, 1.0);
    EXPECT_DOUBLE_EQ(all[2].amount.amount, 3.0);
    EXPECT_EQ(*ledger->first_flow_date(), jan1);
    EXPECT_EQ(ledger->flows_for("INV002").size(), 1u);
}

TEST(CashFlowTypeTest, ParsesAnyCase) {
    EXPECT_EQ(cash_flow_type_from_string(" Deposit ").value(), CashFlowType::DEPOSIT);
    EXPECT_EQ(cash_flow_type_from_string("WITHDRAWAL").value(), CashFlowType::WITHDRAWAL);
    EXPECT_EQ(cash_flow_type_from_string("refund").error()->code(), ErrorCode::PARSE_ERROR);
}
