// include/fund_ngin/portfolio/portfolio_context.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/fx_converter.hpp"
#include "fund_ngin/data/time_series_cache.hpp"
#include "fund_ngin/fund/cash_ledger.hpp"
#include "fund_ngin/fund/fee_engine.hpp"
#include "fund_ngin/fund/investor_registry.hpp"
#include "fund_ngin/fund/nav_calculator.hpp"
#include "fund_ngin/ledger/bond_indexation_engine.hpp"
#include "fund_ngin/ledger/position_ledger.hpp"

namespace fund_ngin {

/**
 * @brief Settings of one portfolio's books
 */
struct PortfolioConfig : public ConfigBase {
    std::string name{"default"};
    std::string base_currency{"BRL"};
    LedgerConfig ledger;
    FeeConfig fees;
    FxConfig fx;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["base_currency"] = base_currency;
        j["ledger"] = ledger.to_json();
        j["fees"] = fees.to_json();
        j["fx"] = fx.to_json();
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j.at("name").get<std::string>();
        if (j.contains("base_currency"))
            base_currency = j.at("base_currency").get<std::string>();
        if (j.contains("ledger"))
            ledger.from_json(j.at("ledger"));
        if (j.contains("fees"))
            fees.from_json(j.at("fees"));
        if (j.contains("fx"))
            fx.from_json(j.at("fx"));
    }
};

/**
 * @brief All books of one portfolio, wired together
 *
 * Owns the investor registry, the cash ledger, one position ledger per
 * traded asset class, the bond book, the fee engine and the NAV calculator.
 * The price cache and the bond engine may be shared between portfolios.
 * The fee engine reads period NAVs from this context's NAV calculator.
 */
class PortfolioContext {
public:
    PortfolioContext(PortfolioConfig config, std::shared_ptr<TimeSeriesCache> cache,
                     std::shared_ptr<BondIndexationEngine> bond_engine = nullptr);

    PortfolioContext(const PortfolioContext&) = delete;
    PortfolioContext& operator=(const PortfolioContext&) = delete;

    const std::string& name() const { return config_.name; }
    const std::string& base_currency() const { return config_.base_currency; }
    const PortfolioConfig& config() const { return config_; }

    std::shared_ptr<InvestorRegistry> investors() const { return investors_; }
    std::shared_ptr<CashLedger> cash() const { return cash_; }
    std::shared_ptr<PositionLedger> equities() const { return equities_; }
    std::shared_ptr<PositionLedger> crypto() const { return crypto_; }
    std::shared_ptr<std::vector<BondPosition>> bonds() const { return bonds_; }
    std::shared_ptr<BondIndexationEngine> bond_engine() const { return bond_engine_; }
    std::shared_ptr<FeeEngine> fees() const { return fees_; }
    std::shared_ptr<NavCalculator> nav_calculator() const { return nav_; }
    std::shared_ptr<TimeSeriesCache> cache() const { return cache_; }
    std::shared_ptr<FxConverter> fx() const { return fx_; }

    /**
     * @brief Ledger holding an asset class
     * @return INVALID_ARGUMENT for classes without a position ledger
     */
    Result<std::shared_ptr<PositionLedger>> ledger_for(AssetClass asset_class) const;

    /**
     * @brief Currencies that appear in positions, bonds, cash flows and fees
     */
    std::vector<std::string> currencies() const;

    /**
     * @brief Cache symbols needed to value the books, FX pairs to the base included
     */
    std::vector<std::string> market_symbols() const;

private:
    PortfolioConfig config_;
    std::shared_ptr<TimeSeriesCache> cache_;
    std::shared_ptr<FxConverter> fx_;
    std::shared_ptr<InvestorRegistry> investors_;
    std::shared_ptr<CashLedger> cash_;
    std::shared_ptr<PositionLedger> equities_;
    std::shared_ptr<PositionLedger> crypto_;
    std::shared_ptr<std::vector<BondPosition>> bonds_;
    std::shared_ptr<BondIndexationEngine> bond_engine_;
    std::shared_ptr<FeeEngine> fees_;
    std::shared_ptr<NavCalculator> nav_;
};

}  // namespace fund_ngin
