// src/portfolio/portfolio_context.cpp

#include "fund_ngin/portfolio/portfolio_context.hpp"
#include <set>
#include "fund_ngin/core/logger.hpp"

namespace fund_ngin {

PortfolioContext::PortfolioContext(PortfolioConfig config, std::shared_ptr<TimeSeriesCache> cache,
                                   std::shared_ptr<BondIndexationEngine> bond_engine)
    : config_(std::move(config)),
      cache_(std::move(cache)),
      investors_(std::make_shared<InvestorRegistry>()),
      bonds_(std::make_shared<std::vector<BondPosition>>()),
      bond_engine_(std::move(bond_engine)) {
    if (!bond_engine_) {
        bond_engine_ = std::make_shared<BondIndexationEngine>();
    }
    fx_ = std::make_shared<FxConverter>(cache_, config_.fx);
    cash_ = std::make_shared<CashLedger>(investors_);
    equities_ = std::make_shared<PositionLedger>(AssetClass::EQUITY, config_.ledger);
    crypto_ = std::make_shared<PositionLedger>(AssetClass::CRYPTO, config_.ledger);
    fees_ = std::make_shared<FeeEngine>(config_.fees);

    NavInputs inputs;
    inputs.equities = equities_;
    inputs.crypto = crypto_;
    inputs.bonds = bonds_;
    inputs.bond_engine = bond_engine_;
    inputs.cash = cash_;
    inputs.fees = fees_;
    inputs.cache = cache_;
    inputs.fx = fx_;
    inputs.base_currency = config_.base_currency;
    nav_ = std::make_shared<NavCalculator>(std::move(inputs));

    // Weak capture: the NAV calculator already holds the fee engine
    std::weak_ptr<NavCalculator> weak_nav = nav_;
    const std::string fee_currency = config_.fees.currency;
    std::weak_ptr<FxConverter> weak_fx = fx_;
    fees_->set_nav_provider([weak_nav, weak_fx, fee_currency](const Timestamp& date) -> Result<double> {
        auto nav = weak_nav.lock();
        if (!nav) {
            return make_error<double>(ErrorCode::NOT_INITIALIZED, "NAV calculator released",
                                      "PortfolioContext");
        }
        auto snapshot = nav->nav(date);
        if (snapshot.is_error()) {
            return forward_error<double>(snapshot);
        }
        if (snapshot.value().currency == fee_currency) {
            return snapshot.value().nav;
        }
        auto fx = weak_fx.lock();
        if (!fx) {
            return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                      "No FX converter for fee currency " + fee_currency,
                                      "PortfolioContext");
        }
        auto converted =
            fx->convert(Money(snapshot.value().nav, snapshot.value().currency), fee_currency, date);
        if (converted.is_error()) {
            return forward_error<double>(converted);
        }
        return converted.value().amount;
    });

    INFO("Portfolio context '" << config_.name << "' ready, base currency "
                               << config_.base_currency);
}

Result<std::shared_ptr<PositionLedger>> PortfolioContext::ledger_for(AssetClass asset_class) const {
    switch (asset_class) {
        case AssetClass::EQUITY:
            return equities_;
        case AssetClass::CRYPTO:
            return crypto_;
        default:
            return make_error<std::shared_ptr<PositionLedger>>(
                ErrorCode::INVALID_ARGUMENT,
                "No position ledger for asset class " + asset_class_to_string(asset_class),
                "PortfolioContext");
    }
}

std::vector<std::string> PortfolioContext::currencies() const {
    std::set<std::string> found;
    for (const auto* ledger : {equities_.get(), crypto_.get()}) {
        for (const auto& position : ledger->positions()) {
            if (!position.currency.empty()) {
                found.insert(position.currency);
            }
        }
    }
    for (const auto& bond : *bonds_) {
        found.insert(bond.currency);
    }
    for (const auto& flow : cash_->all_flows()) {
        found.insert(flow.amount.currency);
    }
    found.insert(config_.fees.currency);
    found.insert(config_.base_currency);
    return std::vector<std::string>(found.begin(), found.end());
}

std::vector<std::string> PortfolioContext::market_symbols() const {
    std::set<std::string> symbols;
    for (const auto* ledger : {equities_.get(), crypto_.get()}) {
        for (const auto& position : ledger->positions()) {
            symbols.insert(ledger->market_symbol(position));
        }
    }
    for (const auto& currency : currencies()) {
        if (currency != config_.base_currency) {
            symbols.insert(FxConverter::pair_symbol(currency, config_.base_currency));
        }
    }
    return std::vector<std::string>(symbols.begin(), symbols.end());
}

}  // namespace fund_ngin
