// src/data/fx_converter.cpp

#include "fund_ngin/data/fx_converter.hpp"
#include <algorithm>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

FxConverter::FxConverter(std::shared_ptr<TimeSeriesCache> cache, FxConfig config)
    : cache_(std::move(cache)), config_(std::move(config)) {}

std::string FxConverter::pair_symbol(const std::string& from, const std::string& to) {
    return from + to + "=X";
}

std::optional<FxRate> FxConverter::direct_rate(const std::string& from, const std::string& to,
                                               const Timestamp& as_of) const {
    FxRate fx;
    fx.from = from;
    fx.to = to;

    if (cache_) {
        auto quote = cache_->latest_price(pair_symbol(from, to), as_of);
        if (quote.is_ok() && quote.value().price > 0) {
            fx.rate = quote.value().price;
            fx.rate_date = quote.value().price_date;
            fx.stale = quote.value().stale;
            return fx;
        }
        auto inverse = cache_->latest_price(pair_symbol(to, from), as_of);
        if (inverse.is_ok() && inverse.value().price > 0) {
            fx.rate = 1.0 / inverse.value().price;
            fx.rate_date = inverse.value().price_date;
            fx.stale = inverse.value().stale;
            return fx;
        }
    }

    auto it = config_.default_rates.find(from + to);
    if (it != config_.default_rates.end() && it->second > 0) {
        fx.rate = it->second;
        fx.source = PriceSource::FALLBACK;
        fx.stale = true;
        return fx;
    }
    it = config_.default_rates.find(to + from);
    if (it != config_.default_rates.end() && it->second > 0) {
        fx.rate = 1.0 / it->second;
        fx.source = PriceSource::FALLBACK;
        fx.stale = true;
        return fx;
    }
    return std::nullopt;
}

Result<FxRate> FxConverter::rate(const std::string& from, const std::string& to,
                                 const Timestamp& as_of) const {
    if (from.empty() || to.empty()) {
        return make_error<FxRate>(ErrorCode::INVALID_ARGUMENT, "Currency code is empty",
                                  "FxConverter");
    }
    if (from == to) {
        FxRate identity;
        identity.from = from;
        identity.to = to;
        identity.rate_date = core::to_date(as_of);
        return identity;
    }

    if (auto direct = direct_rate(from, to, as_of)) {
        if (direct->source == PriceSource::FALLBACK) {
            DEBUG("Using default rate " << direct->rate << " for " << from << to);
        }
        return *direct;
    }

    const std::string& base = config_.base_currency;
    if (from != base && to != base) {
        auto leg1 = direct_rate(from, base, as_of);
        auto leg2 = direct_rate(base, to, as_of);
        if (leg1 && leg2) {
            FxRate cross;
            cross.from = from;
            cross.to = to;
            cross.rate = leg1->rate * leg2->rate;
            cross.stale = leg1->stale || leg2->stale;
            cross.source = (leg1->source == PriceSource::FALLBACK ||
                            leg2->source == PriceSource::FALLBACK)
                               ? PriceSource::FALLBACK
                               : PriceSource::CACHE;
            if (leg1->rate_date && leg2->rate_date) {
                cross.rate_date = std::min(*leg1->rate_date, *leg2->rate_date);
            }
            return cross;
        }
    }

    return make_error<FxRate>(ErrorCode::DATA_NOT_FOUND,
                              "No exchange rate available for " + from + "/" + to,
                              "FxConverter");
}

Result<Money> FxConverter::convert(const Money& amount, const std::string& to,
                                   const Timestamp& as_of) const {
    auto fx = rate(amount.currency, to, as_of);
    if (fx.is_error()) {
        return forward_error<Money>(fx);
    }
    return Money(amount.amount * fx.value().rate, to);
}

std::map<std::string, double> FxConverter::rates_to(const std::vector<std::string>& currencies,
                                                    const std::string& to,
                                                    const Timestamp& as_of) const {
    std::map<std::string, double> rates;
    for (const auto& ccy : currencies) {
        auto fx = rate(ccy, to, as_of);
        if (fx.is_ok()) {
            rates[ccy] = fx.value().rate;
        } else {
            WARN("Skipping rate " << ccy << "/" << to << ": " << fx.error()->what());
        }
    }
    return rates;
}

}  // namespace fund_ngin
