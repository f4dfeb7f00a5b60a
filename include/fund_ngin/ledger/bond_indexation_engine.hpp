// include/fund_ngin/ledger/bond_indexation_engine.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/data/indexer_gateway.hpp"

namespace fund_ngin {

/**
 * @brief Fixed-income holding
 *
 * percent_indexed is read per indexer: the fixed spread over IPCA, the share
 * of CDI/SELIC (110 means 110%), or the annual prefixed rate.
 */
struct BondPosition {
    std::string issue_id;
    std::string title;
    std::string issuer;
    std::string bond_type;
    Indexer indexer{Indexer::PREFIXADO};
    double percent_indexed{0.0};
    double quantity{0.0};
    double unit_price{0.0};
    double principal{0.0};
    Timestamp issue_date;
    std::optional<Timestamp> maturity_date;
    std::string currency{"BRL"};

    double invested() const { return principal != 0.0 ? principal : quantity * unit_price; }
};

/**
 * @brief Last number in a percentage string ("IPCA + 6%" -> 6, "5,50%" -> 5.5)
 * @return 0 when the text has no number
 */
double parse_percent(const std::string& text);

struct BondConfig : public ConfigBase {
    double ipca_fallback_annual{0.05};
    double cdi_fallback_annual{0.1375};
    double selic_fallback_annual{0.1175};
    double days_per_year{365.25};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["ipca_fallback_annual"] = ipca_fallback_annual;
        j["cdi_fallback_annual"] = cdi_fallback_annual;
        j["selic_fallback_annual"] = selic_fallback_annual;
        j["days_per_year"] = days_per_year;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("ipca_fallback_annual"))
            ipca_fallback_annual = j.at("ipca_fallback_annual").get<double>();
        if (j.contains("cdi_fallback_annual"))
            cdi_fallback_annual = j.at("cdi_fallback_annual").get<double>();
        if (j.contains("selic_fallback_annual"))
            selic_fallback_annual = j.at("selic_fallback_annual").get<double>();
        if (j.contains("days_per_year"))
            days_per_year = j.at("days_per_year").get<double>();
    }
};

struct BondValuation {
    BondPosition bond;
    Timestamp valuation_date;
    Money accrued_value;
    Money invested;
    double pnl{0.0};
    double pnl_pct{0.0};
    bool approximated{false};
    int approximated_months{0};
    bool matured{false};
    std::optional<int> days_to_maturity;

    nlohmann::json to_json() const;
};

struct BondPortfolioSummary {
    double total_invested{0.0};
    double total_current_value{0.0};
    double total_pnl{0.0};
    double total_return_pct{0.0};
    size_t num_bonds{0};
    size_t num_active_bonds{0};
    size_t maturing_30_days{0};
    size_t maturing_90_days{0};
    size_t approximated_bonds{0};

    nlohmann::json to_json() const;
};

struct AllocationEntry {
    std::string key;
    double value{0.0};
    double pnl{0.0};
    double allocation_pct{0.0};
};

struct MaturityBucket {
    int year{0};
    int month{0};
    double value_due{0.0};
    size_t count{0};
};

/**
 * @brief Values bonds under IPCA, CDI, SELIC and prefixed indexation
 *
 * Indexer series are loaded once and held in memory; valuations never touch
 * the network. Months without published data use the configured annual
 * fallback and mark the valuation as approximated.
 */
class BondIndexationEngine {
public:
    explicit BondIndexationEngine(std::shared_ptr<IndexerGateway> gateway = nullptr,
                                  BondConfig config = BondConfig{});

    /**
     * @brief Load IPCA, CDI and SELIC series covering [start, end]
     * @return Errors of the indexers that could not be loaded, joined
     */
    Result<void> refresh_series(const Timestamp& start, const Timestamp& end);

    void set_series(IndexerSeries series);

    const IndexerSeries* series(Indexer indexer) const;

    Result<BondValuation> value(const BondPosition& bond, const Timestamp& as_of) const;

    /**
     * @brief Valuations of every non-zero holding, largest first
     */
    std::vector<BondValuation> value_all(const std::vector<BondPosition>& bonds,
                                         const Timestamp& as_of) const;

    BondPortfolioSummary summary(const std::vector<BondPosition>& bonds,
                                 const Timestamp& as_of) const;

    std::vector<AllocationEntry> allocation_by_indexer(const std::vector<BondPosition>& bonds,
                                                       const Timestamp& as_of) const;

    std::vector<AllocationEntry> allocation_by_type(const std::vector<BondPosition>& bonds,
                                                    const Timestamp& as_of) const;

    /**
     * @brief Active bonds grouped by maturity year-month, ascending
     */
    std::vector<MaturityBucket> maturity_schedule(const std::vector<BondPosition>& bonds,
                                                  const Timestamp& as_of) const;

    const BondConfig& config() const { return config_; }

private:
    struct Accrual {
        double factor{1.0};
        int approximated_months{0};
    };

    /**
     * @brief Compound monthly rates from the month after issue through the end month
     * @param share Fraction of the index earned (1.0 for IPCA)
     */
    Accrual compound_months(Indexer indexer, const Timestamp& issue, const Timestamp& end,
                            double share, double fallback_annual) const;

    std::shared_ptr<IndexerGateway> gateway_;
    BondConfig config_;
    std::map<Indexer, IndexerSeries> series_;
};

}  // namespace fund_ngin
