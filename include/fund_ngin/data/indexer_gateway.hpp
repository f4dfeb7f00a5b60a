// include/fund_ngin/data/indexer_gateway.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include "fund_ngin/core/config_base.hpp"
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"

namespace fund_ngin {

/**
 * @brief Brazilian fixed-income indexers
 */
enum class Indexer {
    IPCA,
    CDI,
    SELIC,
    PREFIXADO,
    UNKNOWN
};

std::string indexer_to_string(Indexer indexer);

/**
 * @brief Map a free-text indexer name (IPCA, NTN-B, CDI, LFT, Prefixado, LTN...)
 */
Indexer indexer_from_string(const std::string& name);

/**
 * @brief Monthly rate series for one indexer
 * Values are percentages for the month (0.45 means 0.45%)
 */
struct IndexerSeries {
    Indexer indexer{Indexer::UNKNOWN};
    std::map<std::pair<int, int>, double> monthly_pct;  // (year, month) -> %

    std::optional<double> rate_for(int year, int month) const {
        auto it = monthly_pct.find({year, month});
        if (it == monthly_pct.end()) return std::nullopt;
        return it->second;
    }

    bool empty() const { return monthly_pct.empty(); }
};

/**
 * @brief Source of monthly indexer rates
 */
class IndexerGateway {
public:
    virtual ~IndexerGateway() = default;

    virtual Result<IndexerSeries> fetch_series(Indexer indexer, const Timestamp& start,
                                               const Timestamp& end) = 0;
};

struct BcbConfig : public ConfigBase {
    std::string base_url{"https://api.bcb.gov.br/dados/serie/bcdata.sgs"};
    int ipca_series{433};   // monthly %
    int selic_series{11};   // daily %
    int cdi_series{12};     // daily %
    long timeout_seconds{30};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["base_url"] = base_url;
        j["ipca_series"] = ipca_series;
        j["selic_series"] = selic_series;
        j["cdi_series"] = cdi_series;
        j["timeout_seconds"] = timeout_seconds;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("base_url"))
            base_url = j.at("base_url").get<std::string>();
        if (j.contains("ipca_series"))
            ipca_series = j.at("ipca_series").get<int>();
        if (j.contains("selic_series"))
            selic_series = j.at("selic_series").get<int>();
        if (j.contains("cdi_series"))
            cdi_series = j.at("cdi_series").get<int>();
        if (j.contains("timeout_seconds"))
            timeout_seconds = j.at("timeout_seconds").get<long>();
    }
};

/**
 * @brief Banco Central do Brasil SGS client
 *
 * Daily series (CDI, SELIC) are compounded into monthly percentages.
 */
class BcbIndexerGateway : public IndexerGateway {
public:
    explicit BcbIndexerGateway(BcbConfig config = BcbConfig{});

    Result<IndexerSeries> fetch_series(Indexer indexer, const Timestamp& start,
                                       const Timestamp& end) override;

    /**
     * @brief Parse an SGS response: [{"data":"DD/MM/YYYY","valor":"0.45"}, ...]
     * @param daily true when values are daily rates to compound per month
     */
    static Result<IndexerSeries> parse_sgs_response(Indexer indexer, const std::string& body,
                                                    bool daily);

private:
    BcbConfig config_;
};

}  // namespace fund_ngin
