// src/data/bcb_indexer_gateway.cpp

#include <algorithm>
#include <cctype>
#include <cstdio>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"
#include "fund_ngin/data/http_client.hpp"
#include "fund_ngin/data/indexer_gateway.hpp"

namespace fund_ngin {

std::string indexer_to_string(Indexer indexer) {
    switch (indexer) {
        case Indexer::IPCA:
            return "IPCA";
        case Indexer::CDI:
            return "CDI";
        case Indexer::SELIC:
            return "SELIC";
        case Indexer::PREFIXADO:
            return "PREFIXADO";
        default:
            return "UNKNOWN";
    }
}

Indexer indexer_from_string(const std::string& name) {
    std::string upper;
    for (char c : name) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (upper.empty() || upper == "PREFIXADO" || upper == "PRE" || upper == "LTN")
        return Indexer::PREFIXADO;
    if (upper == "IPCA" || upper == "NTN-B" || upper == "IPCA+") return Indexer::IPCA;
    if (upper == "CDI" || upper == "DI") return Indexer::CDI;
    if (upper == "SELIC" || upper == "LFT") return Indexer::SELIC;

    // Free text such as "IPCA + 6,50%" or "110% do CDI"
    if (upper.find("IPCA") != std::string::npos || upper.find("NTN-B") != std::string::npos)
        return Indexer::IPCA;
    if (upper.find("CDI") != std::string::npos) return Indexer::CDI;
    if (upper.find("SELIC") != std::string::npos || upper.find("LFT") != std::string::npos)
        return Indexer::SELIC;
    if (upper.rfind("PRE", 0) == 0 || upper.find("LTN") != std::string::npos)
        return Indexer::PREFIXADO;
    bool rate_only = std::all_of(upper.begin(), upper.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == ',' || c == '%' ||
               c == '+';
    });
    return rate_only ? Indexer::PREFIXADO : Indexer::UNKNOWN;
}

namespace {

std::string to_bcb_date(const Timestamp& date) {
    auto time_val = std::chrono::system_clock::to_time_t(date);
    std::tm time_info;
    core::safe_gmtime(&time_val, &time_info);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%d/%m/%Y", &time_info);
    return std::string(buffer);
}

}  // namespace

BcbIndexerGateway::BcbIndexerGateway(BcbConfig config) : config_(std::move(config)) {}

Result<IndexerSeries> BcbIndexerGateway::fetch_series(Indexer indexer, const Timestamp& start,
                                                      const Timestamp& end) {
    int code = 0;
    bool daily = false;
    switch (indexer) {
        case Indexer::IPCA:
            code = config_.ipca_series;
            break;
        case Indexer::CDI:
            code = config_.cdi_series;
            daily = true;
            break;
        case Indexer::SELIC:
            code = config_.selic_series;
            daily = true;
            break;
        default:
            return make_error<IndexerSeries>(ErrorCode::INVALID_ARGUMENT,
                                             "No SGS series for indexer " +
                                                 indexer_to_string(indexer),
                                             "BcbIndexerGateway");
    }

    std::string url = config_.base_url + "." + std::to_string(code) +
                      "/dados?formato=json&dataInicial=" + to_bcb_date(start) +
                      "&dataFinal=" + to_bcb_date(end);

    HttpOptions options;
    options.timeout_seconds = config_.timeout_seconds;
    options.headers.push_back("Accept: application/json");

    auto response = http_get(url, options);
    if (response.is_error()) {
        return forward_error<IndexerSeries>(response);
    }
    if (response.value().status != 200) {
        return make_error<IndexerSeries>(
            ErrorCode::API_ERROR,
            "BCB returned HTTP " + std::to_string(response.value().status) + " for " +
                indexer_to_string(indexer),
            "BcbIndexerGateway");
    }

    auto series = parse_sgs_response(indexer, response.value().body, daily);
    if (series.is_ok()) {
        INFO("Loaded " << series.value().monthly_pct.size() << " months of "
                       << indexer_to_string(indexer));
    }
    return series;
}

Result<IndexerSeries> BcbIndexerGateway::parse_sgs_response(Indexer indexer,
                                                            const std::string& body, bool daily) {
    IndexerSeries series;
    series.indexer = indexer;

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return make_error<IndexerSeries>(ErrorCode::JSON_PARSE_ERROR,
                                         std::string("Malformed SGS response: ") + e.what(),
                                         "BcbIndexerGateway");
    }
    if (!data.is_array()) {
        return make_error<IndexerSeries>(ErrorCode::JSON_PARSE_ERROR,
                                         "SGS response is not an array", "BcbIndexerGateway");
    }

    // Daily rates compound into a monthly factor
    std::map<std::pair<int, int>, double> factors;
    for (const auto& row : data) {
        if (!row.contains("data") || !row.contains("valor")) continue;
        int day = 0, month = 0, year = 0;
        const std::string date_text = row["data"].get<std::string>();
        if (std::sscanf(date_text.c_str(), "%2d/%2d/%4d", &day, &month, &year) != 3) {
            WARN("Skipping SGS row with bad date '" << date_text << "'");
            continue;
        }
        double value = 0.0;
        try {
            value = row["valor"].is_string() ? std::stod(row["valor"].get<std::string>())
                                             : row["valor"].get<double>();
        } catch (const std::exception&) {
            WARN("Skipping SGS row with bad value on " << date_text);
            continue;
        }

        auto key = std::make_pair(year, month);
        if (daily) {
            auto it = factors.emplace(key, 1.0).first;
            it->second *= 1.0 + value / 100.0;
        } else {
            series.monthly_pct[key] = value;
        }
    }
    if (daily) {
        for (const auto& [key, factor] : factors) {
            series.monthly_pct[key] = (factor - 1.0) * 100.0;
        }
    }
    return series;
}

}  // namespace fund_ngin
