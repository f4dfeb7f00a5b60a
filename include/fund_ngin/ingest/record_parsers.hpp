// include/fund_ngin/ingest/record_parsers.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"
#include "fund_ngin/fund/cash_ledger.hpp"
#include "fund_ngin/fund/fee_engine.hpp"
#include "fund_ngin/ingest/csv_reader.hpp"
#include "fund_ngin/ledger/bond_indexation_engine.hpp"

namespace fund_ngin {

struct IngestError {
    size_t line{0};
    std::string message;
};

/**
 * @brief Rows that parsed, and why the others did not
 */
template <typename T>
struct IngestReport {
    std::vector<T> records;
    std::vector<size_t> record_lines;  // source line of each record
    std::vector<IngestError> errors;

    void add(T record, size_t line) {
        records.push_back(std::move(record));
        record_lines.push_back(line);
    }

    bool clean() const { return errors.empty(); }

    nlohmann::json errors_to_json() const {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& error : errors) {
            j.push_back({{"line", error.line}, {"message", error.message}});
        }
        return j;
    }
};

/**
 * @brief Cash-flow row together with its informational columns
 */
struct CashFlowRecord {
    CashFlow flow;
    std::string investor_name;
    std::optional<double> amount_in_base_currency;  // never used for valuation
};

/**
 * @brief Number with optional currency prefix and decimal comma ("R$ 1234,5")
 *
 * With both '.' and ',' present the last one is the decimal separator. A
 * separator repeated on its own groups thousands ("1.234.567"). A single
 * separator is decimal, except that a nonzero integer part of 1-3 digits
 * followed by exactly three digits ("1.500", "1,500") is rejected as ambiguous.
 */
std::optional<double> parse_number(const std::string& text);

/**
 * @brief YYYY-MM-DD or DD/MM/YYYY, optionally followed by a time
 */
Result<Timestamp> parse_record_date(const std::string& text);

/**
 * @brief date, symbol, price, signed_quantity[, market][, currency]
 * Portuguese headers (Data, Ativo, Preço, Quantidade, Mercado) are accepted.
 * @return INVALID_DATA when a required column is missing
 */
Result<IngestReport<Transaction>> parse_transactions(const CsvTable& table,
                                                     AssetClass asset_class);

/**
 * @brief title, issuer, quantity, unit_price, invested_value, indexer,
 * percent_indexed, application_date, maturity_date[, type]
 */
Result<IngestReport<BondPosition>> parse_bonds(const CsvTable& table);

/**
 * @brief date, investor_id, investor_name, type, amount, currency,
 * amount_in_base_currency, description
 */
Result<IngestReport<CashFlowRecord>> parse_cash_flows(const CsvTable& table);

/**
 * @brief date, investor_id, investor_name, fee_type, period_start, period_end,
 * nav_start, nav_end, fee_rate, fee_amount, paid, payment_date
 * Records come back without ids; FeeEngine::restore assigns them.
 */
Result<IngestReport<FeeRecord>> parse_fee_records(const CsvTable& table,
                                                  const std::string& currency = "BRL");

Result<IngestReport<Transaction>> load_transactions(const std::string& path,
                                                    AssetClass asset_class);
Result<IngestReport<BondPosition>> load_bonds(const std::string& path);
Result<IngestReport<CashFlowRecord>> load_cash_flows(const std::string& path);
Result<IngestReport<FeeRecord>> load_fee_records(const std::string& path,
                                                 const std::string& currency = "BRL");

}  // namespace fund_ngin
