// src/ingest/record_parsers.cpp

#include "fund_ngin/ingest/record_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include "fund_ngin/core/logger.hpp"
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

namespace {

const std::string& field(const CsvRow& row, std::optional<size_t> index) {
    static const std::string empty;
    if (!index || *index >= row.fields.size()) {
        return empty;
    }
    return row.fields[*index];
}

std::string missing_columns(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        joined += (joined.empty() ? "" : ", ") + name;
    }
    return "Missing required column(s): " + joined;
}

bool parse_bool(const std::string& text) {
    std::string lower;
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower == "true" || lower == "1" || lower == "yes" || lower == "sim" || lower == "y";
}

// "1.500" and "1,500" read as either 1.5 or 1500
bool is_ambiguous_grouping(const std::string& text, size_t separator) {
    std::string integer = text.substr(0, separator);
    if (!integer.empty() && (integer[0] == '-' || integer[0] == '+')) {
        integer.erase(0, 1);
    }
    const std::string fraction = text.substr(separator + 1);
    return !integer.empty() && integer.size() <= 3 &&
           integer.find_first_not_of('0') != std::string::npos && fraction.size() == 3 &&
           std::all_of(fraction.begin(), fraction.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

template <typename T, typename Loader>
Result<IngestReport<T>> load_file(const std::string& path, Loader loader) {
    auto table = read_csv(path);
    if (table.is_error()) {
        return forward_error<IngestReport<T>>(table);
    }
    auto report = loader(table.value());
    if (report.is_ok()) {
        INFO("Loaded " << report.value().records.size() << " records from " << path << " ("
                       << report.value().errors.size() << " rejected)");
        for (const auto& error : report.value().errors) {
            WARN(path << ":" << error.line << ": " << error.message);
        }
    }
    return report;
}

}  // namespace

std::optional<double> parse_number(const std::string& text) {
    std::string cleaned;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == ',' || c == '-' ||
            c == '+' || c == 'e' || c == 'E') {
            cleaned += c;
        } else if (!std::isspace(static_cast<unsigned char>(c)) && c != '$' && c != 'R' &&
                   c != 'U' && c != 'S') {
            return std::nullopt;
        }
    }
    if (cleaned.empty()) {
        return std::nullopt;
    }

    const auto dots = std::count(cleaned.begin(), cleaned.end(), '.');
    const auto commas = std::count(cleaned.begin(), cleaned.end(), ',');
    size_t last_dot = cleaned.rfind('.');
    size_t last_comma = cleaned.rfind(',');
    char thousands = 0;
    if (dots > 0 && commas > 0) {
        // The separator that appears last is the decimal one
        thousands = last_dot > last_comma ? ',' : '.';
    } else if (dots > 1) {
        thousands = '.';
    } else if (commas > 1) {
        thousands = ',';
    } else if (dots + commas == 1 &&
               is_ambiguous_grouping(cleaned, dots > 0 ? last_dot : last_comma)) {
        return std::nullopt;
    }
    std::string normalized;
    for (char c : cleaned) {
        if (c == thousands) continue;
        normalized += (c == ',') ? '.' : c;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(normalized, &consumed);
        if (consumed != normalized.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Result<Timestamp> parse_record_date(const std::string& text) {
    int day = 0;
    int month = 0;
    int year = 0;
    if (text.size() >= 10 && text[2] == '/' &&
        std::sscanf(text.c_str(), "%2d/%2d/%4d", &day, &month, &year) == 3) {
        char iso[16];
        std::snprintf(iso, sizeof(iso), "%04d-%02d-%02d", year, month, day);
        return core::parse_date(iso);
    }
    return core::parse_date(text);
}

Result<IngestReport<Transaction>> parse_transactions(const CsvTable& table,
                                                     AssetClass asset_class) {
    auto date_col = table.column({"date", "data"});
    auto symbol_col = table.column({"symbol", "ativo", "ticker"});
    auto price_col = table.column({"price", "preço", "preco"});
    auto qty_col = table.column({"signed_quantity", "quantity", "quantidade"});
    auto market_col = table.column({"market", "mercado"});
    auto currency_col = table.column({"currency", "moeda"});

    std::vector<std::string> missing;
    if (!date_col) missing.push_back("date");
    if (!symbol_col) missing.push_back("symbol");
    if (!price_col) missing.push_back("price");
    if (!qty_col) missing.push_back("signed_quantity");
    if (!missing.empty()) {
        return make_error<IngestReport<Transaction>>(ErrorCode::INVALID_DATA,
                                                     missing_columns(missing), "RecordParsers");
    }

    IngestReport<Transaction> report;
    for (const auto& row : table.rows()) {
        auto date = parse_record_date(field(row, date_col));
        if (date.is_error()) {
            report.errors.push_back({row.line, date.error()->what()});
            continue;
        }
        const std::string& symbol = field(row, symbol_col);
        if (symbol.empty()) {
            report.errors.push_back({row.line, "Empty symbol"});
            continue;
        }
        auto price = parse_number(field(row, price_col));
        if (!price || *price <= 0) {
            report.errors.push_back({row.line, "Invalid price '" + field(row, price_col) + "'"});
            continue;
        }
        auto quantity = parse_number(field(row, qty_col));
        if (!quantity) {
            report.errors.push_back(
                {row.line, "Invalid quantity '" + field(row, qty_col) + "'"});
            continue;
        }
        if (*quantity == 0) {
            report.errors.push_back({row.line, "Zero quantity"});
            continue;
        }

        Transaction txn;
        txn.asset_class = asset_class;
        txn.symbol = symbol;
        txn.date = date.value();
        txn.signed_quantity = *quantity;
        txn.price = *price;
        txn.market = field(row, market_col);
        txn.currency = field(row, currency_col);
        report.add(std::move(txn), row.line);
    }
    return report;
}

Result<IngestReport<BondPosition>> parse_bonds(const CsvTable& table) {
    auto title_col = table.column({"title", "título", "titulo"});
    auto issuer_col = table.column({"issuer", "emissor"});
    auto qty_col = table.column({"quantity", "quantidade"});
    auto unit_col = table.column({"unit_price", "preço unitário", "preco unitario"});
    auto invested_col = table.column({"invested_value", "valor investido", "valor aplicado"});
    auto indexer_col = table.column({"indexer", "indexador"});
    auto percent_col = table.column({"percent_indexed", "taxa", "rentabilidade"});
    auto issue_col =
        table.column({"application_date", "data de aplicação / resgate", "data de aplicação"});
    auto maturity_col = table.column({"maturity_date", "vencimento"});
    auto type_col = table.column({"type", "tipo de título", "tipo"});
    auto id_col = table.column({"issue_id", "código", "codigo"});

    std::vector<std::string> missing;
    if (!title_col) missing.push_back("title");
    if (!qty_col) missing.push_back("quantity");
    if (!indexer_col && !percent_col) missing.push_back("indexer");
    if (!issue_col) missing.push_back("application_date");
    if (!missing.empty()) {
        return make_error<IngestReport<BondPosition>>(ErrorCode::INVALID_DATA,
                                                      missing_columns(missing), "RecordParsers");
    }

    IngestReport<BondPosition> report;
    for (const auto& row : table.rows()) {
        BondPosition bond;
        bond.title = field(row, title_col);
        if (bond.title.empty()) {
            report.errors.push_back({row.line, "Empty title"});
            continue;
        }
        bond.issue_id = field(row, id_col).empty() ? bond.title : field(row, id_col);
        bond.issuer = field(row, issuer_col);
        bond.bond_type = field(row, type_col);

        auto quantity = parse_number(field(row, qty_col));
        if (!quantity || *quantity < 0) {
            report.errors.push_back(
                {row.line, "Invalid quantity '" + field(row, qty_col) + "'"});
            continue;
        }
        bond.quantity = *quantity;

        if (!field(row, unit_col).empty()) {
            auto unit = parse_number(field(row, unit_col));
            if (!unit || *unit < 0) {
                report.errors.push_back(
                    {row.line, "Invalid unit price '" + field(row, unit_col) + "'"});
                continue;
            }
            bond.unit_price = *unit;
        }
        if (!field(row, invested_col).empty()) {
            auto invested = parse_number(field(row, invested_col));
            if (!invested || *invested < 0) {
                report.errors.push_back(
                    {row.line, "Invalid invested value '" + field(row, invested_col) + "'"});
                continue;
            }
            bond.principal = *invested;
        }
        if (bond.quantity > 0 && bond.invested() <= 0) {
            report.errors.push_back({row.line, "Bond has no invested value"});
            continue;
        }

        // The indexer column often carries the rate too ("IPCA + 6,50%")
        const std::string& indexer_text = field(row, indexer_col);
        const std::string& percent_text = field(row, percent_col);
        bond.indexer = indexer_from_string(indexer_text.empty() ? percent_text : indexer_text);
        if (bond.indexer == Indexer::UNKNOWN) {
            WARN("Line " << row.line << ": unknown indexer '" << indexer_text
                         << "', bond carried at invested value");
        }
        bond.percent_indexed =
            parse_percent(percent_text.empty() ? indexer_text : percent_text);

        auto issue = parse_record_date(field(row, issue_col));
        if (issue.is_error()) {
            report.errors.push_back({row.line, issue.error()->what()});
            continue;
        }
        bond.issue_date = issue.value();

        if (!field(row, maturity_col).empty()) {
            auto maturity = parse_record_date(field(row, maturity_col));
            if (maturity.is_error()) {
                report.errors.push_back({row.line, maturity.error()->what()});
                continue;
            }
            if (maturity.value() < bond.issue_date) {
                report.errors.push_back({row.line, "Maturity precedes application date"});
                continue;
            }
            bond.maturity_date = maturity.value();
        }
        report.add(std::move(bond), row.line);
    }
    return report;
}

Result<IngestReport<CashFlowRecord>> parse_cash_flows(const CsvTable& table) {
    auto date_col = table.column({"date", "data"});
    auto investor_col = table.column({"investor_id"});
    auto name_col = table.column({"investor_name"});
    auto type_col = table.column({"type", "tipo"});
    auto amount_col = table.column({"amount", "valor"});
    auto currency_col = table.column({"currency", "moeda"});
    auto base_col = table.column({"amount_in_base_currency", "amount_brl"});
    auto description_col = table.column({"description", "descrição", "descricao"});

    std::vector<std::string> missing;
    if (!date_col) missing.push_back("date");
    if (!investor_col) missing.push_back("investor_id");
    if (!type_col) missing.push_back("type");
    if (!amount_col) missing.push_back("amount");
    if (!missing.empty()) {
        return make_error<IngestReport<CashFlowRecord>>(ErrorCode::INVALID_DATA,
                                                        missing_columns(missing), "RecordParsers");
    }

    IngestReport<CashFlowRecord> report;
    for (const auto& row : table.rows()) {
        auto date = parse_record_date(field(row, date_col));
        if (date.is_error()) {
            report.errors.push_back({row.line, date.error()->what()});
            continue;
        }
        const std::string& investor_id = field(row, investor_col);
        if (investor_id.empty()) {
            report.errors.push_back({row.line, "Empty investor_id"});
            continue;
        }
        auto type = cash_flow_type_from_string(field(row, type_col));
        if (type.is_error()) {
            report.errors.push_back({row.line, type.error()->what()});
            continue;
        }
        auto amount = parse_number(field(row, amount_col));
        if (!amount || *amount <= 0) {
            report.errors.push_back(
                {row.line, "Invalid amount '" + field(row, amount_col) + "'"});
            continue;
        }

        CashFlowRecord record;
        record.flow.date = date.value();
        record.flow.investor_id = investor_id;
        record.flow.type = type.value();
        record.flow.amount =
            Money(*amount, field(row, currency_col).empty() ? "BRL" : field(row, currency_col));
        record.flow.description = field(row, description_col);
        record.investor_name = field(row, name_col);
        if (!field(row, base_col).empty()) {
            record.amount_in_base_currency = parse_number(field(row, base_col));
        }
        report.add(std::move(record), row.line);
    }
    return report;
}

Result<IngestReport<FeeRecord>> parse_fee_records(const CsvTable& table,
                                                  const std::string& currency) {
    auto date_col = table.column({"date", "data"});
    auto investor_col = table.column({"investor_id"});
    auto type_col = table.column({"fee_type"});
    auto start_col = table.column({"period_start"});
    auto end_col = table.column({"period_end"});
    auto nav_start_col = table.column({"nav_start"});
    auto nav_end_col = table.column({"nav_end"});
    auto rate_col = table.column({"fee_rate"});
    auto amount_col = table.column({"fee_amount"});
    auto paid_col = table.column({"paid"});
    auto payment_col = table.column({"payment_date"});

    std::vector<std::string> missing;
    if (!type_col) missing.push_back("fee_type");
    if (!end_col && !date_col) missing.push_back("period_end");
    if (!amount_col) missing.push_back("fee_amount");
    if (!missing.empty()) {
        return make_error<IngestReport<FeeRecord>>(ErrorCode::INVALID_DATA,
                                                   missing_columns(missing), "RecordParsers");
    }

    IngestReport<FeeRecord> report;
    for (const auto& row : table.rows()) {
        FeeRecord record;
        record.currency = currency;
        record.investor_id = field(row, investor_col);

        auto type = fee_type_from_string(field(row, type_col));
        if (type.is_error()) {
            report.errors.push_back({row.line, type.error()->what()});
            continue;
        }
        record.fee_type = type.value();

        const std::string& end_text =
            field(row, end_col).empty() ? field(row, date_col) : field(row, end_col);
        auto period_end = parse_record_date(end_text);
        if (period_end.is_error()) {
            report.errors.push_back({row.line, period_end.error()->what()});
            continue;
        }
        record.period_end = period_end.value();
        record.period_start = record.period_end;
        if (!field(row, start_col).empty()) {
            auto period_start = parse_record_date(field(row, start_col));
            if (period_start.is_error()) {
                report.errors.push_back({row.line, period_start.error()->what()});
                continue;
            }
            record.period_start = period_start.value();
        }

        auto amount = parse_number(field(row, amount_col));
        if (!amount || *amount < 0) {
            report.errors.push_back(
                {row.line, "Invalid fee amount '" + field(row, amount_col) + "'"});
            continue;
        }
        record.amount = *amount;
        record.nav_start = parse_number(field(row, nav_start_col)).value_or(0.0);
        record.nav_end = parse_number(field(row, nav_end_col)).value_or(0.0);
        record.rate = parse_number(field(row, rate_col)).value_or(0.0);

        record.state = parse_bool(field(row, paid_col)) ? FeeState::PAID : FeeState::CALCULATED;
        if (!field(row, payment_col).empty()) {
            auto payment = parse_record_date(field(row, payment_col));
            if (payment.is_error()) {
                report.errors.push_back({row.line, payment.error()->what()});
                continue;
            }
            record.payment_date = payment.value();
        }
        if (record.paid() && !record.payment_date) {
            record.payment_date = record.period_end;
        }
        report.add(std::move(record), row.line);
    }
    return report;
}

Result<IngestReport<Transaction>> load_transactions(const std::string& path,
                                                    AssetClass asset_class) {
    return load_file<Transaction>(
        path, [asset_class](const CsvTable& table) { return parse_transactions(table, asset_class); });
}

Result<IngestReport<BondPosition>> load_bonds(const std::string& path) {
    return load_file<BondPosition>(path, [](const CsvTable& table) { return parse_bonds(table); });
}

Result<IngestReport<CashFlowRecord>> load_cash_flows(const std::string& path) {
    return load_file<CashFlowRecord>(path,
                                     [](const CsvTable& table) { return parse_cash_flows(table); });
}

Result<IngestReport<FeeRecord>> load_fee_records(const std::string& path,
                                                 const std::string& currency) {
    return load_file<FeeRecord>(path, [&currency](const CsvTable& table) {
        return parse_fee_records(table, currency);
    });
}

}  // namespace fund_ngin
