#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "fund_ngin/core/time_utils.hpp"
#include "fund_ngin/ingest/csv_reader.hpp"
#include "fund_ngin/ingest/record_parsers.hpp"

using namespace fund_ngin;
using namespace fund_ngin::testing;

class CsvReaderTest : public TestBase {};

TEST_F(CsvReaderTest, SplitsQuotedFields) {
    auto fields = split_csv_line("a, \"b,\"\"c\"\"\" ,d\r", ',');
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "b,\"c\"");
    EXPECT_EQ(fields[2], "d");
}

TEST_F(CsvReaderTest, KeepsSourceLineNumbersAcrossBlankLines) {
    auto table = parse_csv("\xEF\xBB\xBFSymbol,Price\n\nPETR4,35\n\nVALE3,60\n");
    ASSERT_TRUE(table.is_ok());
    EXPECT_EQ(table.value().header()[0], "Symbol");
    ASSERT_EQ(table.value().rows().size(), 2u);
    EXPECT_EQ(table.value().rows()[0].line, 3u);
    EXPECT_EQ(table.value().rows()[1].line, 5u);

    // Lookup ignores case and takes the first alias present
    EXPECT_EQ(table.value().column({"ticker", "symbol"}), std::optional<size_t>(0));
    EXPECT_FALSE(table.value().column({"quantity"}).has_value());
}

TEST_F(CsvReaderTest, EmptyInputHasNoHeader) {
    auto table = parse_csv("\n\n");
    ASSERT_TRUE(table.is_error());
    EXPECT_EQ(table.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(CsvReaderTest, MissingFileIsReported) {
    auto table = read_csv("/nonexistent/fund_ngin/trades.csv");
    ASSERT_TRUE(table.is_error());
    EXPECT_EQ(table.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST(ParseNumberTest, HandlesLocalFormats) {
    EXPECT_DOUBLE_EQ(parse_number("R$ 1234,5").value(), 1234.5);
    EXPECT_DOUBLE_EQ(parse_number("R$ 1.234,50").value(), 1234.5);
    EXPECT_DOUBLE_EQ(parse_number("US$ 1,234.56").value(), 1234.56);
    EXPECT_DOUBLE_EQ(parse_number("-100").value(), -100.0);
    EXPECT_DOUBLE_EQ(parse_number("0.5").value(), 0.5);
    EXPECT_FALSE(parse_number("").has_value());
    EXPECT_FALSE(parse_number("abc").has_value());
    EXPECT_FALSE(parse_number("12x").has_value());
}

TEST(ParseNumberTest, LoneSeparatorBeforeThreeDigitsIsAmbiguous) {
    EXPECT_FALSE(parse_number("1,500").has_value());
    EXPECT_FALSE(parse_number("1.500").has_value());
    EXPECT_FALSE(parse_number("R$ -250,000").has_value());

    // Repeated or mixed separators settle the grouping
    EXPECT_DOUBLE_EQ(parse_number("1.500.000").value(), 1500000.0);
    EXPECT_DOUBLE_EQ(parse_number("1,500,000").value(), 1500000.0);
    EXPECT_DOUBLE_EQ(parse_number("1.500,0").value(), 1500.0);

    // A zero integer part or another decimal count is unambiguous
    EXPECT_DOUBLE_EQ(parse_number("0,125").value(), 0.125);
    EXPECT_DOUBLE_EQ(parse_number("1,5").value(), 1.5);
    EXPECT_DOUBLE_EQ(parse_number("1.5000").value(), 1.5);
    EXPECT_DOUBLE_EQ(parse_number("1500.125").value(), 1500.125);
}

TEST(ParseRecordDateTest, AcceptsIsoAndBrazilianDates) {
    EXPECT_EQ(parse_record_date("2024-03-15").value(), core::make_date(2024, 3, 15));
    EXPECT_EQ(parse_record_date("15/03/2024").value(), core::make_date(2024, 3, 15));

    auto bad = parse_record_date("31/02/2024");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error()->code(), ErrorCode::PARSE_ERROR);
    EXPECT_TRUE(parse_record_date("yesterday").is_error());
}

class RecordParsersTest : public TestBase {
protected:
    CsvTable table(const std::string& text, char delimiter = ',') {
        auto parsed = parse_csv(text, delimiter);
        EXPECT_TRUE(parsed.is_ok());
        return parsed.value();
    }

    static std::vector<size_t> error_lines(const std::vector<IngestError>& errors) {
        std::vector<size_t> lines;
        for (const auto& error : errors) {
            lines.push_back(error.line);
        }
        return lines;
    }
};

TEST_F(RecordParsersTest, MalformedTransactionRowsAreRejectedIndividually) {
    const std::string csv =
        "date,symbol,signed_quantity,price,market\n"
        "2024-01-02,PETR4,100,\"35,50\",Nacional\n"
        "\n"
        "2024-01-03,,10,20,Nacional\n"
        "03/01/2024,VALE3,abc,60,Nacional\n"
        "2024-13-01,ITUB4,10,30,Nacional\n"
        "05/01/2024,VALE3,-50,\"62,10\",Nacional\n"
        "2024-01-06,BBAS3,0,40,Nacional\n";

    auto report = parse_transactions(table(csv), AssetClass::EQUITY);
    ASSERT_TRUE(report.is_ok());
    EXPECT_FALSE(report.value().clean());

    const auto& records = report.value().records;
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].symbol, "PETR4");
    EXPECT_EQ(records[0].asset_class, AssetClass::EQUITY);
    EXPECT_DOUBLE_EQ(records[0].price, 35.5);
    EXPECT_EQ(records[0].market, "Nacional");
    EXPECT_EQ(records[1].symbol, "VALE3");
    EXPECT_EQ(records[1].date, core::make_date(2024, 1, 5));
    EXPECT_DOUBLE_EQ(records[1].signed_quantity, -50.0);
    EXPECT_EQ(records[1].side(), Side::SELL);

    EXPECT_EQ(report.value().record_lines, (std::vector<size_t>{2, 7}));
    EXPECT_EQ(error_lines(report.value().errors), (std::vector<size_t>{4, 5, 6, 8}));
}

TEST_F(RecordParsersTest, TransactionsWithPortugueseHeaders) {
    const std::string csv =
        "Data;Ativo;Quantidade;Preço;Mercado;Moeda\n"
        "02/01/2024;AAPL;10;185,20;NASDAQ;USD\n";

    auto report = parse_transactions(table(csv, ';'), AssetClass::EQUITY);
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().clean());
    ASSERT_EQ(report.value().records.size(), 1u);
    EXPECT_EQ(report.value().records[0].symbol, "AAPL");
    EXPECT_DOUBLE_EQ(report.value().records[0].price, 185.2);
    EXPECT_EQ(report.value().records[0].currency, "USD");
}

TEST_F(RecordParsersTest, MissingRequiredColumnFailsTheWholeFile) {
    auto report = parse_transactions(table("date,symbol,price\n2024-01-02,PETR4,35\n"),
                                     AssetClass::EQUITY);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_NE(std::string(report.error()->what()).find("signed_quantity"), std::string::npos);

    auto bonds = parse_bonds(table("title,quantity,indexer\nCDB,1,CDI\n"));
    ASSERT_TRUE(bonds.is_error());
    EXPECT_EQ(bonds.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(RecordParsersTest, BondsReadIndexerAndRateFromEitherColumn) {
    const std::string csv =
        "title,issuer,quantity,unit_price,indexer,percent_indexed,application_date,"
        "maturity_date,type\n"
        "CDB Banco X,Banco X,10,1000,CDI,110,2024-01-02,2026-01-02,CDB\n"
        "Tesouro IPCA+,Tesouro,2,\"3.000,00\",IPCA + 6%,,02/01/2024,15/05/2035,NTN-B\n"
        "LCI Y,Banco Y,5,,PRE,12.5,2024-01-02,,LCI\n"
        "Bad,Banco Z,1,100,CDI,100,2024-03-01,2024-02-01,CDB\n";

    auto report = parse_bonds(table(csv));
    ASSERT_TRUE(report.is_ok());

    const auto& bonds = report.value().records;
    ASSERT_EQ(bonds.size(), 2u);
    EXPECT_EQ(bonds[0].indexer, Indexer::CDI);
    EXPECT_DOUBLE_EQ(bonds[0].percent_indexed, 110.0);
    EXPECT_DOUBLE_EQ(bonds[0].invested(), 10000.0);
    EXPECT_EQ(bonds[0].issue_id, "CDB Banco X");
    ASSERT_TRUE(bonds[0].maturity_date.has_value());

    EXPECT_EQ(bonds[1].indexer, Indexer::IPCA);
    EXPECT_DOUBLE_EQ(bonds[1].percent_indexed, 6.0);
    EXPECT_DOUBLE_EQ(bonds[1].unit_price, 3000.0);
    EXPECT_EQ(*bonds[1].maturity_date, core::make_date(2035, 5, 15));

    EXPECT_EQ(error_lines(report.value().errors), (std::vector<size_t>{4, 5}));
}

TEST_F(RecordParsersTest, CashFlowsKeepOptionalBaseAmount) {
    const std::string csv =
        "date,investor_id,investor_name,type,amount,currency,amount_in_base_currency\n"
        "2024-01-02,INV001,Ana,deposit,\"1.000,00\",BRL,\n"
        "2024-01-05,INV002,Bruno,Withdrawal,200,USD,1000\n"
        "2024-01-06,INV003,Carla,transfer,50,BRL,\n"
        "2024-01-07,,Dan,deposit,50,BRL,\n"
        "2024-01-08,INV001,Ana,deposit,-10,BRL,\n";

    auto report = parse_cash_flows(table(csv));
    ASSERT_TRUE(report.is_ok());

    const auto& records = report.value().records;
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].flow.type, CashFlowType::DEPOSIT);
    EXPECT_DOUBLE_EQ(records[0].flow.amount.amount, 1000.0);
    EXPECT_EQ(records[0].flow.amount.currency, "BRL");
    EXPECT_EQ(records[0].investor_name, "Ana");
    EXPECT_FALSE(records[0].amount_in_base_currency.has_value());

    EXPECT_EQ(records[1].flow.type, CashFlowType::WITHDRAWAL);
    EXPECT_EQ(records[1].flow.amount.currency, "USD");
    EXPECT_DOUBLE_EQ(records[1].amount_in_base_currency.value(), 1000.0);

    EXPECT_EQ(error_lines(report.value().errors), (std::vector<size_t>{4, 5, 6}));
}

TEST_F(RecordParsersTest, FeeRecordsCarryPaymentState) {
    const std::string csv =
        "fee_type,period_start,period_end,nav_start,nav_end,fee_rate,fee_amount,paid,"
        "payment_date\n"
        "management,2023-01-01,2023-12-31,1000000,1200000,0.02,24000,sim,2024-01-10\n"
        "performance,2023-01-01,2023-12-31,1000000,1200000,0.2,40000,no,\n"
        "custody,2023-01-01,2023-12-31,,,,10,,\n"
        "management,2024-01-01,2024-12-31,,,,-5,,\n";

    auto report = parse_fee_records(table(csv), "BRL");
    ASSERT_TRUE(report.is_ok());

    const auto& records = report.value().records;
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].fee_type, FeeType::MANAGEMENT);
    EXPECT_TRUE(records[0].paid());
    EXPECT_EQ(*records[0].payment_date, core::make_date(2024, 1, 10));
    EXPECT_EQ(records[0].currency, "BRL");
    EXPECT_DOUBLE_EQ(records[0].nav_end, 1200000.0);

    EXPECT_EQ(records[1].fee_type, FeeType::PERFORMANCE);
    EXPECT_EQ(records[1].state, FeeState::CALCULATED);
    EXPECT_FALSE(records[1].payment_date.has_value());
    EXPECT_EQ(records[1].period_start, core::make_date(2023, 1, 1));

    EXPECT_EQ(error_lines(report.value().errors), (std::vector<size_t>{4, 5}));
}

TEST_F(RecordParsersTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "fund_ngin_crypto_trades.csv";
    {
        std::ofstream out(path);
        out << "date,symbol,signed_quantity,price\n"
            << "2024-01-02,BTC-USD,0.5,42000\n"
            << "2024-01-03,ETH-USD,x,2200\n";
    }

    auto report = load_transactions(path.string(), AssetClass::CRYPTO);
    std::filesystem::remove(path);

    ASSERT_TRUE(report.is_ok());
    ASSERT_EQ(report.value().records.size(), 1u);
    EXPECT_EQ(report.value().records[0].asset_class, AssetClass::CRYPTO);
    ASSERT_EQ(report.value().errors.size(), 1u);
    EXPECT_EQ(report.value().errors[0].line, 3u);
}
