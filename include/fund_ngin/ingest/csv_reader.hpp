// include/fund_ngin/ingest/csv_reader.hpp
#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>
#include "fund_ngin/core/error.hpp"

namespace fund_ngin {

struct CsvRow {
    size_t line{0};  // 1-based line in the source, header is line 1
    std::vector<std::string> fields;
};

/**
 * @brief Header plus data rows of a delimited file
 */
class CsvTable {
public:
    CsvTable() = default;
    CsvTable(std::vector<std::string> header, std::vector<CsvRow> rows)
        : header_(std::move(header)), rows_(std::move(rows)) {}

    /**
     * @brief Index of the first header matching any of the names, case-insensitively
     */
    std::optional<size_t> column(std::initializer_list<const char*> names) const;

    const std::vector<std::string>& header() const { return header_; }
    const std::vector<CsvRow>& rows() const { return rows_; }
    bool empty() const { return rows_.empty(); }

private:
    std::vector<std::string> header_;
    std::vector<CsvRow> rows_;
};

/**
 * @brief Split one line into trimmed fields
 * Double-quoted fields may contain the delimiter; "" inside quotes is a quote.
 */
std::vector<std::string> split_csv_line(const std::string& line, char delimiter = ',');

/**
 * @brief Parse CSV text whose first non-empty line is the header
 * Blank lines are skipped but still counted for line numbers.
 */
Result<CsvTable> parse_csv(const std::string& text, char delimiter = ',');

/**
 * @brief Read and parse a CSV file
 * @return FILE_NOT_FOUND or FILE_IO_ERROR when the file cannot be read
 */
Result<CsvTable> read_csv(const std::string& path, char delimiter = ',');

}  // namespace fund_ngin
