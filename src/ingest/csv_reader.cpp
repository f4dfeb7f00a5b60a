// src/ingest/csv_reader.cpp

#include "fund_ngin/ingest/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "fund_ngin/core/logger.hpp"

namespace fund_ngin {

namespace {

std::string trim(const std::string& value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    auto begin = std::find_if(value.begin(), value.end(), not_space);
    auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::optional<size_t> CsvTable::column(std::initializer_list<const char*> names) const {
    for (const char* name : names) {
        const std::string wanted = to_lower(name);
        for (size_t i = 0; i < header_.size(); ++i) {
            if (to_lower(header_[i]) == wanted) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> split_csv_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delimiter) {
            fields.push_back(trim(current));
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    fields.push_back(trim(current));
    return fields;
}

Result<CsvTable> parse_csv(const std::string& text, char delimiter) {
    std::istringstream stream(text);
    std::string line;
    size_t line_number = 0;

    std::vector<std::string> header;
    std::vector<CsvRow> rows;
    while (std::getline(stream, line)) {
        ++line_number;
        if (line_number == 1 && line.rfind("\xEF\xBB\xBF", 0) == 0) {
            line.erase(0, 3);  // UTF-8 BOM
        }
        if (trim(line).empty()) {
            continue;
        }
        if (header.empty()) {
            header = split_csv_line(line, delimiter);
            continue;
        }
        rows.push_back(CsvRow{line_number, split_csv_line(line, delimiter)});
    }

    if (header.empty()) {
        return make_error<CsvTable>(ErrorCode::INVALID_DATA, "CSV has no header line",
                                    "CsvReader");
    }
    return CsvTable(std::move(header), std::move(rows));
}

Result<CsvTable> read_csv(const std::string& path, char delimiter) {
    if (!std::filesystem::exists(path)) {
        return make_error<CsvTable>(ErrorCode::FILE_NOT_FOUND, "File not found: " + path,
                                    "CsvReader");
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<CsvTable>(ErrorCode::FILE_IO_ERROR, "Could not open " + path,
                                    "CsvReader");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto table = parse_csv(buffer.str(), delimiter);
    if (table.is_error()) {
        return make_error<CsvTable>(table.error()->code(),
                                    std::string(table.error()->what()) + " in " + path,
                                    "CsvReader");
    }
    DEBUG("Read " << table.value().rows().size() << " rows from " << path);
    return table;
}

}  // namespace fund_ngin
