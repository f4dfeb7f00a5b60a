// src/core/config_base.cpp

#include "fund_ngin/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fund_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    const std::filesystem::path target(filepath);
    std::filesystem::path temp = target;
    temp += ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot create directory for " + filepath + ": " +
                                        ec.message(),
                                    "ConfigBase");
        }
    }

    {
        std::ofstream file(temp);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + temp.string(),
                                    "ConfigBase");
        }
        file << std::setw(4) << to_json() << std::endl;
        if (!file) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write " + temp.string(),
                                    "ConfigBase");
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to replace " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Config section must be a JSON object",
                                "ConfigBase");
    }
    try {
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                std::string("Invalid config value: ") + e.what(), "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Error parsing " + filepath + ": " + e.what(), "ConfigBase");
    }
    return apply_json(j);
}

}  // namespace fund_ngin
