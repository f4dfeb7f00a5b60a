// src/core/logger.cpp

#include "fund_ngin/core/logger.hpp"
#include <algorithm>
#include <iostream>
#include "fund_ngin/core/time_utils.hpp"

namespace fund_ngin {

thread_local std::string Logger::current_component_;

namespace {

std::string session_timestamp() {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm time_info;
    core::safe_localtime(&now_c, &time_info);

    char time_str[32];
    std::strftime(time_str, sizeof(time_str), "%Y%m%d_%H%M%S", &time_info);
    return std::string(time_str);
}

}  // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.current_path_.clear();
    logger.session_stamp_.clear();
    logger.part_number_ = 0;
}

Result<void> Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_path_.clear();

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::error_code ec;
        std::filesystem::create_directories(config_.log_directory, ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create log directory " + config_.log_directory +
                                        ": " + ec.message(),
                                    "Logger");
        }

        session_stamp_ = session_timestamp();
        part_number_ = 0;
        if (!open_next_file()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open log file in " + config_.log_directory,
                                    "Logger");
        }
    }

    initialized_.store(true, std::memory_order_release);
    return Result<void>();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string formatted = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        std::cout << formatted << std::endl;
    }

    if ((config_.destination == LogDestination::FILE ||
         config_.destination == LogDestination::BOTH) &&
        log_file_.is_open()) {
        log_file_ << formatted << std::endl;
        if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            log_file_.close();
            if (!open_next_file()) {
                std::cerr << "ERROR: Logger could not rotate to a new file in "
                          << config_.log_directory << std::endl;
            }
        }
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm time_info;
        core::safe_localtime(&now_c, &time_info);

        char time_str[32];
        std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &time_info);
        ss << time_str << " ";
    }

    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }

    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }

    ss << message;
    return ss.str();
}

std::vector<std::filesystem::path> Logger::owned_log_files() const {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(config_.log_directory, ec)) {
        const auto name = entry.path().filename().string();
        if (entry.is_regular_file() && name.rfind(config_.filename_prefix + "_", 0) == 0 &&
            entry.path().extension() == ".log") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });
    return files;
}

void Logger::enforce_retention() {
    // Leave room for the file about to be opened
    auto files = owned_log_files();
    size_t keep = config_.max_files > 0 ? config_.max_files - 1 : 0;
    std::error_code ec;
    for (size_t i = 0; files.size() > keep && i < files.size() - keep; ++i) {
        std::filesystem::remove(files[i], ec);
    }
}

bool Logger::open_next_file() {
    enforce_retention();
    ++part_number_;
    current_path_ = std::filesystem::path(config_.log_directory) /
                    (config_.filename_prefix + "_" + session_stamp_ + "_part" +
                     std::to_string(part_number_) + ".log");
    log_file_.open(current_path_, std::ios::app);
    return log_file_.is_open();
}

}  // namespace fund_ngin
