#include "devui/logger.hpp"
#include "devui/utils.hpp"
#include <iostream>

namespace devui {

    Logger::Logger() = default;

    Logger::Logger(const std::filesystem::path& log_path)
        : log_path_(log_path) {
        std::error_code ec;
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path(), ec);
        }

        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            std::cerr << "[Logger] Failed to open log file: " << log_path_ << std::endl;
            log_path_.clear();
        }
    }

    Logger::~Logger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    void Logger::debug(const std::string& message) {
        write_log(LogLevel::DEBUG, message);
    }

    void Logger::info(const std::string& message) {
        write_log(LogLevel::INFO, message);
    }

    void Logger::warn(const std::string& message) {
        write_log(LogLevel::WARN, message);
    }

    void Logger::error(const std::string& message) {
        write_log(LogLevel::ERROR, message);
    }

    void Logger::log(LogLevel level, const std::string& message) {
        write_log(level, message);
    }

    void Logger::write_raw(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_ << text;
            log_file_.flush();
        }
    }

    void Logger::set_console_debug(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_debug_ = enabled;
    }

    void Logger::set_console_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }

    void Logger::set_sink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void Logger::write_log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (log_file_.is_open()) {
            log_file_ << "[" << local_timestamp() << "] "
                      << level_to_string(level) << " "
                      << message << std::endl;
        }

        if (console_enabled_) {
            switch (level) {
                case LogLevel::INFO:
                    std::cout << message << std::endl;
                    break;
                case LogLevel::WARN:
                case LogLevel::ERROR:
                    std::cerr << message << std::endl;
                    break;
                case LogLevel::DEBUG:
                    if (console_debug_) {
                        std::cerr << level_to_string(level) << " " << message << std::endl;
                    }
                    break;
            }
        }

        if (sink_) {
            sink_(level, message);
        }
    }

} // namespace devui
