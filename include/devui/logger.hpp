/**
 * @file logger.hpp
 * @brief Leveled logger for the devui CLI and server harness
 *
 * Every entry is appended to an optional log file as
 *   [YYYY-MM-DD HH:MM:SS] [LEVEL] message
 * and mirrored to the console:
 * - INFO  → stdout, verbatim (these are the user-facing lines)
 * - WARN / ERROR → stderr, verbatim
 * - DEBUG → stderr only when console debug output is enabled
 *
 * A sink callback can observe every entry regardless of console settings.
 */

#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>

namespace devui {

    /**
     * @brief Severity of a log entry
     */
    enum class LogLevel {
        DEBUG,      // Internal causes, command lines, decisions
        INFO,       // User-visible progress and results
        WARN,       // Degraded but successful outcome
        ERROR       // Failure reported to the user
    };

    /**
     * @brief Converts a LogLevel to its bracketed tag
     *
     * @param level The level to convert
     * @return std::string "[DEBUG]", "[INFO]", ...
     */
    inline std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "[DEBUG]";
            case LogLevel::INFO:  return "[INFO]";
            case LogLevel::WARN:  return "[WARN]";
            case LogLevel::ERROR: return "[ERROR]";
            default:              return "[UNKNOWN]";
        }
    }

    /**
     * @brief Thread-safe leveled logger
     *
     * Usage:
     *   Logger log(project.get_cli_log_path());
     *   log.set_console_debug(args.debug);
     *   log.info("Starting...");
     *   log.debug("Spawning: ...");
     *
     * Components receive the logger by reference; nothing here is global.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Console-only logger
         */
        Logger();

        /**
         * @brief Logger that also appends to log_path
         *
         * Creates parent directories. If the file cannot be opened a
         * single notice is printed to stderr and logging continues
         * console-only.
         *
         * @param log_path File to append to
         */
        explicit Logger(const std::filesystem::path& log_path);

        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void debug(const std::string& message);
        void info(const std::string& message);
        void warn(const std::string& message);
        void error(const std::string& message);

        /**
         * @brief Log at an explicit level
         */
        void log(LogLevel level, const std::string& message);

        /**
         * @brief Appends text to the log file as-is (no timestamp, no console)
         *
         * Used for session banners. Does nothing for a console-only logger.
         */
        void write_raw(const std::string& text);

        /**
         * @brief Enables/disables DEBUG output on the console
         */
        void set_console_debug(bool enabled);

        /**
         * @brief Enables/disables all console output (file and sink still receive entries)
         */
        void set_console_enabled(bool enabled);

        /**
         * @brief Installs an observer invoked for every entry
         *
         * @param sink Callback, or an empty function to remove it
         */
        void set_sink(Sink sink);

        /**
         * @brief Get the path to the log file
         *
         * @return std::filesystem::path Log file, or empty if console-only
         */
        [[nodiscard]] std::filesystem::path get_log_path() const { return log_path_; }

    private:
        std::filesystem::path log_path_;
        std::ofstream log_file_;
        bool console_debug_ = false;
        bool console_enabled_ = true;
        Sink sink_;
        mutable std::mutex mutex_;

        void write_log(LogLevel level, const std::string& message);
    };

} // namespace devui
