/**
 * @file utils.hpp
 * @brief Small string, path and time helpers shared across devui
 *
 * This header provides helper functions for:
 * - Expanding tilde (~) to user's home directory
 * - Trimming and case-folding strings
 * - Producing ISO-8601 timestamps for persisted records
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <algorithm>

namespace devui {

    /**
     * @brief Expands a tilde (~) in a path to the user's home directory
     *
     * Examples:
     *   "~/.devui"       → "/Users/username/.devui"
     *   "/absolute/path" → "/absolute/path" (unchanged)
     *   "relative/path"  → "relative/path" (unchanged)
     *
     * @param path The path string that may contain a tilde
     * @return std::filesystem::path The expanded path
     *
     * @note If HOME environment variable is not set, returns the original path
     */
    inline std::filesystem::path expand_tilde(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return path;
        }

        const char* home = std::getenv("HOME");
        if (!home) {
            return path;
        }

        // Skip "~/" to avoid treating the rest as an absolute path
        std::string rest = path.substr(1);
        if (!rest.empty() && rest[0] == '/') {
            rest = rest.substr(1);
        }

        return std::filesystem::path(home) / rest;
    }

    /**
     * @brief Strips leading and trailing whitespace
     */
    inline std::string trim(const std::string& str) {
        const char* ws = " \t\r\n\f\v";
        size_t start = str.find_first_not_of(ws);
        if (start == std::string::npos) {
            return "";
        }
        size_t end = str.find_last_not_of(ws);
        return str.substr(start, end - start + 1);
    }

    inline std::string to_lower(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str;
    }

    /**
     * @brief Joins tokens with a single space
     *
     * Used for debug output of command lines; no quoting is applied.
     */
    inline std::string join(const std::vector<std::string>& parts, const std::string& sep = " ") {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                out += sep;
            }
            out += parts[i];
        }
        return out;
    }

    /**
     * @brief Current UTC time as ISO-8601 with millisecond precision
     *
     * Format: 2026-10-18T09:15:02.123Z
     */
    inline std::string iso8601_now() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm utc_time{};
        gmtime_r(&time_t_now, &utc_time);

        std::ostringstream ss;
        ss << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    /**
     * @brief Local wall-clock time formatted for log lines
     *
     * @return std::string Formatted timestamp YYYY-MM-DD HH:MM:SS
     */
    inline std::string local_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);

        std::tm local_time{};
        localtime_r(&time_t_now, &local_time);

        std::ostringstream ss;
        ss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    /**
     * @brief Loose ISO-8601 shape check (YYYY-MM-DDTHH:MM:SS prefix)
     *
     * Records written by other tools may carry offsets or fractional
     * seconds, so only the date/time prefix is validated.
     */
    inline bool looks_like_iso8601(const std::string& value) {
        if (value.size() < 19) {
            return false;
        }
        static const char* shape = "dddd-dd-ddTdd:dd:dd";
        for (size_t i = 0; i < 19; ++i) {
            char expected = shape[i];
            char actual = value[i];
            if (expected == 'd') {
                if (!std::isdigit(static_cast<unsigned char>(actual))) {
                    return false;
                }
            } else if (expected == 'T') {
                if (actual != 'T' && actual != ' ') {
                    return false;
                }
            } else if (actual != expected) {
                return false;
            }
        }
        return true;
    }

} // namespace devui
