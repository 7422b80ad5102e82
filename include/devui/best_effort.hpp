/**
 * @file best_effort.hpp
 * @brief Runs a side effect whose failure must not change the outcome
 */

#pragma once

#include <string>
#include <exception>

#include "devui/logger.hpp"

namespace devui {

    /**
     * @brief Runs fn, logging and discarding any std::exception
     *
     * Usage:
     *   attempt(logger, LogLevel::DEBUG, "Failed to open browser",
     *           [&] { browser.open(url); });
     *
     * @param logger Where the failure goes
     * @param level Level of the failure entry
     * @param description Prefix of the entry, followed by ": " and what()
     * @param fn Callable taking no arguments
     * @return true if fn completed, false if it threw
     */
    template <typename Fn>
    bool attempt(Logger& logger, LogLevel level, const std::string& description, Fn&& fn) {
        try {
            fn();
            return true;
        } catch (const std::exception& e) {
            logger.log(level, description + ": " + e.what());
            return false;
        }
    }

} // namespace devui
