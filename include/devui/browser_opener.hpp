/**
 * @file browser_opener.hpp
 * @brief Opens a URL in the system browser
 */

#pragma once

#include <string>

namespace devui {

    class BrowserOpener {
    public:
        virtual ~BrowserOpener() = default;

        /**
         * @brief Opens url
         *
         * @throws std::runtime_error if the platform opener fails
         */
        virtual void open(const std::string& url) = 0;
    };

    /**
     * @brief Uses `xdg-open`, `open` or `start` depending on the platform
     */
    class SystemBrowserOpener : public BrowserOpener {
    public:
        void open(const std::string& url) override;

        /**
         * @brief Shell command that opens url on this platform
         */
        static std::string build_command(const std::string& url);
    };

} // namespace devui
