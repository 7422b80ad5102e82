#include "devui/browser_opener.hpp"
#include <cstdlib>
#include <stdexcept>

namespace devui {

    std::string SystemBrowserOpener::build_command(const std::string& url) {
#if defined(_WIN32)
        return "cmd /c start \"\" \"" + url + "\"";
#elif defined(__APPLE__)
        return "open \"" + url + "\"";
#else
        return "xdg-open \"" + url + "\" >/dev/null 2>&1";
#endif
    }

    void SystemBrowserOpener::open(const std::string& url) {
        if (url.find('"') != std::string::npos) {
            throw std::runtime_error("Refusing to open URL containing quotes: " + url);
        }

        int rc = std::system(build_command(url).c_str());
        if (rc != 0) {
            throw std::runtime_error("Browser command exited with status " + std::to_string(rc));
        }
    }

} // namespace devui
