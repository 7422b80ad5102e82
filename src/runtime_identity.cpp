#include "devui/runtime_identity.hpp"
#include "devui/utils.hpp"
#include <filesystem>
#include <unistd.h>
#include <limits.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace devui {

    namespace {

        // Basename for either separator style; Windows paths are classified on POSIX hosts in tests.
        std::string basename_of(const std::string& path) {
            size_t pos = path.find_last_of("/\\");
            return pos == std::string::npos ? path : path.substr(pos + 1);
        }

        bool safe_exists(const PathExistsFn& exists, const std::string& path) {
            try {
                return exists(path);
            } catch (const std::exception&) {
                return false;
            }
        }

    } // namespace

    bool path_exists(const std::string& path) {
        return std::filesystem::exists(path);
    }

    bool is_alternate_runtime_executable(const std::string& exec_path) {
        std::string name = to_lower(basename_of(exec_path));

        if (name.size() >= 4 && name.compare(name.size() - 4, 4, ".exe") == 0) {
            name = name.substr(0, name.size() - 4);
        }
        if (name.compare(0, 3, "bun") != 0) {
            return false;
        }

        // Anything after "bun" must be a version suffix: digits and dots
        for (size_t i = 3; i < name.size(); ++i) {
            char c = name[i];
            if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') {
                return false;
            }
        }
        return true;
    }

    RuntimeIdentity identify_runtime(const ProcessSnapshot& snapshot, const PathExistsFn& exists) {
        if (trim(snapshot.exec_path).empty()) {
            throw RuntimeDetectionError("Unable to determine CLI runtime executable path");
        }

        RuntimeIdentity identity;
        identity.executable_path = snapshot.exec_path;
        identity.platform_family = snapshot.platform == "win32" ? PlatformFamily::WINDOWS
                                                                : PlatformFamily::POSIX;

        std::optional<std::string> script_arg;
        if (snapshot.argv.size() > 1 && !snapshot.argv[1].empty()) {
            script_arg = snapshot.argv[1];
        }

        const bool has_bun_version = snapshot.versions.count("bun") > 0;
        const bool has_node_version = snapshot.versions.count("node") > 0;
        const bool exec_is_bun = is_alternate_runtime_executable(snapshot.exec_path);
        const bool script_exists = script_arg && safe_exists(exists, *script_arg);

        if (has_bun_version || exec_is_bun) {
            if (script_exists) {
                identity.kind = RuntimeKind::INTERPRETED_ALTERNATE;
                identity.script_path = script_arg;
            } else if (exec_is_bun) {
                identity.kind = RuntimeKind::INTERPRETED_ALTERNATE;
            } else {
                identity.kind = RuntimeKind::COMPILED_BINARY;
            }
            return identity;
        }

        if (script_arg && (script_exists || has_node_version)) {
            identity.kind = RuntimeKind::INTERPRETED_PRIMARY;
            identity.script_path = script_arg;
            return identity;
        }

        if (has_node_version) {
            identity.kind = RuntimeKind::INTERPRETED_PRIMARY;
            return identity;
        }

        identity.kind = RuntimeKind::COMPILED_BINARY;
        return identity;
    }

    std::string get_executable_path() {
        char path[PATH_MAX];

        #ifdef __linux__
            ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
            if (len != -1) {
                path[len] = '\0';
                return std::string(path);
            }
        #elif __APPLE__
            uint32_t size = sizeof(path);
            if (_NSGetExecutablePath(path, &size) == 0) {
                return std::string(path);
            }
        #endif

        return "";
    }

    ProcessSnapshot capture_current_process(int argc, char* argv[]) {
        ProcessSnapshot snapshot;
        for (int i = 0; i < argc; ++i) {
            snapshot.argv.emplace_back(argv[i] ? argv[i] : "");
        }

        snapshot.exec_path = get_executable_path();
        if (snapshot.exec_path.empty() && !snapshot.argv.empty()) {
            snapshot.exec_path = snapshot.argv[0];
        }

        #if defined(_WIN32)
            snapshot.platform = "win32";
        #elif defined(__APPLE__)
            snapshot.platform = "darwin";
        #else
            snapshot.platform = "linux";
        #endif

        return snapshot;
    }

} // namespace devui
