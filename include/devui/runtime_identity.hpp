/**
 * @file runtime_identity.hpp
 * @brief Classifies how the devui CLI process itself was launched
 *
 * The CLI re-launches itself (server-harness sub-command) and must repeat
 * the exact invocation shape it was started with:
 *
 *   interpreted-primary    node   /path/cli.js ...     → node /path/cli.js server-harness ...
 *   interpreted-alternate  bun    /path/cli.js ...     → bun  /path/cli.js server-harness ...
 *   compiled-binary        devui  ...                  → devui server-harness ...
 *
 * Classification is a pure function of a ProcessSnapshot plus at most one
 * filesystem existence check, so it can be exercised with synthetic input.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <stdexcept>

namespace devui {

    /**
     * @brief Which kind of program is executing the CLI
     */
    enum class RuntimeKind {
        INTERPRETED_PRIMARY,    ///< node
        INTERPRETED_ALTERNATE,  ///< bun
        COMPILED_BINARY         ///< self-contained executable
    };

    enum class PlatformFamily {
        POSIX,
        WINDOWS
    };

    /**
     * @brief Converts a RuntimeKind to the name used in logs
     *
     * @return std::string "node", "bun" or "compiled-binary"
     */
    inline std::string runtime_kind_to_string(RuntimeKind kind) {
        switch (kind) {
            case RuntimeKind::INTERPRETED_PRIMARY:   return "node";
            case RuntimeKind::INTERPRETED_ALTERNATE: return "bun";
            case RuntimeKind::COMPILED_BINARY:       return "compiled-binary";
            default:                                 return "unknown";
        }
    }

    inline std::string platform_family_to_string(PlatformFamily family) {
        return family == PlatformFamily::WINDOWS ? "windows" : "posix";
    }

    /**
     * @brief Immutable result of runtime classification
     *
     * Invariant: executable_path is non-empty. script_path is only set for
     * interpreted kinds.
     */
    struct RuntimeIdentity {
        RuntimeKind kind = RuntimeKind::INTERPRETED_PRIMARY;
        std::string executable_path;
        std::optional<std::string> script_path;
        PlatformFamily platform_family = PlatformFamily::POSIX;

        [[nodiscard]] bool is_compiled_binary() const { return kind == RuntimeKind::COMPILED_BINARY; }

        bool operator==(const RuntimeIdentity& other) const {
            return kind == other.kind &&
                   executable_path == other.executable_path &&
                   script_path == other.script_path &&
                   platform_family == other.platform_family;
        }
        bool operator!=(const RuntimeIdentity& other) const { return !(*this == other); }
    };

    /**
     * @brief Everything classification looks at
     *
     * Mirrors what an interpreter exposes about the running process:
     * argument vector, resolved executable, per-runtime version metadata
     * (e.g. {"node": "20.11.0"} or {"bun": "1.1.0"}) and platform name
     * ("linux", "darwin", "win32").
     */
    struct ProcessSnapshot {
        std::vector<std::string> argv;
        std::string exec_path;
        std::map<std::string, std::string> versions;
        std::string platform;
    };

    /**
     * @brief Thrown when the running executable cannot be determined
     */
    class RuntimeDetectionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Existence check used for the script argument; may throw
    using PathExistsFn = std::function<bool(const std::string&)>;

    /**
     * @brief Default existence check backed by std::filesystem
     */
    bool path_exists(const std::string& path);

    /**
     * @brief True when a filename names the alternate runtime
     *
     * Matches "bun", "bun.exe", "bun1.0", "BUN1.1.3.exe"; the match is on
     * the basename only.
     */
    bool is_alternate_runtime_executable(const std::string& exec_path);

    /**
     * @brief Classifies the runtime described by a snapshot
     *
     * Rules, first match wins:
     * 1. Empty/whitespace exec_path → RuntimeDetectionError.
     * 2. Alternate runtime (version key "bun" or bun-like executable name):
     *    script argument exists → alternate with script; executable named
     *    like bun → alternate without script; otherwise compiled-binary
     *    (binary built by bun, argv[1] is a virtual path).
     * 3. argv[1] exists, or argv[1] present with "node" metadata → primary
     *    with script.
     * 4. "node" metadata without a usable argv[1] → primary without script.
     * 5. Otherwise compiled-binary.
     *
     * An exception thrown by exists is treated as "does not exist".
     *
     * @param snapshot Process state to classify
     * @param exists Existence check for argv[1]
     * @return RuntimeIdentity
     * @throws RuntimeDetectionError if exec_path is blank
     */
    RuntimeIdentity identify_runtime(const ProcessSnapshot& snapshot,
                                     const PathExistsFn& exists = path_exists);

    /**
     * @brief Captures the snapshot of the current process
     *
     * exec_path comes from /proc/self/exe (or _NSGetExecutablePath on
     * macOS), falling back to argv[0]. A native build carries no
     * interpreter version metadata.
     *
     * @param argc Argument count from main
     * @param argv Argument values from main
     */
    ProcessSnapshot capture_current_process(int argc, char* argv[]);

    /**
     * @brief Resolved path of the running executable, or "" if unknown
     */
    std::string get_executable_path();

} // namespace devui
