/**
 * @file project_config.hpp
 * @brief Locates the project root and the devui tool-state directories
 *
 * Layout under the project root:
 *
 *   .devui/
 *     devui-cli.log          CLI log (all levels)
 *     servers/
 *       tools.json           Server registry record
 *       devui.log            Server harness log
 *     runtimes/
 *       <runtime>.json       One file per registered user runtime
 *
 * Also holds the timing and port constants used by the supervisor.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

namespace devui {

    /// Overall budget for a freshly spawned server to become healthy
    constexpr std::chrono::milliseconds kHealthCheckTimeout{10000};

    /// Pause between health probes while waiting
    constexpr std::chrono::milliseconds kHealthPollInterval{500};

    /// Timeout for the single probe made against an already-registered server
    constexpr std::chrono::milliseconds kReuseProbeTimeout{1000};

    /// Default time to wait for a launched app to register its runtime
    constexpr std::chrono::milliseconds kRegistrationTimeout{30000};

    /// How often the runtimes directory is rescanned
    constexpr std::chrono::milliseconds kRuntimePollInterval{200};

    /// How often registered runtimes are re-probed
    constexpr std::chrono::milliseconds kRuntimeHealthInterval{5000};

    constexpr int kDefaultPortRangeStart = 4000;
    constexpr int kDefaultPortRangeEnd = 4099;

    /**
     * @brief Resolves where devui keeps its per-project state
     *
     * Usage:
     *   ProjectConfig pc = ProjectConfig::discover();
     *   auto record = pc.get_tools_info_path();  // <root>/.devui/servers/tools.json
     *
     * Construction never touches the filesystem beyond the upward search;
     * directories are created lazily by ensure_dirs() or by the writers.
     */
    class ProjectConfig {
    public:
        /**
         * @brief Uses the given directory as project root as-is
         *
         * @param project_root Directory that owns the .devui state
         */
        explicit ProjectConfig(std::filesystem::path project_root);

        /**
         * @brief Walks up from start_dir to the nearest project marker
         *
         * Markers: package.json, go.mod, pyproject.toml, requirements.txt,
         * pom.xml, build.gradle, CMakeLists.txt or an existing .devui
         * directory. Falls back to start_dir when nothing matches.
         *
         * @param start_dir Directory to begin from (defaults to cwd)
         * @return ProjectConfig Config rooted at the discovered directory
         */
        static ProjectConfig discover(const std::filesystem::path& start_dir = std::filesystem::current_path());

        /**
         * @brief Project marker files searched for by discover()
         */
        static const std::vector<std::string>& project_markers();

        [[nodiscard]] std::filesystem::path get_project_root() const { return project_root_; }
        [[nodiscard]] std::filesystem::path get_state_dir() const { return state_dir_; }
        [[nodiscard]] std::filesystem::path get_servers_dir() const { return state_dir_ / "servers"; }
        [[nodiscard]] std::filesystem::path get_runtimes_dir() const { return state_dir_ / "runtimes"; }
        [[nodiscard]] std::filesystem::path get_tools_info_path() const { return get_servers_dir() / "tools.json"; }
        [[nodiscard]] std::filesystem::path get_server_log_path() const { return get_servers_dir() / "devui.log"; }
        [[nodiscard]] std::filesystem::path get_cli_log_path() const { return state_dir_ / "devui-cli.log"; }

        /**
         * @brief Creates the servers/ and runtimes/ directories
         *
         * @throws std::filesystem::filesystem_error if creation fails
         */
        void ensure_dirs() const;

    private:
        std::filesystem::path project_root_;  ///< Directory owning .devui
        std::filesystem::path state_dir_;     ///< <root>/.devui
    };

} // namespace devui
