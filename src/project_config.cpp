#include "devui/project_config.hpp"

namespace devui {

    ProjectConfig::ProjectConfig(std::filesystem::path project_root)
        : project_root_(std::move(project_root))
        , state_dir_(project_root_ / ".devui") {}

    const std::vector<std::string>& ProjectConfig::project_markers() {
        static const std::vector<std::string> markers = {
            "package.json",
            "go.mod",
            "pyproject.toml",
            "requirements.txt",
            "pom.xml",
            "build.gradle",
            "CMakeLists.txt",
            ".devui"
        };
        return markers;
    }

    ProjectConfig ProjectConfig::discover(const std::filesystem::path& start_dir) {
        std::error_code ec;
        std::filesystem::path dir = std::filesystem::absolute(start_dir, ec);
        if (ec) {
            dir = start_dir;
        }

        for (std::filesystem::path current = dir; ; current = current.parent_path()) {
            for (const auto& marker : project_markers()) {
                if (std::filesystem::exists(current / marker, ec)) {
                    return ProjectConfig(current);
                }
            }
            if (current == current.root_path() || current.parent_path() == current) {
                break;
            }
        }

        return ProjectConfig(dir);
    }

    void ProjectConfig::ensure_dirs() const {
        std::filesystem::create_directories(get_servers_dir());
        std::filesystem::create_directories(get_runtimes_dir());
    }

} // namespace devui
