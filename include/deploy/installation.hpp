#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <sys/types.h>

namespace mdeploy {

// On-disk layout of one installation of the service.
struct InstallationLayout {
    std::filesystem::path root;
    std::filesystem::path host_log_dir;

    static constexpr std::array<const char*, 3> kCodeSubpaths{"backend", "static", "templates"};

    static constexpr mode_t kCodeMode = 0755;
    static constexpr mode_t kConfigDirMode = 0750;
    static constexpr mode_t kConfigFileMode = 0640;
    static constexpr mode_t kLogsMode = 0755;

    std::filesystem::path ConfigDir() const { return root / "config"; }
    std::filesystem::path LogsDir() const { return root / "logs"; }
    std::filesystem::path ScriptsDir() const { return root / "scripts"; }
    std::filesystem::path VenvDir() const { return root / ".venv"; }
    std::filesystem::path Python() const { return VenvDir() / "bin" / "python"; }
    std::filesystem::path Pip() const { return VenvDir() / "bin" / "pip"; }
    std::filesystem::path Requirements() const { return root / "requirements.txt"; }
    std::filesystem::path RuntimeConfigFile() const { return ConfigDir() / "motion_frontend.json"; }
    std::filesystem::path ReleaseMarker() const { return root / ".deploy-release.json"; }

    // "Code present" means the primary code subpath exists.
    bool HasCode() const;
};

} // namespace mdeploy
