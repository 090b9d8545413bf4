#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mdeploy {

inline constexpr const char* kDefaultToolConfigPath = "/etc/motion-deploy/deploy.json";

// Deployment parameters. Defaults are compiled in; a JSON file may override
// any of them, and command-line flags override the file.
class ToolConfig {
public:
    std::string install_root = "/opt/motion-frontend";
    std::string host_log_dir = "/var/log/motion-frontend";
    std::string service_name = "motion-frontend";
    std::string service_user = "motion-frontend";
    std::string service_group = "motion-frontend";

    std::string default_branch = "main";
    std::string repo_owner = "sn8k";
    std::string repo_name = "Mme";

    std::string bind_host = "0.0.0.0";
    std::uint16_t port = 8765;
    std::uint16_t stream_port_first = 8081;
    std::uint16_t stream_port_last = 8090;

    std::vector<std::string> apt_packages = {
        "python3",     "python3-pip",    "python3-venv", "python3-dev",    "git",        "curl",
        "wget",        "build-essential", "libffi-dev",  "libssl-dev",     "libjpeg-dev", "zlib1g-dev",
        "libopencv-dev", "python3-opencv", "ffmpeg",     "v4l-utils",      "alsa-utils",
    };

    std::string backup_dir = "/var/backups";
    std::string unit_dir = "/etc/systemd/system";
    int http_timeout_sec = 30;
    bool media_relay = true;

    // Missing file is an error here; callers decide whether absence matters.
    Result LoadFile(const std::string& path);

    void Reset();

    // Primary port followed by the per-stream range.
    std::vector<std::uint16_t> DeclaredPorts() const;
};

} // namespace mdeploy
