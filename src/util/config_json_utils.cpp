#include "util/config_json_utils.hpp"

#include <fstream>
#include <limits>

namespace mdeploy::config::detail {

namespace {

// Present but mistyped keys are errors; absent keys keep the default.
bool GetString(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    if (out.empty()) {
        err = std::string(key) + " must not be empty";
        return false;
    }
    return true;
}

bool GetInt(const nlohmann::json& j, const char* key, long long lo, long long hi, long long& out,
            bool& present, std::string& err) {
    present = false;
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_number_integer()) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    const auto v = it->get<long long>();
    if (v < lo || v > hi) {
        err = std::string(key) + " out of range";
        return false;
    }
    out = v;
    present = true;
    return true;
}

bool GetPort(const nlohmann::json& j, const char* key, std::uint16_t& out, std::string& err) {
    long long v{};
    bool present = false;
    if (!GetInt(j, key, 1, std::numeric_limits<std::uint16_t>::max(), v, present, err))
        return false;
    if (present)
        out = static_cast<std::uint16_t>(v);
    return true;
}

bool GetBool(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> v;
    for (const auto& e : *it) {
        if (!e.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        v.push_back(e.get<std::string>());
    }
    out = std::move(v);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ToolConfig& cfg, std::string& err) {
    if (!GetString(j, "InstallRoot", cfg.install_root, err) ||
        !GetString(j, "HostLogDir", cfg.host_log_dir, err) ||
        !GetString(j, "ServiceName", cfg.service_name, err) ||
        !GetString(j, "ServiceUser", cfg.service_user, err) ||
        !GetString(j, "ServiceGroup", cfg.service_group, err) ||
        !GetString(j, "DefaultBranch", cfg.default_branch, err) ||
        !GetString(j, "RepoOwner", cfg.repo_owner, err) ||
        !GetString(j, "RepoName", cfg.repo_name, err) ||
        !GetString(j, "BindHost", cfg.bind_host, err) ||
        !GetString(j, "BackupDir", cfg.backup_dir, err) ||
        !GetString(j, "UnitDir", cfg.unit_dir, err)) {
        return false;
    }

    if (!GetPort(j, "Port", cfg.port, err))
        return false;

    if (auto it = j.find("StreamPorts"); it != j.end()) {
        if (!it->is_array() || it->size() != 2 || !(*it)[0].is_number_integer() ||
            !(*it)[1].is_number_integer()) {
            err = "StreamPorts must be [first, last]";
            return false;
        }
        const auto first = (*it)[0].get<long long>();
        const auto last = (*it)[1].get<long long>();
        if (first < 1 || last > std::numeric_limits<std::uint16_t>::max() || first > last) {
            err = "StreamPorts out of range";
            return false;
        }
        cfg.stream_port_first = static_cast<std::uint16_t>(first);
        cfg.stream_port_last = static_cast<std::uint16_t>(last);
    }

    if (!GetStringList(j, "AptPackages", cfg.apt_packages, err))
        return false;

    {
        long long v{};
        bool present = false;
        if (!GetInt(j, "HttpTimeoutSec", 1, 3600, v, present, err))
            return false;
        if (present)
            cfg.http_timeout_sec = static_cast<int>(v);
    }

    if (!GetBool(j, "MediaRelay", cfg.media_relay, err))
        return false;

    if (!cfg.install_root.starts_with("/") || !cfg.host_log_dir.starts_with("/") ||
        !cfg.backup_dir.starts_with("/") || !cfg.unit_dir.starts_with("/")) {
        err = "InstallRoot, HostLogDir, BackupDir and UnitDir must be absolute paths";
        return false;
    }

    return true;
}

} // namespace mdeploy::config::detail
