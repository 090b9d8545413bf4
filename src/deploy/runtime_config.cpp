#include "deploy/runtime_config.hpp"

#include "deploy/installation.hpp"
#include "io/atomic_file.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

std::string Lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

nlohmann::json MeetingSection(const ActivationSettings& a) {
    return nlohmann::json{
        {"server_url", a.server_url},
        {"device_key", a.device_key},
        {"token_code", a.token_code},
        {"heartbeat_interval", a.heartbeat_interval},
    };
}

} // namespace

nlohmann::json RuntimeConfig::DefaultDocument(const ActivationSettings& activation) {
    const std::string hostname = activation.device_key.empty() ? "motion-frontend" : Lowercase(activation.device_key);

    nlohmann::json doc;
    doc["version"] = "1.0";
    doc["hostname"] = hostname;
    doc["theme"] = "dark";
    doc["language"] = "fr";
    doc["logging_level"] = "INFO";
    doc["log_to_file"] = true;
    doc["log_reset_on_start"] = false;
    doc["display"] = {{"preview_count", 1}, {"preview_quality", "high"}};
    doc["network"] = {{"wifi_ssid", ""}, {"wifi_password", ""}, {"ip_mode", "dhcp"}};
    doc["camera_filter_patterns"] = {"bcm2835-isp", "unicam", "rp1-cfe"};
    doc["audio_filter_patterns"] = {"hdmi", "spdif"};
    doc["meeting"] = MeetingSection(activation);
    return doc;
}

bool RuntimeConfig::Exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

Result RuntimeConfig::Load(nlohmann::json& out) const {
    std::string text;
    if (auto r = ReadFileToString(path_.string(), text); !r.is_ok()) return r;
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(-1, "invalid JSON in " + path_.string() + ": " + e.what());
    }
    if (!out.is_object()) return Result::Fail(-1, "root must be JSON object: " + path_.string());
    return Result::Ok();
}

Result RuntimeConfig::Store(const nlohmann::json& doc) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) return Result::Fail(ec.value(), "cannot create " + path_.parent_path().string() + ": " + ec.message());
    return WriteFileAtomic(path_.string(), doc.dump(2) + "\n", InstallationLayout::kConfigFileMode);
}

Result RuntimeConfig::EnsureDefault(const ActivationSettings& activation, bool& created) const {
    created = false;
    if (Exists()) return Result::Ok();

    LogInfo("Creating the default configuration...");
    if (!activation.device_key.empty()) {
        LogInfo("Hostname derived from the device key: %s", Lowercase(activation.device_key).c_str());
    }
    if (auto r = Store(DefaultDocument(activation)); !r.is_ok()) return r;
    created = true;
    return Result::Ok();
}

Result RuntimeConfig::WriteActivation(const ActivationSettings& activation) const {
    nlohmann::json doc;
    if (auto r = Load(doc); !r.is_ok()) return r;

    auto& meeting = doc["meeting"];
    if (!meeting.is_object()) meeting = MeetingSection(ActivationSettings{});

    if (!activation.server_url.empty()) meeting["server_url"] = activation.server_url;
    if (!activation.device_key.empty()) meeting["device_key"] = activation.device_key;
    if (!activation.token_code.empty()) meeting["token_code"] = activation.token_code;
    if (!meeting.contains("heartbeat_interval")) meeting["heartbeat_interval"] = activation.heartbeat_interval;

    return Store(doc);
}

std::expected<ActivationSettings, std::string> RuntimeConfig::ReadActivation() const {
    nlohmann::json doc;
    if (auto r = Load(doc); !r.is_ok()) return std::unexpected(r.msg);

    ActivationSettings a;
    auto it = doc.find("meeting");
    if (it == doc.end() || !it->is_object()) return a;

    auto str = [&](const char* key, std::string& out) {
        auto f = it->find(key);
        if (f != it->end() && f->is_string()) out = f->get<std::string>();
    };
    str("server_url", a.server_url);
    str("device_key", a.device_key);
    str("token_code", a.token_code);
    if (auto f = it->find("heartbeat_interval"); f != it->end() && f->is_number_integer()) {
        a.heartbeat_interval = f->get<int>();
    }
    return a;
}

} // namespace mdeploy
