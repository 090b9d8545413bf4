#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <string>

namespace mdeploy {

// The "meeting" section of the service's configuration.
struct ActivationSettings {
    std::string server_url;
    std::string device_key;
    std::string token_code;
    int heartbeat_interval = 60;

    bool HasCredentials() const { return !device_key.empty() && !token_code.empty(); }
};

// Typed access to <root>/config/motion_frontend.json. Unrelated keys are
// preserved on every write.
class RuntimeConfig {
  public:
    explicit RuntimeConfig(std::filesystem::path path) : path_(std::move(path)) {}

    static nlohmann::json DefaultDocument(const ActivationSettings& activation);

    bool Exists() const;

    // Writes the default document when the file is absent. `created` tells
    // whether anything was written.
    Result EnsureDefault(const ActivationSettings& activation, bool& created) const;

    // Merges non-empty fields into the "meeting" section, creating it when
    // needed.
    Result WriteActivation(const ActivationSettings& activation) const;

    std::expected<ActivationSettings, std::string> ReadActivation() const;

    const std::filesystem::path& Path() const { return path_; }

  private:
    Result Load(nlohmann::json& out) const;
    Result Store(const nlohmann::json& doc) const;

    std::filesystem::path path_;
};

} // namespace mdeploy
