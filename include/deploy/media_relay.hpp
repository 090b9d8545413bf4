#pragma once

#include "net/http_client.hpp"
#include "system/service_manager.hpp"
#include "util/result.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mdeploy {

struct MediaRelayPaths {
    std::filesystem::path binary = "/usr/local/bin/mediamtx";
    std::filesystem::path config = "/etc/mediamtx.yml";
    std::filesystem::path unit_dir = "/etc/systemd/system";
    std::filesystem::path scratch_base = "/tmp";
};

// Optional RTSP relay (MediaMTX) with its own unit. Every failure here is
// degraded: the service runs without RTSP.
class MediaRelay {
  public:
    using Paths = MediaRelayPaths;

    static constexpr const char* kUnitName = "mediamtx";

    MediaRelay(IHttpClient& http, IServiceManager& services, Paths paths = {});

    // uname machine -> release asset architecture; nullopt when unsupported.
    static std::optional<std::string> MapArchitecture(std::string_view machine);
    static std::string DefaultConfig();
    std::string UnitText() const;

    std::expected<std::string, std::string> LatestTag();
    std::string AssetUrl(const std::string& tag, const std::string& arch) const;

    bool Installed() const;
    bool UnitPresent() const;
    bool Running() { return services_.IsActive(kUnitName); }

    Result Install(std::string_view machine);
    Result Start();
    Result Remove();

  private:
    std::filesystem::path UnitPath() const;

    IHttpClient& http_;
    IServiceManager& services_;
    Paths paths_;
};

} // namespace mdeploy
