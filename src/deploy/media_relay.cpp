#include "deploy/media_relay.hpp"

#include "deploy/archive_extractor.hpp"
#include "io/atomic_file.hpp"
#include "io/byte_source.hpp"
#include "io/scratch_dir.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

constexpr const char* kLatestReleaseUrl = "https://api.github.com/repos/bluenviron/mediamtx/releases/latest";

Result Degraded(std::string msg) {
    return Result::Fail(ErrorKind::Degraded, std::move(msg), "RTSP streaming will not be available");
}

} // namespace

MediaRelay::MediaRelay(IHttpClient& http, IServiceManager& services, Paths paths)
    : http_(http), services_(services), paths_(std::move(paths)) {}

std::optional<std::string> MediaRelay::MapArchitecture(std::string_view machine) {
    if (machine == "aarch64" || machine == "arm64") return "arm64";
    if (machine == "armv7l" || machine == "armhf") return "armv7";
    if (machine == "x86_64" || machine == "amd64") return "amd64";
    return std::nullopt;
}

std::string MediaRelay::DefaultConfig() {
    return "# MediaMTX configuration for Motion Frontend\n"
           "logLevel: info\n"
           "\n"
           "rtsp: yes\n"
           "rtspAddress: :8554\n"
           "\n"
           "rtmp: no\n"
           "hls: no\n"
           "webrtc: no\n"
           "\n"
           "pathDefaults:\n"
           "  publishUser:\n"
           "  publishPass:\n"
           "  readUser:\n"
           "  readPass:\n";
}

std::string MediaRelay::UnitText() const {
    return "[Unit]\n"
           "Description=MediaMTX RTSP Server\n"
           "After=network.target\n"
           "\n"
           "[Service]\n"
           "Type=simple\n"
           "ExecStart=" + paths_.binary.string() + " " + paths_.config.string() + "\n"
           "Restart=always\n"
           "RestartSec=5\n"
           "User=root\n"
           "\n"
           "[Install]\n"
           "WantedBy=multi-user.target\n";
}

fs::path MediaRelay::UnitPath() const {
    return paths_.unit_dir / (std::string(kUnitName) + ".service");
}

bool MediaRelay::Installed() const {
    std::error_code ec;
    return fs::is_regular_file(paths_.binary, ec);
}

bool MediaRelay::UnitPresent() const {
    std::error_code ec;
    return fs::is_regular_file(UnitPath(), ec);
}

std::expected<std::string, std::string> MediaRelay::LatestTag() {
    auto resp = http_.Get(kLatestReleaseUrl);
    if (!resp) return std::unexpected(resp.error());
    if (!resp->IsSuccess()) return std::unexpected("HTTP " + std::to_string(resp->status));

    nlohmann::json j = nlohmann::json::parse(resp->body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::unexpected("invalid release JSON");
    auto it = j.find("tag_name");
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::unexpected("release has no tag_name");
    }
    return it->get<std::string>();
}

std::string MediaRelay::AssetUrl(const std::string& tag, const std::string& arch) const {
    return "https://github.com/bluenviron/mediamtx/releases/download/" + tag + "/mediamtx_" + tag + "_linux_" +
           arch + ".tar.gz";
}

Result MediaRelay::Install(std::string_view machine) {
    LogStep("Installing MediaMTX (RTSP server)");

    if (Installed()) {
        LogInfo("MediaMTX is already installed");
        return Result::Ok();
    }

    const auto arch = MapArchitecture(machine);
    if (!arch) {
        return Degraded("unsupported architecture for MediaMTX: " + std::string(machine));
    }

    LogInfo("Fetching the latest MediaMTX version...");
    auto tag = LatestTag();
    if (!tag) return Degraded("cannot resolve the MediaMTX release: " + tag.error());

    ScratchDir scratch;
    if (auto r = ScratchDir::Create(paths_.scratch_base, "motion-deploy-mediamtx-", scratch); !r.is_ok()) {
        return Degraded(r.msg);
    }

    const std::string url = AssetUrl(*tag, *arch);
    LogInfo("Downloading MediaMTX %s for %s...", tag->c_str(), arch->c_str());
    LogDebug("URL: %s", url.c_str());
    const fs::path tarball = scratch.Path() / "mediamtx.tar.gz";
    if (auto r = http_.Download(url, tarball.string(), kDownloadTimeouts); !r.is_ok()) return Degraded(r.msg);

    std::error_code ec;
    const auto size = fs::file_size(tarball, ec);
    if (ec || size == 0) return Degraded("downloaded MediaMTX archive is empty");

    const fs::path extract = scratch.Path() / "x";
    fs::create_directories(extract, ec);
    FileSource reader;
    if (auto r = FileSource::Open(tarball.string(), reader); !r.is_ok()) return Degraded(r.msg);
    if (auto r = ArchiveExtractor{}.ExtractToDir(reader, extract.string(), "mediamtx"); !r.is_ok()) {
        return Degraded("MediaMTX extraction failed: " + r.msg);
    }
    if (!fs::is_regular_file(extract / "mediamtx", ec)) {
        return Degraded("mediamtx binary not found in the archive");
    }

    LogInfo("Installing the MediaMTX binary...");
    fs::create_directories(paths_.binary.parent_path(), ec);
    fs::copy_file(extract / "mediamtx", paths_.binary, fs::copy_options::overwrite_existing, ec);
    if (ec) return Degraded("cannot install " + paths_.binary.string() + ": " + ec.message());
    fs::permissions(paths_.binary, static_cast<fs::perms>(0755), fs::perm_options::replace, ec);

    if (!fs::exists(paths_.config, ec)) {
        if (fs::is_regular_file(extract / "mediamtx.yml", ec)) {
            fs::copy_file(extract / "mediamtx.yml", paths_.config, ec);
            if (!ec) fs::permissions(paths_.config, static_cast<fs::perms>(0644), fs::perm_options::replace, ec);
            if (ec) return Degraded("cannot install " + paths_.config.string() + ": " + ec.message());
        } else if (auto r = WriteFileAtomic(paths_.config.string(), DefaultConfig(), 0644); !r.is_ok()) {
            return Degraded(r.msg);
        }
    }

    if (auto r = WriteFileAtomic(UnitPath().string(), UnitText(), 0644); !r.is_ok()) return Degraded(r.msg);
    if (auto r = services_.DaemonReload(); !r.is_ok()) return Degraded(r.msg);
    if (auto r = services_.Enable(kUnitName); !r.is_ok()) return Degraded(r.msg);
    if (auto r = services_.Start(kUnitName); !r.is_ok()) return Degraded(r.msg);

    LogSuccess("MediaMTX installed, RTSP on port 8554");
    return Result::Ok();
}

Result MediaRelay::Start() {
    LogInfo("Starting the MediaMTX service...");
    return services_.Start(kUnitName);
}

Result MediaRelay::Remove() {
    LogInfo("Stopping and removing MediaMTX...");
    if (services_.IsActive(kUnitName)) {
        if (auto r = services_.Stop(kUnitName); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    }
    if (services_.IsEnabled(kUnitName)) {
        if (auto r = services_.Disable(kUnitName); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    }

    std::error_code ec;
    for (const auto& p : {UnitPath(), paths_.binary, paths_.config}) {
        fs::remove(p, ec);
        if (ec) return Result::Fail(ec.value(), "cannot remove " + p.string() + ": " + ec.message());
    }
    if (auto r = services_.DaemonReload(); !r.is_ok()) return r;
    LogSuccess("MediaMTX removed");
    return Result::Ok();
}

} // namespace mdeploy
