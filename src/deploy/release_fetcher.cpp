#include "deploy/release_fetcher.hpp"

#include "crypto/sha256.hpp"
#include "deploy/archive_extractor.hpp"
#include "io/atomic_file.hpp"
#include "io/byte_source.hpp"
#include "io/scratch_dir.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

std::string UtcNowIso8601() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

Result CopyTree(const fs::path& src_dir, const fs::path& dst_dir, bool preserve_config) {
    std::error_code ec;
    fs::create_directories(dst_dir, ec);
    if (ec) return Result::Fail(ec.value(), "cannot create " + dst_dir.string() + ": " + ec.message());

    const auto opts = fs::copy_options::recursive | fs::copy_options::overwrite_existing |
                      fs::copy_options::copy_symlinks;

    for (const auto& entry : fs::directory_iterator(src_dir, ec)) {
        const auto name = entry.path().filename();
        if (preserve_config && name == "config") {
            LogInfo("Keeping existing configuration, archive config not copied");
            continue;
        }
        const fs::path target = dst_dir / name;
        // A file replacing a directory (or the reverse) cannot be overwritten in place.
        const auto st = fs::symlink_status(target, ec);
        if (fs::exists(st) && fs::is_directory(st) != entry.is_directory()) {
            fs::remove_all(target, ec);
        }
        fs::copy(entry.path(), target, opts, ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot copy " + entry.path().string() + " to " +
                                                target.string() + ": " + ec.message());
        }
    }
    if (ec) return Result::Fail(ec.value(), "cannot read " + src_dir.string() + ": " + ec.message());
    return Result::Ok();
}

} // namespace

std::expected<std::vector<std::string>, std::string> ParseBranchNames(std::string_view body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) return std::unexpected("invalid JSON in branch listing");
    if (!j.is_array()) return std::unexpected("branch listing is not an array");

    std::vector<std::string> names;
    for (const auto& b : j) {
        if (!b.is_object()) continue;
        auto it = b.find("name");
        if (it != b.end() && it->is_string() && !it->get<std::string>().empty()) {
            names.push_back(it->get<std::string>());
        }
    }
    return names;
}

Result WriteReleaseMarker(const fs::path& path, const ReleaseInfo& info) {
    nlohmann::json j = {
        {"branch", info.branch},
        {"archive_sha256", info.archive_sha256},
        {"installed_at", info.installed_at},
    };
    return WriteFileAtomic(path.string(), j.dump(2) + "\n", 0644);
}

std::expected<ReleaseInfo, std::string> ReadReleaseMarker(const fs::path& path) {
    std::string text;
    if (auto r = ReadFileToString(path.string(), text); !r.is_ok()) return std::unexpected(r.msg);

    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::unexpected("invalid release marker " + path.string());

    ReleaseInfo info;
    info.branch = j.value("branch", std::string{});
    info.archive_sha256 = j.value("archive_sha256", std::string{});
    info.installed_at = j.value("installed_at", std::string{});
    if (info.branch.empty()) return std::unexpected("release marker without branch: " + path.string());
    return info;
}

ReleaseFetcher::ReleaseFetcher(IHttpClient& http, IDecisionSource& decisions, Options opt)
    : http_(http), decisions_(decisions), opt_(std::move(opt)) {}

std::string ReleaseFetcher::BranchesUrl() const {
    return "https://api.github.com/repos/" + opt_.owner + "/" + opt_.repo + "/branches";
}

std::string ReleaseFetcher::ArchiveUrl(const std::string& ref) const {
    return "https://github.com/" + opt_.owner + "/" + opt_.repo + "/archive/" + ref + ".tar.gz";
}

std::expected<std::vector<std::string>, std::string> ReleaseFetcher::ListBranches() {
    auto resp = http_.Send(HttpRequest{.method = HttpMethod::Get,
                                       .url = BranchesUrl(),
                                       .body = {},
                                       .headers = {"Accept: application/vnd.github+json"},
                                       .timeouts = opt_.api_timeouts});
    if (!resp) return std::unexpected(resp.error());
    if (!resp->IsSuccess()) return std::unexpected("HTTP " + std::to_string(resp->status));
    return ParseBranchNames(resp->body);
}

std::string ReleaseFetcher::SelectBranch() {
    LogStep("Selecting the branch");
    LogInfo("Fetching available branches...");

    auto branches = ListBranches();
    if (!branches) {
        LogWarn("Cannot list branches (%s), using '%s'", branches.error().c_str(), opt_.default_branch.c_str());
        return opt_.default_branch;
    }
    if (branches->empty()) {
        LogWarn("No branch found, using '%s'", opt_.default_branch.c_str());
        return opt_.default_branch;
    }

    const auto it = std::find(branches->begin(), branches->end(), opt_.default_branch);
    const std::size_t default_index = static_cast<std::size_t>(it - branches->begin());

    auto choice = decisions_.Choose("Available branches:", *branches, default_index);
    std::string selected;
    if (!choice) {
        LogWarn("Invalid choice, using '%s'", opt_.default_branch.c_str());
        selected = opt_.default_branch;
    } else {
        selected = (*branches)[*choice];
    }
    LogSuccess("Selected branch: %s", selected.c_str());
    return selected;
}

Result ReleaseFetcher::Fetch(const std::string& ref, const InstallationLayout& layout, bool preserve_config,
                             ReleaseInfo& out) {
    LogStep("Downloading the source (ref: %s)", ref.c_str());

    ScratchDir scratch;
    if (auto r = ScratchDir::Create(opt_.scratch_base, "motion-deploy-src-", scratch); !r.is_ok()) return r;

    const fs::path archive = scratch.Path() / "source.tar.gz";
    const std::string url = ArchiveUrl(ref);
    LogInfo("Downloading from: %s", url.c_str());
    if (auto r = http_.Download(url, archive.string(), opt_.download_timeouts); !r.is_ok()) {
        return Result::Fail(ErrorKind::Fatal, r.msg, "check that the branch or tag '" + ref + "' exists");
    }

    auto digest = Sha256OfFile(archive.string());
    if (!digest) return Result::Fail(ErrorKind::Fatal, digest.error());
    LogInfo("Archive sha256: %s", digest->c_str());

    LogInfo("Extracting the archive...");
    const fs::path extract_dir = scratch.Path() / "extract";
    std::error_code ec;
    fs::create_directories(extract_dir, ec);
    if (ec) return Result::Fail(ec.value(), "cannot create " + extract_dir.string() + ": " + ec.message());

    FileSource reader;
    if (auto r = FileSource::Open(archive.string(), reader); !r.is_ok()) return r;

    ExtractStats stats;
    if (auto r = ArchiveExtractor{}.ExtractToDir(reader, extract_dir.string(), "source", &stats); !r.is_ok()) {
        return Result::Fail(ErrorKind::Fatal, "extraction failed: " + r.msg);
    }

    if (stats.top_level.size() != 1) {
        return Result::Fail(ErrorKind::Fatal,
                            "expected a single top-level directory in the archive, found " +
                                std::to_string(stats.top_level.size()));
    }
    const fs::path top = extract_dir / *stats.top_level.begin();
    if (!fs::is_directory(top, ec)) {
        return Result::Fail(ErrorKind::Fatal, "archive top-level entry is not a directory: " + top.filename().string());
    }
    for (const char* sub : InstallationLayout::kCodeSubpaths) {
        if (!fs::is_directory(top / sub, ec)) {
            return Result::Fail(ErrorKind::Fatal, std::string("archive lacks required subpath '") + sub + "'",
                                "the ref '" + ref + "' does not contain a deployable service");
        }
    }

    LogInfo("Copying files to %s...", layout.root.c_str());
    if (auto r = CopyTree(top, layout.root, preserve_config); !r.is_ok()) return r;

    out = ReleaseInfo{.branch = ref, .archive_sha256 = *digest, .installed_at = UtcNowIso8601()};
    LogSuccess("Source downloaded and extracted (%llu entries)", (unsigned long long)stats.entries);
    return Result::Ok();
}

} // namespace mdeploy
