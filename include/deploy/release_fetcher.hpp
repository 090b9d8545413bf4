#pragma once

#include "deploy/installation.hpp"
#include "net/http_client.hpp"
#include "system/decision_source.hpp"
#include "util/result.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mdeploy {

// What was deployed, recorded in the release marker.
struct ReleaseInfo {
    std::string branch;
    std::string archive_sha256;
    std::string installed_at;  // ISO-8601 UTC
};

std::expected<std::vector<std::string>, std::string> ParseBranchNames(std::string_view body);

Result WriteReleaseMarker(const std::filesystem::path& path, const ReleaseInfo& info);
std::expected<ReleaseInfo, std::string> ReadReleaseMarker(const std::filesystem::path& path);

class ReleaseFetcher {
  public:
    struct Options {
        std::string owner;
        std::string repo;
        std::string default_branch = "main";
        std::filesystem::path scratch_base = "/tmp";
        HttpTimeouts api_timeouts = kApiTimeouts;
        HttpTimeouts download_timeouts = kDownloadTimeouts;
    };

    ReleaseFetcher(IHttpClient& http, IDecisionSource& decisions, Options opt);

    std::string BranchesUrl() const;
    std::string ArchiveUrl(const std::string& ref) const;

    std::expected<std::vector<std::string>, std::string> ListBranches();

    // Numbered menu of remote branches. Falls back to the default branch
    // (warning only) when listing fails or the answer is invalid.
    std::string SelectBranch();

    // Downloads and extracts `ref` in scratch space, checks its shape, then
    // copies it over `layout.root`. With `preserve_config` the archive's
    // config subpath is never copied.
    Result Fetch(const std::string& ref, const InstallationLayout& layout, bool preserve_config,
                 ReleaseInfo& out);

  private:
    IHttpClient& http_;
    IDecisionSource& decisions_;
    Options opt_;
};

} // namespace mdeploy
