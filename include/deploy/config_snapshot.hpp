#pragma once

#include "util/result.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <string>

namespace mdeploy {

inline constexpr const char* kSnapshotManifestName = "SHA256SUMS";

// Point-in-time copy of a configuration directory with a digest manifest.
// The copy stays on disk until Consume() is called.
class ConfigSnapshot {
  public:
    // Copies `config_dir` into "<backup_base>/<prefix>-config-backup-<YYYYmmddHHMMSS>".
    static std::expected<ConfigSnapshot, std::string> Capture(const std::filesystem::path& config_dir,
                                                              const std::filesystem::path& backup_base,
                                                              const std::string& prefix);

    // Reopens an existing snapshot directory from its manifest.
    static std::expected<ConfigSnapshot, std::string> Open(const std::filesystem::path& dir);

    // Snapshot files still match the manifest.
    Result Verify() const;

    // Copies the snapshot over `config_dir`, then checks the restored files
    // against the manifest.
    Result RestoreTo(const std::filesystem::path& config_dir) const;

    // Removes the snapshot directory.
    Result Consume();

    const std::filesystem::path& Dir() const { return dir_; }
    std::size_t FileCount() const { return manifest_.size(); }
    bool Consumed() const { return consumed_; }

  private:
    Result VerifyTree(const std::filesystem::path& base) const;

    std::filesystem::path dir_;
    // relative path -> sha256
    std::map<std::string, std::string> manifest_;
    bool consumed_ = false;
};

} // namespace mdeploy
