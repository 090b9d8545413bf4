#include "deploy/config_snapshot.hpp"

#include "crypto/sha256.hpp"
#include "io/atomic_file.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <ctime>
#include <sstream>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

std::string Timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &tm);
    return buf;
}

std::string RenderManifest(const std::map<std::string, std::string>& m) {
    std::string out;
    for (const auto& [rel, digest] : m) out += digest + "  " + rel + "\n";
    return out;
}

std::expected<std::map<std::string, std::string>, std::string> ParseManifest(const std::string& text) {
    std::map<std::string, std::string> m;
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line)) {
        if (line.empty()) continue;
        const auto sep = line.find("  ");
        if (sep != 64) return std::unexpected("malformed manifest line: " + line);
        m.emplace(line.substr(sep + 2), line.substr(0, sep));
    }
    return m;
}

} // namespace

std::expected<ConfigSnapshot, std::string> ConfigSnapshot::Capture(const fs::path& config_dir,
                                                                   const fs::path& backup_base,
                                                                   const std::string& prefix) {
    std::error_code ec;
    if (!fs::is_directory(config_dir, ec)) {
        return std::unexpected("configuration directory not found: " + config_dir.string());
    }
    fs::create_directories(backup_base, ec);
    if (ec) return std::unexpected("cannot create " + backup_base.string() + ": " + ec.message());

    const std::string stem = prefix + "-config-backup-" + Timestamp();
    fs::path dir = backup_base / stem;
    for (int n = 1; fs::exists(dir, ec); ++n) {
        dir = backup_base / (stem + "-" + std::to_string(n));
    }

    fs::copy(config_dir, dir, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove_all(dir, ignored);
        return std::unexpected("cannot copy " + config_dir.string() + " to " + dir.string() + ": " + ec.message());
    }

    ConfigSnapshot snap;
    snap.dir_ = dir;
    for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        auto digest = Sha256OfFile(it->path().string());
        if (!digest) return std::unexpected(digest.error());
        snap.manifest_.emplace(fs::relative(it->path(), dir).generic_string(), *digest);
    }
    if (ec) return std::unexpected("walking " + dir.string() + ": " + ec.message());

    if (auto r = WriteFileAtomic((dir / kSnapshotManifestName).string(), RenderManifest(snap.manifest_), 0600);
        !r.is_ok()) {
        return std::unexpected(r.msg);
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);

    LogInfo("Configuration saved to: %s (%zu files)", dir.c_str(), snap.manifest_.size());
    return snap;
}

std::expected<ConfigSnapshot, std::string> ConfigSnapshot::Open(const fs::path& dir) {
    std::string text;
    if (auto r = ReadFileToString((dir / kSnapshotManifestName).string(), text); !r.is_ok()) {
        return std::unexpected(r.msg);
    }
    auto manifest = ParseManifest(text);
    if (!manifest) return std::unexpected(manifest.error());

    ConfigSnapshot snap;
    snap.dir_ = dir;
    snap.manifest_ = std::move(*manifest);
    return snap;
}

Result ConfigSnapshot::VerifyTree(const fs::path& base) const {
    for (const auto& [rel, want] : manifest_) {
        auto have = Sha256OfFile((base / rel).string());
        if (!have) return Result::Fail(-1, have.error());
        if (*have != want) {
            return Result::Fail(-1, "digest mismatch for " + (base / rel).string());
        }
    }
    return Result::Ok();
}

Result ConfigSnapshot::Verify() const {
    if (consumed_) return Result::Fail(-1, "snapshot already consumed: " + dir_.string());
    return VerifyTree(dir_);
}

Result ConfigSnapshot::RestoreTo(const fs::path& config_dir) const {
    if (auto r = Verify(); !r.is_ok()) return r;

    std::error_code ec;
    fs::create_directories(config_dir, ec);
    if (ec) return Result::Fail(ec.value(), "cannot create " + config_dir.string() + ": " + ec.message());

    const auto opts = fs::copy_options::recursive | fs::copy_options::overwrite_existing |
                      fs::copy_options::copy_symlinks;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (entry.path().filename() == kSnapshotManifestName) continue;
        fs::copy(entry.path(), config_dir / entry.path().filename(), opts, ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot restore " + entry.path().string() + ": " + ec.message());
        }
    }
    if (ec) return Result::Fail(ec.value(), "cannot read " + dir_.string() + ": " + ec.message());

    if (auto r = VerifyTree(config_dir); !r.is_ok()) {
        return Result::Fail(ErrorKind::Fatal, "restored configuration does not match the snapshot: " + r.msg,
                            "the snapshot is kept in " + dir_.string());
    }
    LogInfo("Configuration restored from %s", dir_.c_str());
    return Result::Ok();
}

Result ConfigSnapshot::Consume() {
    if (consumed_) return Result::Ok();
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) return Result::Fail(ec.value(), "cannot remove " + dir_.string() + ": " + ec.message());
    consumed_ = true;
    return Result::Ok();
}

} // namespace mdeploy
