#include "deploy/identity_provisioner.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

constexpr const char* kNoLoginShell = "/usr/sbin/nologin";
constexpr const char* kAccountComment = "Motion Frontend Service";

class PosixIdentityOps final : public IdentityProvisioner::ISystemOps {
  public:
    explicit PosixIdentityOps(ICommandRunner& runner) : runner_(runner) {}

    bool UserExists(const std::string& user) const override {
        return ::getpwnam(user.c_str()) != nullptr;
    }

    bool GroupExists(const std::string& group) const override {
        return ::getgrnam(group.c_str()) != nullptr;
    }

    std::vector<std::string> GroupsOf(const std::string& user) const override {
        const struct passwd* pw = ::getpwnam(user.c_str());
        if (!pw) return {};

        int n = 64;
        std::vector<gid_t> gids(static_cast<size_t>(n));
        if (::getgrouplist(user.c_str(), pw->pw_gid, gids.data(), &n) < 0) {
            gids.resize(static_cast<size_t>(n));
            if (::getgrouplist(user.c_str(), pw->pw_gid, gids.data(), &n) < 0) return {};
        }
        gids.resize(static_cast<size_t>(n));

        std::vector<std::string> names;
        for (gid_t g : gids) {
            if (const struct group* gr = ::getgrgid(g)) names.emplace_back(gr->gr_name);
        }
        return names;
    }

    Result CreateGroup(const std::string& group) const override {
        return RunTool({"groupadd", "--system", group}, "groupadd");
    }

    Result CreateUser(const std::string& user, const std::string& group, const std::string& home) const override {
        return RunTool({"useradd", "--system", "--gid", group, "--home-dir", home, "--shell", kNoLoginShell,
                        "--comment", kAccountComment, user},
                       "useradd");
    }

    Result AddToGroup(const std::string& user, const std::string& group) const override {
        return RunTool({"usermod", "-aG", group, user}, "usermod");
    }

    Result DeleteUser(const std::string& user) const override {
        return RunTool({"userdel", user}, "userdel");
    }

    Result DeleteGroup(const std::string& group) const override {
        return RunTool({"groupdel", group}, "groupdel");
    }

    Result ChangeOwner(const fs::path& path, const std::string& user, const std::string& group) const override {
        const struct passwd* pw = ::getpwnam(user.c_str());
        if (!pw) return Result::Fail(-1, "unknown user: " + user);
        const uid_t uid = pw->pw_uid;
        const struct group* gr = ::getgrnam(group.c_str());
        if (!gr) return Result::Fail(-1, "unknown group: " + group);
        if (::lchown(path.c_str(), uid, gr->gr_gid) != 0) {
            const int err = errno;
            return Result::Fail(err, "chown " + path.string() + ": " + std::strerror(err));
        }
        return Result::Ok();
    }

    std::optional<std::string> OwnerName(const fs::path& path) const override {
        struct stat st{};
        if (::lstat(path.c_str(), &st) != 0) return std::nullopt;
        if (const struct passwd* pw = ::getpwuid(st.st_uid)) return std::string(pw->pw_name);
        return std::to_string(st.st_uid);
    }

  private:
    Result RunTool(const std::vector<std::string>& argv, const char* what) const {
        auto r = runner_.Run(argv);
        if (!r.Succeeded()) {
            return Result::Fail(r.exit_code, std::string(what) + " failed: " +
                                                  (r.started ? r.output : r.error));
        }
        return Result::Ok();
    }

    ICommandRunner& runner_;
};

mode_t ModeOf(const fs::path& p) {
    std::error_code ec;
    const auto st = fs::symlink_status(p, ec);
    if (ec) return 0;
    return static_cast<mode_t>(st.permissions() & fs::perms::mask);
}

std::string Octal(mode_t m) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04o", static_cast<unsigned>(m));
    return buf;
}

Result SetMode(const fs::path& p, mode_t mode) {
    std::error_code ec;
    fs::permissions(p, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
    if (ec) return Result::Fail(ec.value(), "chmod " + p.string() + ": " + ec.message());
    return Result::Ok();
}

// Applies `dir_mode`/`file_mode` to `top` and everything below it, symlinks
// excepted. Stops at the first failure.
Result SetModeTree(const fs::path& top, mode_t dir_mode, mode_t file_mode) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(top, ec))) return Result::Ok();
    if (auto r = SetMode(top, dir_mode); !r.is_ok()) return r;

    for (auto it = fs::recursive_directory_iterator(top, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        const auto st = it->symlink_status(ec);
        if (ec) break;
        if (fs::is_symlink(st)) continue;
        const mode_t m = fs::is_directory(st) ? dir_mode : file_mode;
        if (auto r = SetMode(it->path(), m); !r.is_ok()) return r;
    }
    if (ec) return Result::Fail(ec.value(), "walking " + top.string() + ": " + ec.message());
    return Result::Ok();
}

Result MakeDir(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    if (ec) return Result::Fail(ec.value(), "cannot create " + p.string() + ": " + ec.message());
    return Result::Ok();
}

} // namespace

std::shared_ptr<const IdentityProvisioner::ISystemOps> IdentityProvisioner::MakePosixSystemOps(ICommandRunner& runner) {
    return std::make_shared<PosixIdentityOps>(runner);
}

IdentityProvisioner::IdentityProvisioner(Identity identity, std::shared_ptr<const ISystemOps> system_ops)
    : identity_(std::move(identity)), ops_(std::move(system_ops)) {}

std::vector<std::string> IdentityProvisioner::MissingMemberships() const {
    const auto have = ops_->GroupsOf(identity_.user);
    std::vector<std::string> missing;
    for (const auto& g : identity_.supplementary) {
        if (!ops_->GroupExists(g)) continue;
        if (std::find(have.begin(), have.end(), g) == have.end()) missing.push_back(g);
    }
    return missing;
}

Result IdentityProvisioner::AddMembership(const std::string& group) const {
    LogInfo("Adding '%s' to group '%s'...", identity_.user.c_str(), group.c_str());
    return ops_->AddToGroup(identity_.user, group);
}

Result IdentityProvisioner::EnsureIdentity() const {
    LogStep("Configuring the service account");

    if (!ops_->GroupExists(identity_.group)) {
        LogInfo("Creating group '%s'...", identity_.group.c_str());
        if (auto r = ops_->CreateGroup(identity_.group); !r.is_ok()) return r;
    } else {
        LogInfo("Group '%s' already exists", identity_.group.c_str());
    }

    if (!ops_->UserExists(identity_.user)) {
        LogInfo("Creating user '%s'...", identity_.user.c_str());
        if (auto r = ops_->CreateUser(identity_.user, identity_.group, identity_.home); !r.is_ok()) {
            return r;
        }
    } else {
        LogInfo("User '%s' already exists", identity_.user.c_str());
    }

    for (const auto& g : MissingMemberships()) {
        if (auto r = AddMembership(g); !r.is_ok()) return r;
    }

    LogSuccess("Service account configured");
    return Result::Ok();
}

Result IdentityProvisioner::EnsureLayout(const InstallationLayout& layout) const {
    for (const auto& p : {layout.root, layout.LogsDir(), layout.ConfigDir(), layout.host_log_dir}) {
        if (auto r = MakeDir(p); !r.is_ok()) return r;
    }
    return Result::Ok();
}

Result IdentityProvisioner::AdoptPath(const fs::path& path, mode_t mode) const {
    if (auto r = ops_->ChangeOwner(path, identity_.user, identity_.group); !r.is_ok()) return r;
    return SetMode(path, mode);
}

Result IdentityProvisioner::ChownTree(const fs::path& top) const {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(top, ec))) return Result::Ok();
    if (auto r = ops_->ChangeOwner(top, identity_.user, identity_.group); !r.is_ok()) return r;

    for (auto it = fs::recursive_directory_iterator(top, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (auto r = ops_->ChangeOwner(it->path(), identity_.user, identity_.group); !r.is_ok()) return r;
    }
    if (ec) return Result::Fail(ec.value(), "walking " + top.string() + ": " + ec.message());
    return Result::Ok();
}

Result IdentityProvisioner::NormalizePermissions(const InstallationLayout& layout) const {
    LogStep("Setting ownership and permissions");

    if (auto r = ChownTree(layout.root); !r.is_ok()) return r;
    if (auto r = ChownTree(layout.host_log_dir); !r.is_ok()) return r;

    // Code subtree first; config and logs are then narrowed or reasserted.
    if (auto r = SetModeTree(layout.root, InstallationLayout::kCodeMode, InstallationLayout::kCodeMode); !r.is_ok()) {
        return r;
    }
    if (auto r = SetModeTree(layout.ConfigDir(), InstallationLayout::kConfigDirMode,
                             InstallationLayout::kConfigFileMode);
        !r.is_ok()) {
        return r;
    }
    if (auto r = NormalizeLogDirs(layout); !r.is_ok()) return r;

    std::error_code ec;
    for (const auto& e : fs::directory_iterator(layout.ScriptsDir(), ec)) {
        if (e.path().extension() == ".sh" && e.is_regular_file()) {
            if (auto r = SetMode(e.path(), InstallationLayout::kCodeMode); !r.is_ok()) return r;
        }
    }

    LogSuccess("Permissions configured");
    return Result::Ok();
}

void IdentityProvisioner::CheckEntry(const fs::path& p, mode_t mode, std::vector<std::string>& drift) const {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(p, ec))) return;

    const auto owner = ops_->OwnerName(p);
    if (!owner || *owner != identity_.user) {
        drift.push_back("owner of " + p.string() + " is " + owner.value_or("unknown") + " (expected " +
                        identity_.user + ")");
    }
    const mode_t have = ModeOf(p);
    if (have != mode) {
        drift.push_back("mode of " + p.string() + " is " + Octal(have) + " (expected " + Octal(mode) + ")");
    }
}

std::vector<std::string> IdentityProvisioner::InspectPermissions(const InstallationLayout& layout) const {
    std::vector<std::string> drift;
    std::error_code ec;
    if (!fs::is_directory(layout.root, ec)) return drift;

    CheckEntry(layout.root, InstallationLayout::kCodeMode, drift);
    for (const char* sub : InstallationLayout::kCodeSubpaths) {
        CheckEntry(layout.root / sub, InstallationLayout::kCodeMode, drift);
    }
    CheckEntry(layout.ConfigDir(), InstallationLayout::kConfigDirMode, drift);
    for (const auto& e : fs::directory_iterator(layout.ConfigDir(), ec)) {
        if (e.is_regular_file()) CheckEntry(e.path(), InstallationLayout::kConfigFileMode, drift);
    }
    return drift;
}

Result IdentityProvisioner::NormalizeLogDirs(const InstallationLayout& layout) const {
    for (const auto& dir : {layout.LogsDir(), layout.host_log_dir}) {
        if (auto r = MakeDir(dir); !r.is_ok()) return r;
        if (auto r = ChownTree(dir); !r.is_ok()) return r;
        if (auto r = SetModeTree(dir, InstallationLayout::kLogsMode, InstallationLayout::kLogsMode); !r.is_ok()) {
            return r;
        }
    }
    return Result::Ok();
}

std::vector<std::string> IdentityProvisioner::InspectLogDirs(const InstallationLayout& layout) const {
    std::vector<std::string> drift;
    std::error_code ec;
    for (const auto& dir : {layout.LogsDir(), layout.host_log_dir}) {
        if (!fs::is_directory(dir, ec)) {
            drift.push_back("missing log directory " + dir.string());
            continue;
        }
        CheckEntry(dir, InstallationLayout::kLogsMode, drift);
    }
    return drift;
}

Result IdentityProvisioner::RemoveUser() const {
    if (!ops_->UserExists(identity_.user)) return Result::Ok();
    return ops_->DeleteUser(identity_.user);
}

Result IdentityProvisioner::RemoveGroup() const {
    if (!ops_->GroupExists(identity_.group)) return Result::Ok();
    return ops_->DeleteGroup(identity_.group);
}

} // namespace mdeploy
