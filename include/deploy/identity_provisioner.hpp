#pragma once

#include "deploy/installation.hpp"
#include "system/command_runner.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mdeploy {

// Service account, group memberships, directory tree and the ownership and
// permission layout over it. Every operation is idempotent.
class IdentityProvisioner {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;

        virtual bool UserExists(const std::string& user) const = 0;
        virtual bool GroupExists(const std::string& group) const = 0;
        // Names of every group the user belongs to, primary included.
        virtual std::vector<std::string> GroupsOf(const std::string& user) const = 0;

        virtual Result CreateGroup(const std::string& group) const = 0;
        virtual Result CreateUser(const std::string& user, const std::string& group,
                                  const std::string& home) const = 0;
        virtual Result AddToGroup(const std::string& user, const std::string& group) const = 0;
        virtual Result DeleteUser(const std::string& user) const = 0;
        virtual Result DeleteGroup(const std::string& group) const = 0;

        // Does not follow symlinks.
        virtual Result ChangeOwner(const std::filesystem::path& path, const std::string& user,
                                   const std::string& group) const = 0;
        virtual std::optional<std::string> OwnerName(const std::filesystem::path& path) const = 0;
    };

    struct Identity {
        std::string user;
        std::string group;
        // Home directory of the account: the installation root.
        std::string home;
        std::vector<std::string> supplementary{"video", "audio", "gpio", "i2c", "spi"};
    };

    IdentityProvisioner(Identity identity, std::shared_ptr<const ISystemOps> system_ops);

    // getpwnam/getgrnam lookups; account changes through useradd and friends.
    static std::shared_ptr<const ISystemOps> MakePosixSystemOps(ICommandRunner& runner);

    Result EnsureIdentity() const;
    bool UserExists() const { return ops_->UserExists(identity_.user); }
    bool GroupExists() const { return ops_->GroupExists(identity_.group); }

    // Required memberships the account lacks. Groups absent from the host
    // are not required.
    std::vector<std::string> MissingMemberships() const;
    Result AddMembership(const std::string& group) const;

    Result EnsureLayout(const InstallationLayout& layout) const;
    // Hands one path (not its children) to the account with `mode`.
    Result AdoptPath(const std::filesystem::path& path, mode_t mode) const;

    Result NormalizePermissions(const InstallationLayout& layout) const;
    // Ownership and mode drift over the root, code and config subpaths.
    std::vector<std::string> InspectPermissions(const InstallationLayout& layout) const;

    Result NormalizeLogDirs(const InstallationLayout& layout) const;
    std::vector<std::string> InspectLogDirs(const InstallationLayout& layout) const;

    Result RemoveUser() const;
    Result RemoveGroup() const;

    const Identity& Account() const { return identity_; }

  private:
    Result ChownTree(const std::filesystem::path& top) const;
    void CheckEntry(const std::filesystem::path& p, mode_t mode, std::vector<std::string>& drift) const;

    Identity identity_;
    std::shared_ptr<const ISystemOps> ops_;
};

} // namespace mdeploy
