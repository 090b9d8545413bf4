#pragma once

#include "deploy/identity_provisioner.hpp"
#include "deploy/installation.hpp"
#include "deploy/media_relay.hpp"
#include "deploy/unit_manager.hpp"
#include "system/decision_source.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace mdeploy {

// Reverses provisioning. Declining to remove the configuration keeps a
// timestamped snapshot of it under the backup directory.
class TeardownManager {
  public:
    struct Options {
        std::filesystem::path backup_dir = "/var/backups";
        std::string snapshot_prefix = "motion-frontend";
    };

    struct Outcome {
        bool unit_removed = false;
        bool root_removed = false;
        bool host_logs_removed = false;
        // Set when the configuration was preserved.
        std::optional<std::filesystem::path> config_backup;
        bool user_removed = false;
        bool group_removed = false;
        bool relay_removed = false;
    };

    TeardownManager(InstallationLayout layout, UnitManager& units, IdentityProvisioner& identity,
                    MediaRelay* relay, IDecisionSource& decisions, Options opt);

    Result Run(Outcome* outcome = nullptr);

  private:
    Result RemoveTree(const std::filesystem::path& p, bool& removed) const;

    InstallationLayout layout_;
    UnitManager& units_;
    IdentityProvisioner& identity_;
    MediaRelay* relay_;
    IDecisionSource& decisions_;
    Options opt_;
};

} // namespace mdeploy
