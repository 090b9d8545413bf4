#pragma once

#include "deploy/installation.hpp"
#include "net/activation_client.hpp"
#include "util/tool_config.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace mdeploy {

enum class DeployAction { Install, Update, Uninstall, Repair, RefreshUnit };

const char* ToString(DeployAction action);
// Accepts the action names and "update-service" for refresh-unit.
std::optional<DeployAction> ParseDeployAction(std::string_view name);

// Everything a run needs, threaded through every phase.
struct DeployContext {
    DeployAction action = DeployAction::Install;
    ToolConfig config;

    // Explicit --ref; empty means default branch or interactive selection.
    std::string ref;
    bool select_branch = false;
    // Resolved by the fetch phase.
    std::string branch;

    DeviceCredential credential;
    bool skip_activation = false;
    bool activation_validated = false;

    bool dry_run = false;
    bool assume_yes = false;

    InstallationLayout Layout() const {
        return InstallationLayout{.root = config.install_root, .host_log_dir = config.host_log_dir};
    }
};

} // namespace mdeploy
