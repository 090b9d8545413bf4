#include "deploy/installation.hpp"
#include "deploy/deploy_context.hpp"

namespace mdeploy {

bool InstallationLayout::HasCode() const {
    std::error_code ec;
    return std::filesystem::is_directory(root / kCodeSubpaths[0], ec);
}

const char* ToString(DeployAction action) {
    switch (action) {
        case DeployAction::Install:     return "install";
        case DeployAction::Update:      return "update";
        case DeployAction::Uninstall:   return "uninstall";
        case DeployAction::Repair:      return "repair";
        case DeployAction::RefreshUnit: return "refresh-unit";
    }
    return "unknown";
}

std::optional<DeployAction> ParseDeployAction(std::string_view name) {
    if (name == "install") return DeployAction::Install;
    if (name == "update") return DeployAction::Update;
    if (name == "uninstall") return DeployAction::Uninstall;
    if (name == "repair") return DeployAction::Repair;
    if (name == "refresh-unit" || name == "update-service") return DeployAction::RefreshUnit;
    return std::nullopt;
}

} // namespace mdeploy
