#pragma once

#include "deploy/dependency_provisioner.hpp"
#include "deploy/deploy_context.hpp"
#include "deploy/environment_prober.hpp"
#include "deploy/host_services.hpp"
#include "deploy/identity_provisioner.hpp"
#include "deploy/media_relay.hpp"
#include "deploy/reconciler.hpp"
#include "deploy/release_fetcher.hpp"
#include "deploy/teardown.hpp"
#include "deploy/unit_manager.hpp"
#include "net/activation_client.hpp"
#include "util/result.hpp"

#include <string>

namespace mdeploy {

// The five top-level actions, composed from the components in phase order.
// The context is final once this object is built.
class DeployActions {
  public:
    DeployActions(DeployContext& ctx, HostServices& host);

    // Dispatches on ctx.action.
    Result Run();

    Result Install();
    Result Update();
    Result Uninstall(TeardownManager::Outcome* outcome = nullptr);
    Result Repair(RepairReport* report = nullptr);
    Result RefreshUnit();

  private:
    // Fetch, provision, activate, configure and start. Assumes preflight
    // passed and the root is free.
    Result InstallPhases(bool activate);

    Result ResolveInstallRef();
    Result CollectCredentials();
    Result ActivateDevice();
    Result WriteRuntimeConfig();

    MediaRelay* Relay();
    std::string Machine() const;
    Result RemoveRoot();

    void PrintPlan() const;
    void PrintPhases() const;
    void PrintSummary();

    DeployContext& ctx_;
    HostServices& host_;
    InstallationLayout layout_;

    EnvironmentProber prober_;
    ReleaseFetcher fetcher_;
    DependencyProvisioner deps_;
    IdentityProvisioner identity_;
    PortReleaser releaser_;
    UnitManager units_;
    MediaRelay relay_;
    ActivationClient activation_;

    EnvironmentProber::Report probe_;
    DependencyProvisioner::Report dep_report_;
    ReleaseInfo release_;
};

} // namespace mdeploy
