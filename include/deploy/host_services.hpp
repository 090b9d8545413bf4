#pragma once

#include "deploy/environment_prober.hpp"
#include "deploy/identity_provisioner.hpp"
#include "deploy/media_relay.hpp"
#include "net/http_client.hpp"
#include "system/command_runner.hpp"
#include "system/decision_source.hpp"
#include "system/port_registry.hpp"
#include "system/service_manager.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace mdeploy {

// Every host-facing collaborator a deployment run touches. main() wires the
// real implementations; tests wire fakes.
struct HostServices {
    ICommandRunner& runner;
    IServiceManager& services;
    IPortRegistry& ports;
    IHttpClient& http;
    IDecisionSource& decisions;

    // nullptr selects the POSIX implementation.
    std::shared_ptr<const IdentityProvisioner::ISystemOps> identity_ops;
    std::shared_ptr<const EnvironmentProber::ISystemOps> probe_ops;

    PortReleaser::Sleeper sleeper;
    PortReleaser::Policy port_policy;

    std::filesystem::path scratch_base = "/tmp";
    MediaRelay::Paths relay_paths;
    std::string probe_url = kRepositoryHostProbeUrl;
};

} // namespace mdeploy
