#pragma once

#include "deploy/installation.hpp"
#include "system/command_runner.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mdeploy {

// Manifest entries, comments and blank lines dropped.
std::vector<std::string> ParseRequirements(std::string_view text);

// OS packages and the isolated Python runtime. Package and library
// failures degrade the run; only a runtime that cannot be created stops it.
class DependencyProvisioner {
  public:
    struct Report {
        bool os_packages_ok = true;
        bool bulk_install_ok = true;
        std::vector<std::string> failed_entries;
        bool streaming_enabled = false;
    };

    DependencyProvisioner(ICommandRunner& runner, std::vector<std::string> apt_packages)
        : runner_(runner), apt_packages_(std::move(apt_packages)) {}

    Result InstallOsPackages();

    Result CreateRuntime(const InstallationLayout& layout);
    Result InstallRequirements(const InstallationLayout& layout, Report& report);
    bool ProbeStreamingCapability(const InstallationLayout& layout);

    // Create (or refresh) the runtime, upgrade packaging tools, install the
    // manifest and probe capabilities.
    Result ProvisionRuntime(const InstallationLayout& layout, Report& report);

    // Removes the runtime directory before provisioning it again.
    Result RecreateRuntime(const InstallationLayout& layout, Report& report);

    bool RuntimePresent(const InstallationLayout& layout) const;
    bool InterpreterWorks(const InstallationLayout& layout);

    // `pip check`.
    Result CheckHealth(const InstallationLayout& layout);
    Result ReinstallRequirements(const InstallationLayout& layout);

  private:
    ICommandRunner& runner_;
    std::vector<std::string> apt_packages_;
};

} // namespace mdeploy
