#pragma once

#include "deploy/unit_descriptor.hpp"
#include "system/port_registry.hpp"
#include "system/service_manager.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mdeploy {

// Owns the service unit file and every start of the service: declared ports
// are freed before each (re)start, and a start is followed by a bounded
// wait for the active state.
class UnitManager {
  public:
    struct Options {
        std::filesystem::path unit_dir = "/etc/systemd/system";
        std::vector<std::uint16_t> ports;
        int active_poll_attempts = 10;
        std::chrono::milliseconds active_poll_interval{1000};
    };

    UnitManager(IServiceManager& services, PortReleaser& releaser, UnitParams params, Options opt,
                PortReleaser::Sleeper sleeper = {});

    const std::string& Name() const { return params_.service_name; }
    std::filesystem::path UnitPath() const;
    std::string JournalHint() const;

    bool UnitPresent() const;
    // Structural differences between the installed unit and the template.
    std::vector<std::string> Drift() const;

    Result WriteUnit();
    Result Install();
    Result Enable();
    Result Stop();
    Result FreePorts();

    Result StartAndWait();
    Result RestartAndWait();

    // Stop, free ports and rewrite an obsolete unit.
    Result Regenerate();
    // Regenerate, enable and start.
    Result Refresh();
    Result Remove();

    bool IsActive() { return services_.IsActive(Name()); }
    bool IsEnabled() { return services_.IsEnabled(Name()); }

  private:
    Result WaitActive();

    IServiceManager& services_;
    PortReleaser& releaser_;
    UnitParams params_;
    Options opt_;
    PortReleaser::Sleeper sleep_;
};

} // namespace mdeploy
