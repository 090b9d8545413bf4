#include "deploy/deploy_actions.hpp"

#include "deploy/config_snapshot.hpp"
#include "deploy/runtime_config.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cstdio>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

constexpr const char* kRule = "─────────────────────────────────────────────────────────────────────";

// Degraded outcomes are reported and the run continues.
Result Soften(Result r) {
    if (r.is_ok() || r.kind != ErrorKind::Degraded) return r;
    LogWarn("%s", r.msg.c_str());
    if (!r.hint.empty()) LogInfo("%s", r.hint.c_str());
    return Result::Ok();
}

std::string MaskKey(const std::string& key) {
    return key.size() <= 8 ? key : key.substr(0, 8) + "...";
}

HttpTimeouts ApiTimeouts(const ToolConfig& cfg) {
    return HttpTimeouts{kApiTimeouts.connect, std::chrono::seconds{cfg.http_timeout_sec}};
}

ReleaseFetcher::Options FetcherOptions(const ToolConfig& cfg, const HostServices& host) {
    ReleaseFetcher::Options o;
    o.owner = cfg.repo_owner;
    o.repo = cfg.repo_name;
    o.default_branch = cfg.default_branch;
    o.scratch_base = host.scratch_base;
    o.api_timeouts = ApiTimeouts(cfg);
    return o;
}

UnitParams MakeUnitParams(const ToolConfig& cfg) {
    return UnitParams{.service_name = cfg.service_name,
                      .root = cfg.install_root,
                      .user = cfg.service_user,
                      .group = cfg.service_group,
                      .bind_host = cfg.bind_host,
                      .port = cfg.port,
                      .repo_owner = cfg.repo_owner,
                      .repo_name = cfg.repo_name};
}

UnitManager::Options MakeUnitOptions(const ToolConfig& cfg) {
    UnitManager::Options o;
    o.unit_dir = cfg.unit_dir;
    o.ports = cfg.DeclaredPorts();
    return o;
}

MediaRelay::Paths RelayPaths(const ToolConfig& cfg, const HostServices& host) {
    MediaRelay::Paths p = host.relay_paths;
    p.unit_dir = cfg.unit_dir;
    p.scratch_base = host.scratch_base;
    return p;
}

std::shared_ptr<const IdentityProvisioner::ISystemOps> IdentityOps(HostServices& host) {
    return host.identity_ops ? host.identity_ops : IdentityProvisioner::MakePosixSystemOps(host.runner);
}

} // namespace

DeployActions::DeployActions(DeployContext& ctx, HostServices& host)
    : ctx_(ctx),
      host_(host),
      layout_(ctx.Layout()),
      prober_(host.http, host.decisions, host.probe_ops),
      fetcher_(host.http, host.decisions, FetcherOptions(ctx.config, host)),
      deps_(host.runner, ctx.config.apt_packages),
      identity_(IdentityProvisioner::Identity{.user = ctx.config.service_user,
                                              .group = ctx.config.service_group,
                                              .home = ctx.config.install_root},
                IdentityOps(host)),
      releaser_(host.ports, host.port_policy, host.sleeper),
      units_(host.services, releaser_, MakeUnitParams(ctx.config), MakeUnitOptions(ctx.config), host.sleeper),
      relay_(host.http, host.services, RelayPaths(ctx.config, host)),
      activation_(host.http, ApiTimeouts(ctx.config)) {}

Result DeployActions::Run() {
    switch (ctx_.action) {
        case DeployAction::Install:     return Install();
        case DeployAction::Update:      return Update();
        case DeployAction::Uninstall:   return Uninstall();
        case DeployAction::Repair:      return Repair();
        case DeployAction::RefreshUnit: return RefreshUnit();
    }
    return Result::Fail(-1, "unknown action");
}

MediaRelay* DeployActions::Relay() {
    return ctx_.config.media_relay ? &relay_ : nullptr;
}

std::string DeployActions::Machine() const {
    return probe_.arch.empty() ? prober_.SystemOps().Machine() : probe_.arch;
}

Result DeployActions::RemoveRoot() {
    if (!IsSafeRemovalTarget(layout_.root)) {
        return Result::Fail(ErrorKind::Fatal, "refusing to remove " + layout_.root.string(),
                            "set InstallRoot to a dedicated directory");
    }
    std::error_code ec;
    fs::remove_all(layout_.root, ec);
    if (ec) return Result::Fail(ec.value(), "cannot remove " + layout_.root.string() + ": " + ec.message());
    return Result::Ok();
}

Result DeployActions::ResolveInstallRef() {
    if (!ctx_.ref.empty()) {
        ctx_.branch = ctx_.ref;
    } else if (ctx_.select_branch) {
        ctx_.branch = fetcher_.SelectBranch();
    } else {
        ctx_.branch = ctx_.config.default_branch;
    }
    LogInfo("Using branch: %s", ctx_.branch.c_str());
    return Result::Ok();
}

Result DeployActions::CollectCredentials() {
    if (ctx_.skip_activation) {
        LogInfo("Device activation skipped");
        return Result::Ok();
    }

    auto& cred = ctx_.credential;
    if (cred.Empty()) {
        if (!host_.decisions.IsInteractive()) {
            return Result::Fail(ErrorKind::Preflight, "device credentials are required",
                                "pass --device-key and --token, or --skip-activation");
        }
        LogStep("Device activation");
        LogInfo("Activation server: %.*s", (int)kActivationAuthority.size(), kActivationAuthority.data());
        if (!host_.decisions.Confirm("Activate this device now (consumes one activation)?", true)) {
            ctx_.skip_activation = true;
            LogInfo("Device activation skipped, it can be configured later with 'repair'");
            return Result::Ok();
        }
        cred.device_key = host_.decisions.Ask("Device key");
        cred.token_code = host_.decisions.Ask("Token code");
    }

    if (cred.device_key.empty() || cred.token_code.empty()) {
        return Result::Fail(ErrorKind::Preflight, "device key and token code are both required",
                            "pass --device-key and --token, or --skip-activation");
    }
    if (!IsValidDeviceKey(cred.device_key)) {
        return Result::Fail(ErrorKind::Preflight, "malformed device key '" + cred.device_key + "'",
                            "a device key is " + std::string(kDeviceKeyFormat));
    }
    return Result::Ok();
}

Result DeployActions::ActivateDevice() {
    LogStep("Activating the device");
    LogInfo("Device key: %s", ctx_.credential.device_key.c_str());
    LogInfo("Token code: %s***", ctx_.credential.token_code.substr(0, 3).c_str());

    auto receipt = activation_.Activate(ctx_.credential);
    if (!receipt) {
        const auto& f = receipt.error();
        return Result::Fail(ErrorKind::Activation,
                            std::string("activation failed at the ") + ToString(f.step) + " step: " + f.message,
                            f.hint);
    }
    ctx_.activation_validated = true;
    LogSuccess("Device activated");
    if (receipt->tokens_left) LogInfo("Activations remaining: %lld", *receipt->tokens_left);
    return Result::Ok();
}

Result DeployActions::WriteRuntimeConfig() {
    LogStep("Writing the configuration");
    RuntimeConfig rc(layout_.RuntimeConfigFile());

    ActivationSettings settings;
    if (ctx_.activation_validated) {
        settings.server_url = std::string(kActivationAuthority);
        settings.device_key = ctx_.credential.device_key;
        settings.token_code = ctx_.credential.token_code;
    }

    bool created = false;
    if (auto r = rc.EnsureDefault(settings, created); !r.is_ok()) return r;
    if (created) {
        LogSuccess("Default configuration created: %s", rc.Path().c_str());
    } else if (ctx_.activation_validated) {
        if (auto r = rc.WriteActivation(settings); !r.is_ok()) return r;
        LogSuccess("Activation settings written to %s", rc.Path().c_str());
    } else {
        LogInfo("Existing configuration kept: %s", rc.Path().c_str());
    }
    return Result::Ok();
}

Result DeployActions::InstallPhases(bool activate) {
    if (auto r = fetcher_.Fetch(ctx_.branch, layout_, false, release_); !r.is_ok()) return r;

    if (auto r = Soften(deps_.InstallOsPackages()); !r.is_ok()) return r;
    if (auto* relay = Relay()) {
        if (auto r = Soften(relay->Install(Machine())); !r.is_ok()) return r;
    }
    if (auto r = Soften(deps_.ProvisionRuntime(layout_, dep_report_)); !r.is_ok()) return r;

    if (auto r = identity_.EnsureIdentity(); !r.is_ok()) return r;
    if (auto r = identity_.EnsureLayout(layout_); !r.is_ok()) return r;

    if (activate) {
        if (auto r = ActivateDevice(); !r.is_ok()) return r;
    }
    if (auto r = WriteRuntimeConfig(); !r.is_ok()) return r;

    if (auto r = WriteReleaseMarker(layout_.ReleaseMarker(), release_); !r.is_ok()) return r;
    if (auto r = identity_.NormalizePermissions(layout_); !r.is_ok()) return r;

    if (auto r = units_.Install(); !r.is_ok()) return r;
    if (auto r = Soften(units_.StartAndWait()); !r.is_ok()) return r;
    return Result::Ok();
}

Result DeployActions::Install() {
    LogStep("Installing %s", ctx_.config.service_name.c_str());

    if (auto r = prober_.CheckPrivilege(); !r.is_ok()) return r;
    if (auto r = prober_.CheckSystem(probe_); !r.is_ok()) return r;
    if (auto r = prober_.CheckConnectivity(host_.probe_url); !r.is_ok()) return r;

    if (auto r = ResolveInstallRef(); !r.is_ok()) return r;
    if (auto r = CollectCredentials(); !r.is_ok()) return r;

    PrintPlan();
    if (ctx_.dry_run) {
        PrintPhases();
        return Result::Ok();
    }
    if (!host_.decisions.Confirm("Continue with the installation?", true)) {
        return Result::Aborted("installation cancelled");
    }

    std::error_code ec;
    if (fs::exists(layout_.root, ec)) {
        LogWarn("An installation already exists in %s", layout_.root.c_str());
        if (!host_.decisions.Confirm("Remove it and reinstall?", false)) {
            return Result::Aborted("installation cancelled, existing installation kept")
                .WithHint("use 'update' to upgrade it or 'repair' to fix it");
        }
        if (auto r = units_.Stop(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
        if (auto r = RemoveRoot(); !r.is_ok()) return r;
    }

    if (auto r = InstallPhases(!ctx_.skip_activation); !r.is_ok()) return r;
    PrintSummary();
    return Result::Ok();
}

Result DeployActions::Update() {
    LogStep("Updating %s", ctx_.config.service_name.c_str());

    if (auto r = prober_.CheckPrivilege(); !r.is_ok()) return r;
    if (!layout_.HasCode()) {
        return Result::Fail(ErrorKind::Preflight, "no installation found in " + layout_.root.string(),
                            "run: motion-deploy install");
    }
    if (auto r = prober_.CheckSystem(probe_); !r.is_ok()) return r;
    if (auto r = prober_.CheckConnectivity(host_.probe_url); !r.is_ok()) return r;

    auto marker = ReadReleaseMarker(layout_.ReleaseMarker());
    if (marker) LogInfo("Installed branch: %s", marker->branch.c_str());

    if (!ctx_.ref.empty()) {
        ctx_.branch = ctx_.ref;
    } else if (ctx_.select_branch) {
        ctx_.branch = fetcher_.SelectBranch();
    } else if (marker && !marker->branch.empty()) {
        ctx_.branch = marker->branch;
    } else {
        ctx_.branch = ctx_.config.default_branch;
    }
    LogInfo("Updating to branch: %s", ctx_.branch.c_str());

    if (ctx_.dry_run) {
        PrintPhases();
        return Result::Ok();
    }
    if (!host_.decisions.Confirm("Continue with the update?", true)) {
        return Result::Aborted("update cancelled");
    }

    const bool was_active = units_.IsActive();
    if (auto r = units_.Stop(); !r.is_ok()) return r;

    // Brings a stopped service back up after a failed step.
    auto resume = [&](Result r, const char* state) {
        if (!was_active) return r;
        LogInfo("Restarting %s...", ctx_.config.service_name.c_str());
        auto started = units_.StartAndWait();
        if (!started.is_ok()) {
            LogWarn("%s", started.msg.c_str());
            return r;
        }
        const std::string note = std::string("the service was restarted on ") + state;
        r.hint = r.hint.empty() ? note : r.hint + "; " + note;
        return r;
    };

    std::optional<ConfigSnapshot> snapshot;
    std::error_code ec;
    if (fs::is_directory(layout_.ConfigDir(), ec)) {
        LogInfo("Saving the configuration...");
        auto snap = ConfigSnapshot::Capture(layout_.ConfigDir(), ctx_.config.backup_dir, ctx_.config.service_name);
        if (!snap) {
            return resume(Result::Fail(ErrorKind::Fatal, "cannot save the configuration: " + snap.error(),
                                       "nothing was changed; free space under " + ctx_.config.backup_dir +
                                           " and retry"),
                          "the previous code");
        }
        snapshot = std::move(*snap);
        LogInfo("Configuration saved to %s", snapshot->Dir().c_str());
    }

    auto keep_snapshot = [&](Result r) {
        if (snapshot) r.hint = "the previous configuration is kept in " + snapshot->Dir().string();
        return r;
    };

    if (auto r = fetcher_.Fetch(ctx_.branch, layout_, true, release_); !r.is_ok()) {
        return resume(keep_snapshot(r), "the previous code");
    }
    if (auto r = Soften(deps_.ProvisionRuntime(layout_, dep_report_)); !r.is_ok()) {
        return resume(keep_snapshot(r), "the new code with an incomplete runtime");
    }

    if (snapshot) {
        LogInfo("Restoring the configuration...");
        if (auto r = snapshot->RestoreTo(layout_.ConfigDir()); !r.is_ok()) {
            return resume(keep_snapshot(r), "the new code with the configuration as found");
        }
        if (auto r = snapshot->Consume(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    }
    if (auto r = WriteReleaseMarker(layout_.ReleaseMarker(), release_); !r.is_ok()) return r;

    if (auto r = identity_.EnsureLayout(layout_); !r.is_ok()) return r;
    if (auto r = identity_.NormalizePermissions(layout_); !r.is_ok()) return r;

    if (!units_.UnitPresent() || !units_.Drift().empty()) {
        if (auto r = units_.Install(); !r.is_ok()) return r;
    }
    if (auto r = Soften(units_.StartAndWait()); !r.is_ok()) return r;

    LogSuccess("Update to '%s' complete", ctx_.branch.c_str());
    return Result::Ok();
}

Result DeployActions::Uninstall(TeardownManager::Outcome* outcome) {
    if (auto r = prober_.CheckPrivilege(); !r.is_ok()) return r;
    if (ctx_.dry_run) {
        PrintPhases();
        return Result::Ok();
    }
    TeardownManager teardown(layout_, units_, identity_, Relay(), host_.decisions,
                             TeardownManager::Options{.backup_dir = ctx_.config.backup_dir,
                                                      .snapshot_prefix = ctx_.config.service_name});
    return teardown.Run(outcome);
}

Result DeployActions::Repair(RepairReport* report) {
    if (auto r = prober_.CheckPrivilege(); !r.is_ok()) return r;
    if (ctx_.dry_run) LogInfo("Dry run: issues are reported, nothing is changed");

    // The marker lives under the root, which a reinstall removes first.
    auto marker = ReadReleaseMarker(layout_.ReleaseMarker());
    const std::string reinstall_ref =
        !ctx_.ref.empty() ? ctx_.ref
                          : (marker && !marker->branch.empty() ? marker->branch : ctx_.config.default_branch);

    Reconciler::Toolkit tk{.layout = layout_,
                           .identity = identity_,
                           .deps = deps_,
                           .units = units_,
                           .relay = Relay(),
                           .machine = Machine(),
                           .activation = activation_,
                           .decisions = host_.decisions,
                           .supplied = ctx_.credential};
    Reconciler reconciler(tk, Reconciler::Options{.detect_only = ctx_.dry_run,
                                                  .backup_dir = ctx_.config.backup_dir,
                                                  .snapshot_prefix = ctx_.config.service_name});

    auto reinstall = [&]() -> Result {
        if (auto r = prober_.CheckConnectivity(host_.probe_url); !r.is_ok()) return r;
        ctx_.branch = reinstall_ref;
        ctx_.skip_activation = true;
        LogStep("Reinstalling %s (branch: %s)", ctx_.config.service_name.c_str(), ctx_.branch.c_str());
        return InstallPhases(false);
    };
    return reconciler.Run(reinstall, report);
}

Result DeployActions::RefreshUnit() {
    if (auto r = prober_.CheckPrivilege(); !r.is_ok()) return r;
    if (ctx_.dry_run) {
        PrintPhases();
        return Result::Ok();
    }
    if (!layout_.HasCode()) {
        return Result::Fail(ErrorKind::Preflight, "no installation found in " + layout_.root.string(),
                            "run: motion-deploy install");
    }
    return units_.Refresh();
}

void DeployActions::PrintPlan() const {
    const auto& cfg = ctx_.config;
    std::printf("\nThe installation will use the following settings:\n");
    std::printf("  - Branch:    %s\n", ctx_.branch.c_str());
    std::printf("  - Directory: %s\n", layout_.root.c_str());
    std::printf("  - Port:      %u\n", static_cast<unsigned>(cfg.port));
    if (ctx_.skip_activation) {
        std::printf("  - Activation: skipped\n");
    } else {
        std::printf("  - Device key: %s\n", MaskKey(ctx_.credential.device_key).c_str());
    }
    std::printf("\n");
    std::fflush(stdout);
}

void DeployActions::PrintPhases() const {
    std::vector<std::string> phases;
    switch (ctx_.action) {
        case DeployAction::Install:
            phases = {"download and extract '" + ctx_.branch + "' into " + layout_.root.string(),
                      "install system packages",
                      "create the Python environment and install requirements",
                      "create the service account and directories"};
            if (ctx_.config.media_relay) phases.insert(phases.begin() + 2, "install MediaMTX");
            if (!ctx_.skip_activation) phases.push_back("activate the device (consumes one activation)");
            phases.insert(phases.end(), {"write the configuration",
                                         "normalize ownership and permissions",
                                         "install, enable and start " + units_.Name()});
            break;
        case DeployAction::Update:
            phases = {"stop " + units_.Name(),
                      "save the configuration to " + ctx_.config.backup_dir,
                      "download and extract '" + ctx_.branch + "' over " + layout_.root.string(),
                      "refresh the Python environment",
                      "restore the configuration",
                      "normalize ownership and permissions",
                      "start " + units_.Name()};
            break;
        case DeployAction::Uninstall:
            phases = {"stop, disable and remove " + units_.Name(),
                      "save the configuration unless its removal is confirmed",
                      "remove " + layout_.root.string() + " and " + layout_.host_log_dir.string(),
                      "optionally remove the service account and MediaMTX"};
            break;
        case DeployAction::RefreshUnit:
            phases = {"stop " + units_.Name() + " and free its ports",
                      "rewrite " + units_.UnitPath().string(),
                      "enable and start " + units_.Name()};
            break;
        case DeployAction::Repair:
            break;
    }

    LogInfo("Dry run, nothing will be changed. Planned phases for '%s':", ToString(ctx_.action));
    for (std::size_t i = 0; i < phases.size(); ++i) {
        LogInfo("  %zu. %s", i + 1, phases[i].c_str());
    }
}

void DeployActions::PrintSummary() {
    std::string ip;
    auto out = host_.runner.Run({"hostname", "-I"});
    if (out.Succeeded()) {
        std::istringstream iss(out.output);
        iss >> ip;
    }

    const auto& cfg = ctx_.config;
    const auto& name = units_.Name();
    std::printf("\n%s\n  Installation complete\n%s\n\n", kRule, kRule);
    std::printf("  Installation directory : %s\n", layout_.root.c_str());
    std::printf("  Configuration          : %s\n", layout_.ConfigDir().c_str());
    std::printf("  Logs                   : %s\n", layout_.host_log_dir.c_str());
    std::printf("  Installed branch       : %s\n", ctx_.branch.c_str());
    std::printf("  Service                : %s\n\n", name.c_str());
    std::printf("  Local URL   : http://localhost:%u\n", static_cast<unsigned>(cfg.port));
    if (!ip.empty()) std::printf("  Network URL : http://%s:%u\n", ip.c_str(), static_cast<unsigned>(cfg.port));
    std::printf("\n  Default credentials: admin / admin (change them at first login)\n\n");
    std::printf("  Status  : sudo systemctl status %s\n", name.c_str());
    std::printf("  Restart : sudo systemctl restart %s\n", name.c_str());
    std::printf("  Logs    : sudo journalctl -u %s -f\n", name.c_str());
    std::printf("  Remove  : sudo motion-deploy uninstall\n\n");
    std::fflush(stdout);
}

} // namespace mdeploy
