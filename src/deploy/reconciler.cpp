#include "deploy/reconciler.hpp"

#include "deploy/config_snapshot.hpp"
#include "deploy/runtime_config.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>

namespace fs = std::filesystem;

namespace mdeploy {

int RepairReport::Fixed() const {
    return static_cast<int>(std::count_if(issues.begin(), issues.end(), [](const IssueRecord& i) { return i.auto_fixed; }));
}

bool RepairReport::NeedsReinstall() const {
    return std::any_of(issues.begin(), issues.end(), [](const IssueRecord& i) { return i.escalation; });
}

void RepairSession::Pass(const std::string& what) {
    LogSuccess("✓ %s", what.c_str());
}

void RepairSession::Issue(const std::string& detail) {
    LogWarn("✗ %s", detail.c_str());
    report_.issues.push_back(IssueRecord{.check = check_, .detail = detail});
}

void RepairSession::Fix(const std::string& action, const std::function<Result()>& fix) {
    if (report_.issues.empty()) return;
    if (detect_only_) {
        LogInfo("  → would fix: %s", action.c_str());
        return;
    }
    if (ReinstallPending()) {
        LogInfo("  → left to the reinstall: %s", action.c_str());
        return;
    }
    LogInfo("  → %s", action.c_str());
    auto r = fix();
    if (r.is_ok()) {
        report_.issues.back().auto_fixed = true;
    } else {
        LogWarn("  → fix failed: %s", r.msg.c_str());
    }
}

void RepairSession::NeedsReinstall() {
    if (!report_.issues.empty()) report_.issues.back().escalation = true;
}

void RepairSession::Advisory(const std::string& what) {
    LogWarn("✗ %s", what.c_str());
}

namespace {

class RootCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "root"; }
    const char* Title() const override { return "installation directory"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        const auto& root = tk.layout.root;
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            s.Issue("installation directory missing: " + root.string());
            s.NeedsReinstall();
            return;
        }
        s.Pass("installation directory present");

        struct Sub {
            fs::path path;
            const char* name;
            bool creatable;
            mode_t mode;
        };
        std::vector<Sub> subs;
        for (const char* code : InstallationLayout::kCodeSubpaths) {
            subs.push_back({root / code, code, false, InstallationLayout::kCodeMode});
        }
        subs.push_back({tk.layout.ConfigDir(), "config", true, InstallationLayout::kConfigDirMode});
        subs.push_back({tk.layout.LogsDir(), "logs", true, InstallationLayout::kLogsMode});

        for (const auto& sub : subs) {
            if (fs::is_directory(sub.path, ec)) {
                s.Pass(std::string("subdirectory present: ") + sub.name);
                continue;
            }
            s.Issue(std::string("subdirectory missing: ") + sub.name);
            if (!sub.creatable) {
                s.NeedsReinstall();
                continue;
            }
            s.Fix("creating " + sub.path.string(), [&] {
                std::error_code mk;
                fs::create_directories(sub.path, mk);
                if (mk) return Result::Fail(mk.value(), mk.message());
                return tk.identity.AdoptPath(sub.path, sub.mode);
            });
        }
    }
};

class IdentityCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "identity"; }
    const char* Title() const override { return "service account"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        const auto& user = tk.identity.Account().user;
        if (!tk.identity.UserExists() || !tk.identity.GroupExists()) {
            s.Issue("service account '" + user + "' or its group is missing");
            if (!tk.layout.HasCode()) {
                s.NeedsReinstall();
                return;
            }
            s.Fix("creating the account and its groups", [&] { return tk.identity.EnsureIdentity(); });
            return;
        }
        s.Pass("service account '" + user + "' present");

        for (const auto& g : tk.identity.MissingMemberships()) {
            s.Issue("'" + user + "' is not a member of group '" + g + "'");
            s.Fix("adding to group '" + g + "'", [&] { return tk.identity.AddMembership(g); });
        }
    }
};

class RuntimeCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "runtime"; }
    const char* Title() const override { return "Python environment"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        auto provision = [&](bool recreate) {
            DependencyProvisioner::Report rep;
            Result r = recreate ? tk.deps.RecreateRuntime(tk.layout, rep) : tk.deps.ProvisionRuntime(tk.layout, rep);
            // Missing optional packages leave a usable runtime.
            return r.kind == ErrorKind::Degraded ? Result::Ok() : r;
        };

        if (!tk.deps.RuntimePresent(tk.layout)) {
            s.Issue("virtual environment missing");
            if (!tk.layout.HasCode()) {
                s.NeedsReinstall();
                return;
            }
            s.Fix("recreating the virtual environment", [&] { return provision(false); });
            return;
        }
        if (!tk.deps.InterpreterWorks(tk.layout)) {
            s.Issue("Python interpreter missing or broken in the virtual environment");
            s.Fix("recreating the virtual environment", [&] { return provision(true); });
            return;
        }
        s.Pass("Python environment present");

        std::error_code ec;
        if (!fs::exists(tk.layout.Requirements(), ec)) return;
        if (auto r = tk.deps.CheckHealth(tk.layout); !r.is_ok()) {
            s.Issue("Python dependencies incomplete");
            LogDebug("%s", r.msg.c_str());
            s.Fix("reinstalling the dependencies", [&] { return tk.deps.ReinstallRequirements(tk.layout); });
            return;
        }
        s.Pass("Python dependencies OK");
    }
};

class UnitCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "unit"; }
    const char* Title() const override { return "systemd service"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        if (!tk.units.UnitPresent()) {
            s.Issue("service unit file missing");
            if (!tk.layout.HasCode()) {
                s.NeedsReinstall();
                return;
            }
            s.Fix("recreating and enabling the service unit", [&] { return tk.units.Install(); });
            return;
        }
        s.Pass("service unit present");

        const auto drift = tk.units.Drift();
        if (!drift.empty()) {
            s.Issue("service unit is obsolete (" + std::to_string(drift.size()) + " difference(s))");
            for (const auto& d : drift) LogDebug("unit drift: %s", d.c_str());
            s.Fix("stopping the service, freeing its ports and regenerating the unit",
                  [&] { return tk.units.Regenerate(); });
        }

        if (!tk.units.IsEnabled()) {
            s.Issue("service not enabled at boot");
            s.Fix("enabling the service", [&] { return tk.units.Enable(); });
        } else {
            s.Pass("service enabled at boot");
        }
    }
};

class PermissionCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "permissions"; }
    const char* Title() const override { return "ownership and permissions"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        std::error_code ec;
        if (!fs::is_directory(tk.layout.root, ec)) return;

        const auto drift = tk.identity.InspectPermissions(tk.layout);
        if (drift.empty()) {
            s.Pass("ownership and permissions correct");
            return;
        }
        s.Issue("ownership or permission drift: " + drift.front() +
                (drift.size() > 1 ? " (+" + std::to_string(drift.size() - 1) + " more)" : ""));
        for (const auto& d : drift) LogDebug("drift: %s", d.c_str());
        s.Fix("normalizing ownership and permissions", [&] { return tk.identity.NormalizePermissions(tk.layout); });
    }
};

class MediaRelayCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "media-relay"; }
    const char* Title() const override { return "MediaMTX (RTSP server)"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        if (!tk.relay) return;
        if (!MediaRelay::MapArchitecture(tk.machine)) {
            LogInfo("MediaMTX is not available for %s, skipped", tk.machine.c_str());
            return;
        }
        if (!tk.relay->Installed()) {
            s.Issue("MediaMTX not installed (RTSP streaming unavailable)");
            s.Fix("installing MediaMTX", [&] { return tk.relay->Install(tk.machine); });
            return;
        }
        s.Pass("MediaMTX installed");
        if (!tk.relay->Running()) {
            s.Issue("MediaMTX service not active");
            s.Fix("starting the MediaMTX service", [&] { return tk.relay->Start(); });
        } else {
            s.Pass("MediaMTX service active");
        }
    }
};

class ConfigFileCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "config"; }
    const char* Title() const override { return "configuration"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        RuntimeConfig rc(tk.layout.RuntimeConfigFile());
        if (rc.Exists()) {
            s.Pass("configuration file present");
            return;
        }
        s.Issue("configuration file missing");
        s.Fix("creating the default configuration", [&] {
            bool created = false;
            if (auto r = rc.EnsureDefault(ActivationSettings{}, created); !r.is_ok()) return r;
            return tk.identity.AdoptPath(rc.Path(), InstallationLayout::kConfigFileMode);
        });
    }
};

class ActivationCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "activation"; }
    const char* Title() const override { return "device activation"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        RuntimeConfig rc(tk.layout.RuntimeConfigFile());
        if (!rc.Exists()) return;

        auto settings = rc.ReadActivation();
        if (!settings) {
            s.Advisory("activation settings unreadable: " + settings.error());
            return;
        }

        if (!settings->device_key.empty()) {
            s.Pass("activation configured (device key: " + settings->device_key.substr(0, 8) + "...)");
            if (settings->token_code.empty()) {
                s.Advisory("activation token code is empty");
                return;
            }
            auto v = tk.activation.Verify(DeviceCredential{settings->device_key, settings->token_code});
            if (v) {
                s.Pass("activation credentials accepted by the authority");
            } else {
                s.Advisory("activation credentials not confirmed: " + v.error().message);
            }
            return;
        }

        s.Advisory("device activation not configured");
        if (s.DetectOnly()) return;

        DeviceCredential cred = tk.supplied;
        if (cred.Empty()) {
            if (!tk.decisions.IsInteractive() ||
                !tk.decisions.Confirm("Configure device activation now (no token is consumed)?", false)) {
                return;
            }
            cred.device_key = tk.decisions.Ask("Device key");
            if (cred.device_key.empty()) return;
            cred.token_code = tk.decisions.Ask("Token code");
            if (cred.token_code.empty()) return;
        }

        LogInfo("Checking the credentials (no token consumed)...");
        auto v = tk.activation.Verify(cred);
        if (!v) {
            LogError("%s", FormatActivationFailure(v.error()).c_str());
            return;
        }
        ActivationSettings update{.server_url = std::string(kActivationAuthority),
                                  .device_key = cred.device_key,
                                  .token_code = cred.token_code};
        if (auto r = rc.WriteActivation(update); !r.is_ok()) {
            LogError("%s", r.msg.c_str());
            return;
        }
        // The rewrite replaced the file, so the account lost ownership of it.
        if (auto r = tk.identity.AdoptPath(rc.Path(), InstallationLayout::kConfigFileMode); !r.is_ok()) {
            LogError("%s", r.msg.c_str());
            return;
        }
        LogSuccess("Activation settings updated");
    }
};

class LogDirCheck final : public Reconciler::ICheck {
  public:
    const char* Id() const override { return "logs"; }
    const char* Title() const override { return "log directories"; }

    void Run(RepairSession& s) const override {
        auto& tk = s.Tools();
        std::error_code ec;
        if (!fs::is_directory(tk.layout.root, ec)) return;

        const auto drift = tk.identity.InspectLogDirs(tk.layout);
        if (drift.empty()) {
            s.Pass("log directories OK");
            return;
        }
        s.Issue("log directory not writable by the service: " + drift.front());
        s.Fix("fixing log directory ownership", [&] { return tk.identity.NormalizeLogDirs(tk.layout); });
    }
};

} // namespace

std::vector<std::unique_ptr<Reconciler::ICheck>> Reconciler::DefaultChecks() {
    std::vector<std::unique_ptr<ICheck>> checks;
    checks.push_back(std::make_unique<RootCheck>());
    checks.push_back(std::make_unique<IdentityCheck>());
    checks.push_back(std::make_unique<RuntimeCheck>());
    checks.push_back(std::make_unique<UnitCheck>());
    checks.push_back(std::make_unique<PermissionCheck>());
    checks.push_back(std::make_unique<MediaRelayCheck>());
    checks.push_back(std::make_unique<ConfigFileCheck>());
    checks.push_back(std::make_unique<ActivationCheck>());
    checks.push_back(std::make_unique<LogDirCheck>());
    return checks;
}

Reconciler::Reconciler(Toolkit toolkit, Options opt) : Reconciler(std::move(toolkit), std::move(opt), DefaultChecks()) {}

Reconciler::Reconciler(Toolkit toolkit, Options opt, std::vector<std::unique_ptr<ICheck>> checks)
    : tk_(std::move(toolkit)), opt_(std::move(opt)), checks_(std::move(checks)) {}

RepairReport Reconciler::Inspect() {
    RepairReport report;
    RepairSession session(tk_, opt_.detect_only, report);
    for (const auto& check : checks_) {
        LogInfo("Checking %s...", check->Title());
        session.Begin(check->Id());
        check->Run(session);
    }
    return report;
}

Result Reconciler::Escalate(const Reinstaller& reinstall) {
    std::optional<ConfigSnapshot> snapshot;
    std::error_code ec;
    if (fs::is_directory(tk_.layout.ConfigDir(), ec)) {
        LogInfo("Saving the configuration...");
        auto snap = ConfigSnapshot::Capture(tk_.layout.ConfigDir(), opt_.backup_dir, opt_.snapshot_prefix);
        if (!snap) {
            return Result::Fail(ErrorKind::Escalation, "cannot save the configuration: " + snap.error(),
                                "nothing was removed; free space under " + opt_.backup_dir.string() + " and retry");
        }
        snapshot = std::move(*snap);
    }

    if (!IsSafeRemovalTarget(tk_.layout.root)) {
        return Result::Fail(ErrorKind::Escalation, "refusing to remove " + tk_.layout.root.string(),
                            "set InstallRoot to a dedicated directory");
    }
    fs::remove_all(tk_.layout.root, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Escalation, "cannot remove " + tk_.layout.root.string() + ": " + ec.message());
    }

    auto installed = reinstall();
    if (!installed.is_ok()) {
        if (snapshot) LogInfo("Configuration kept in %s", snapshot->Dir().c_str());
        return installed;
    }

    if (snapshot) {
        LogInfo("Restoring the configuration...");
        if (auto r = snapshot->RestoreTo(tk_.layout.ConfigDir()); !r.is_ok()) return r;
        if (auto r = tk_.identity.NormalizePermissions(tk_.layout); !r.is_ok()) return r;
        if (auto r = snapshot->Consume(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
        if (auto r = tk_.units.RestartAndWait(); !r.is_ok()) {
            LogWarn("%s", r.msg.c_str());
            if (!r.hint.empty()) LogInfo("%s", r.hint.c_str());
        }
    }
    LogSuccess("Reinstallation complete");
    return Result::Ok();
}

Result Reconciler::Run(const Reinstaller& reinstall, RepairReport* out) {
    LogStep("Repairing %s", tk_.units.Name().c_str());

    const bool was_active = tk_.units.IsActive();
    RepairReport report = Inspect();
    if (out) *out = report;

    std::printf("\n─────────────────────────────────────────────────────────────────────\n\n");

    if (report.NeedsReinstall()) {
        LogError("The installation is too damaged to be repaired in place");
        if (opt_.detect_only) {
            LogInfo("A full reinstall with configuration preservation would be offered");
            return Result::Ok();
        }
        if (!tk_.decisions.Confirm("Reinstall " + tk_.units.Name() + "?", true)) {
            return Result::Aborted("repair cancelled");
        }
        return Escalate(reinstall);
    }

    if (report.Found() == 0) {
        LogSuccess("No issue detected, the installation is healthy");
        return Result::Ok();
    }

    std::printf("Summary:\n  - Issues found: %d\n  - Issues fixed: %d\n", report.Found(), report.Fixed());
    std::fflush(stdout);

    if (opt_.detect_only) return Result::Ok();

    if (report.Fixed() > 0) {
        LogSuccess("Repair complete");
        Result started = Result::Ok();
        if (was_active) {
            LogInfo("Restarting the service...");
            started = tk_.units.RestartAndWait();
        } else if (tk_.decisions.Confirm("Start the service?", true)) {
            started = tk_.units.StartAndWait();
        }
        if (!started.is_ok()) {
            LogWarn("%s", started.msg.c_str());
            if (!started.hint.empty()) LogInfo("%s", started.hint.c_str());
        }
    }
    if (report.Fixed() < report.Found()) {
        LogWarn("%d issue(s) could not be fixed", report.Found() - report.Fixed());
    }
    return Result::Ok();
}

} // namespace mdeploy
