#pragma once

#include "deploy/dependency_provisioner.hpp"
#include "deploy/identity_provisioner.hpp"
#include "deploy/installation.hpp"
#include "deploy/media_relay.hpp"
#include "deploy/unit_manager.hpp"
#include "net/activation_client.hpp"
#include "system/decision_source.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mdeploy {

struct IssueRecord {
    std::string check;
    std::string detail;
    bool detected = true;
    bool auto_fixed = false;
    bool escalation = false;
};

struct RepairReport {
    std::vector<IssueRecord> issues;

    int Found() const { return static_cast<int>(issues.size()); }
    int Fixed() const;
    bool NeedsReinstall() const;
};

class RepairSession;

// Ordered battery of independent health checks. Each check records issues,
// fixes what it can in place, and flags damage that needs a reinstall.
class Reconciler {
  public:
    struct Toolkit {
        InstallationLayout layout;
        IdentityProvisioner& identity;
        DependencyProvisioner& deps;
        UnitManager& units;
        MediaRelay* relay = nullptr;  // nullptr when the relay is disabled
        std::string machine;
        ActivationClient& activation;
        IDecisionSource& decisions;
        // Credentials from the command line, used when none are configured.
        DeviceCredential supplied;
    };

    struct Options {
        bool detect_only = false;
        std::filesystem::path backup_dir = "/var/backups";
        std::string snapshot_prefix = "motion-frontend";
    };

    class ICheck {
      public:
        virtual ~ICheck() = default;
        virtual const char* Id() const = 0;
        virtual const char* Title() const = 0;
        virtual void Run(RepairSession& session) const = 0;
    };

    // Fresh installation with activation skipped; runs after the root is removed.
    using Reinstaller = std::function<Result()>;

    Reconciler(Toolkit toolkit, Options opt);
    Reconciler(Toolkit toolkit, Options opt, std::vector<std::unique_ptr<ICheck>> checks);

    static std::vector<std::unique_ptr<ICheck>> DefaultChecks();

    // Runs every check once.
    RepairReport Inspect();

    // Inspect, then reinstall, report or restart as the outcome requires.
    Result Run(const Reinstaller& reinstall, RepairReport* report = nullptr);

  private:
    Result Escalate(const Reinstaller& reinstall);

    Toolkit tk_;
    Options opt_;
    std::vector<std::unique_ptr<ICheck>> checks_;
};

// Per-run state handed to each check.
class RepairSession {
  public:
    RepairSession(Reconciler::Toolkit& toolkit, bool detect_only, RepairReport& report)
        : tk_(toolkit), detect_only_(detect_only), report_(report) {}

    Reconciler::Toolkit& Tools() { return tk_; }
    bool DetectOnly() const { return detect_only_; }

    void Begin(const char* check_id) { check_ = check_id; }

    void Pass(const std::string& what);
    void Issue(const std::string& detail);
    // Applies `fix` to the last issue and counts it fixed on success.
    // Skipped in detect-only mode and once a reinstall is pending.
    void Fix(const std::string& action, const std::function<Result()>& fix);
    void NeedsReinstall();
    // Reported, never counted.
    void Advisory(const std::string& what);

    bool ReinstallPending() const { return report_.NeedsReinstall(); }

  private:
    Reconciler::Toolkit& tk_;
    bool detect_only_;
    RepairReport& report_;
    std::string check_;
};

} // namespace mdeploy
