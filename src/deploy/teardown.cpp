#include "deploy/teardown.hpp"

#include "deploy/config_snapshot.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace fs = std::filesystem;

namespace mdeploy {

TeardownManager::TeardownManager(InstallationLayout layout, UnitManager& units, IdentityProvisioner& identity,
                                 MediaRelay* relay, IDecisionSource& decisions, Options opt)
    : layout_(std::move(layout)),
      units_(units),
      identity_(identity),
      relay_(relay),
      decisions_(decisions),
      opt_(std::move(opt)) {}

Result TeardownManager::RemoveTree(const fs::path& p, bool& removed) const {
    removed = false;
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(p, ec))) return Result::Ok();
    if (!IsSafeRemovalTarget(p)) {
        return Result::Fail(ErrorKind::Fatal, "refusing to remove " + p.string(),
                            "check InstallRoot and HostLogDir in the tool configuration");
    }
    fs::remove_all(p, ec);
    if (ec) return Result::Fail(ec.value(), "cannot remove " + p.string() + ": " + ec.message());
    removed = true;
    return Result::Ok();
}

Result TeardownManager::Run(Outcome* outcome) {
    Outcome out;
    LogStep("Uninstalling %s", units_.Name().c_str());

    if (!decisions_.ConfirmAction("Are you sure you want to uninstall " + units_.Name() + "?")) {
        return Result::Aborted("uninstall cancelled");
    }

    const bool had_unit = units_.UnitPresent();
    if (auto r = units_.Remove(); !r.is_ok()) return r;
    out.unit_removed = had_unit;

    std::error_code ec;
    const auto config_dir = layout_.ConfigDir();
    if (fs::is_directory(config_dir, ec) && !decisions_.Confirm("Also remove the configuration files?", false)) {
        auto snap = ConfigSnapshot::Capture(config_dir, opt_.backup_dir, opt_.snapshot_prefix);
        if (!snap) {
            return Result::Fail(ErrorKind::Fatal, "cannot save the configuration: " + snap.error(),
                                "nothing was removed; free space under " + opt_.backup_dir.string() + " and retry");
        }
        out.config_backup = snap->Dir();
        LogInfo("Configuration saved to: %s", snap->Dir().c_str());
    }

    if (fs::exists(layout_.root, ec)) LogInfo("Removing the installation directory...");
    if (auto r = RemoveTree(layout_.root, out.root_removed); !r.is_ok()) return r;

    if (fs::exists(layout_.host_log_dir, ec)) LogInfo("Removing the logs...");
    if (auto r = RemoveTree(layout_.host_log_dir, out.host_logs_removed); !r.is_ok()) return r;

    const auto& account = identity_.Account();
    if (identity_.UserExists() &&
        decisions_.Confirm("Remove the system user '" + account.user + "'?", false)) {
        if (auto r = identity_.RemoveUser(); r.is_ok()) {
            out.user_removed = true;
        } else {
            LogWarn("%s", r.msg.c_str());
        }
    }
    if (identity_.GroupExists() &&
        decisions_.Confirm("Remove the system group '" + account.group + "'?", false)) {
        if (auto r = identity_.RemoveGroup(); r.is_ok()) {
            out.group_removed = true;
        } else {
            LogWarn("%s", r.msg.c_str());
        }
    }

    if (relay_ && (relay_->Installed() || relay_->UnitPresent()) &&
        decisions_.Confirm("Also uninstall MediaMTX (RTSP server)?", false)) {
        if (auto r = relay_->Remove(); r.is_ok()) {
            out.relay_removed = true;
        } else {
            LogWarn("%s", r.msg.c_str());
        }
    }

    LogSuccess("%s uninstalled", units_.Name().c_str());
    LogInfo("System packages (python3, ffmpeg, ...) were left installed");
    if (out.config_backup) LogInfo("Configuration backup: %s", out.config_backup->c_str());

    if (outcome) *outcome = std::move(out);
    return Result::Ok();
}

} // namespace mdeploy
