#include "deploy/unit_manager.hpp"

#include "io/atomic_file.hpp"
#include "util/logger.hpp"

#include <thread>

namespace fs = std::filesystem;

namespace mdeploy {

UnitManager::UnitManager(IServiceManager& services, PortReleaser& releaser, UnitParams params, Options opt,
                         PortReleaser::Sleeper sleeper)
    : services_(services), releaser_(releaser), params_(std::move(params)), opt_(std::move(opt)),
      sleep_(std::move(sleeper)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

fs::path UnitManager::UnitPath() const {
    return opt_.unit_dir / (params_.service_name + ".service");
}

std::string UnitManager::JournalHint() const {
    return "inspect the logs with: journalctl -u " + params_.service_name + " -n 50";
}

bool UnitManager::UnitPresent() const {
    std::error_code ec;
    return fs::is_regular_file(UnitPath(), ec);
}

std::vector<std::string> UnitManager::Drift() const {
    std::string installed;
    if (auto r = ReadFileToString(UnitPath().string(), installed); !r.is_ok()) {
        return {r.msg};
    }
    auto actual = ParseUnit(installed);
    if (!actual) return {"unreadable unit: " + actual.error()};

    auto expected = ParseUnit(RenderServiceUnit(params_));
    if (!expected) return {"template does not parse: " + expected.error()};

    return DiffUnits(*expected, *actual);
}

Result UnitManager::WriteUnit() {
    std::error_code ec;
    fs::create_directories(opt_.unit_dir, ec);
    if (auto r = WriteFileAtomic(UnitPath().string(), RenderServiceUnit(params_), 0644); !r.is_ok()) return r;
    return services_.DaemonReload();
}

Result UnitManager::Enable() {
    return services_.Enable(Name());
}

Result UnitManager::Install() {
    LogStep("Creating the systemd service");
    if (auto r = WriteUnit(); !r.is_ok()) return r;
    if (auto r = Enable(); !r.is_ok()) return r;
    LogSuccess("Service unit written and enabled: %s", UnitPath().c_str());
    return Result::Ok();
}

Result UnitManager::Stop() {
    if (!services_.IsActive(Name())) return Result::Ok();
    LogInfo("Stopping the service...");
    return services_.Stop(Name());
}

Result UnitManager::FreePorts() {
    return releaser_.FreePorts(opt_.ports);
}

Result UnitManager::WaitActive() {
    for (int attempt = 0; attempt < opt_.active_poll_attempts; ++attempt) {
        sleep_(opt_.active_poll_interval);
        if (services_.IsActive(Name())) return Result::Ok();
    }
    return Result::Fail(ErrorKind::Degraded, "the service did not become active", JournalHint());
}

Result UnitManager::StartAndWait() {
    if (auto r = FreePorts(); !r.is_ok()) {
        return Result::Fail(ErrorKind::Degraded, r.msg, "find the holder with: ss -tlnp");
    }
    LogInfo("Starting the service...");
    if (auto r = services_.Start(Name()); !r.is_ok()) {
        return Result::Fail(ErrorKind::Degraded, r.msg, JournalHint());
    }
    if (auto r = WaitActive(); !r.is_ok()) return r;
    LogSuccess("Service %s is active", Name().c_str());
    return Result::Ok();
}

Result UnitManager::RestartAndWait() {
    if (auto r = Stop(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    return StartAndWait();
}

Result UnitManager::Regenerate() {
    if (auto r = Stop(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    if (auto r = FreePorts(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    return WriteUnit();
}

Result UnitManager::Refresh() {
    LogStep("Updating the systemd service");
    if (auto r = Regenerate(); !r.is_ok()) return r;
    if (auto r = Enable(); !r.is_ok()) return r;
    auto started = StartAndWait();
    if (started.is_ok()) LogSuccess("Service updated and restarted");
    return started;
}

Result UnitManager::Remove() {
    if (services_.IsActive(Name())) {
        LogInfo("Stopping the service...");
        if (auto r = services_.Stop(Name()); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    }
    if (services_.IsEnabled(Name())) {
        LogInfo("Disabling the service...");
        if (auto r = services_.Disable(Name()); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    }
    if (UnitPresent()) {
        LogInfo("Removing the unit file...");
        std::error_code ec;
        fs::remove(UnitPath(), ec);
        if (ec) return Result::Fail(ec.value(), "cannot remove " + UnitPath().string() + ": " + ec.message());
        return services_.DaemonReload();
    }
    return Result::Ok();
}

} // namespace mdeploy
