#include "system/service_manager.hpp"


#include <chrono>

namespace mdeploy {

namespace {

std::string UnitName(const std::string& unit) {
    if (unit.size() > 8 && unit.compare(unit.size() - 8, 8, ".service") == 0) return unit;
    return unit + ".service";
}

std::string Trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

} // namespace

Result SystemctlServiceManager::RunSystemctl(const std::vector<std::string>& args, const char* what) {
    std::vector<std::string> argv{"systemctl"};
    argv.insert(argv.end(), args.begin(), args.end());

    CommandOptions opt;
    opt.timeout = std::chrono::seconds(90);
    const auto rr = runner_.Run(argv, opt);
    if (!rr.started) {
        return Result::Fail(-1, std::string(what) + ": cannot run systemctl: " + rr.error);
    }
    if (rr.exit_code != 0) {
        std::string msg = std::string(what) + ": systemctl exit code " + std::to_string(rr.exit_code);
        const std::string out = Trimmed(rr.output);
        if (!out.empty()) msg += " (" + out + ")";
        return Result::Fail(rr.exit_code, msg);
    }
    return Result::Ok();
}

Result SystemctlServiceManager::DaemonReload() {
    return RunSystemctl({"daemon-reload"}, "daemon-reload");
}

Result SystemctlServiceManager::Enable(const std::string& unit) {
    return RunSystemctl({"enable", UnitName(unit)}, "enable");
}

Result SystemctlServiceManager::Disable(const std::string& unit) {
    return RunSystemctl({"disable", UnitName(unit)}, "disable");
}

Result SystemctlServiceManager::Start(const std::string& unit) {
    return RunSystemctl({"start", UnitName(unit)}, "start");
}

Result SystemctlServiceManager::Stop(const std::string& unit) {
    return RunSystemctl({"stop", UnitName(unit)}, "stop");
}

Result SystemctlServiceManager::Restart(const std::string& unit) {
    return RunSystemctl({"restart", UnitName(unit)}, "restart");
}

bool SystemctlServiceManager::IsActive(const std::string& unit) {
    const auto rr = runner_.Run({"systemctl", "is-active", "--quiet", UnitName(unit)});
    return rr.Succeeded();
}

bool SystemctlServiceManager::IsEnabled(const std::string& unit) {
    const auto rr = runner_.Run({"systemctl", "is-enabled", "--quiet", UnitName(unit)});
    return rr.Succeeded();
}

} // namespace mdeploy
