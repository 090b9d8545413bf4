#include "deploy/environment_prober.hpp"

#include "util/logger.hpp"

#include <fstream>
#include <string_view>
#include <sstream>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace mdeploy {

namespace {

class PosixProbeOps final : public EnvironmentProber::ISystemOps {
  public:
    uid_t EffectiveUid() const override { return ::geteuid(); }

    std::string KernelName() const override {
        struct utsname u{};
        if (::uname(&u) != 0) return {};
        return u.sysname;
    }

    std::string Machine() const override {
        struct utsname u{};
        if (::uname(&u) != 0) return {};
        return u.machine;
    }

    bool FileExists(const std::string& path) const override {
        struct stat st{};
        return ::stat(path.c_str(), &st) == 0;
    }

    std::optional<std::string> ReadFile(const std::string& path) const override {
        std::ifstream is(path, std::ios::binary);
        if (!is) return std::nullopt;
        std::ostringstream os;
        os << is.rdbuf();
        return os.str();
    }
};

std::string StripNul(std::string s) {
    while (!s.empty() && (s.back() == '\0' || s.back() == '\n')) s.pop_back();
    return s;
}

} // namespace

std::string ParseOsReleasePrettyName(const std::string& os_release) {
    std::istringstream is(os_release);
    std::string line;
    while (std::getline(is, line)) {
        if (!line.starts_with("PRETTY_NAME=")) continue;
        std::string v = line.substr(std::string_view("PRETTY_NAME=").size());
        if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
            v = v.substr(1, v.size() - 2);
        }
        return v;
    }
    return {};
}

std::shared_ptr<const EnvironmentProber::ISystemOps> EnvironmentProber::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixProbeOps>();
    return kDefault;
}

EnvironmentProber::EnvironmentProber(IHttpClient& http, IDecisionSource& decisions,
                                     std::shared_ptr<const ISystemOps> system_ops)
    : http_(http), decisions_(decisions),
      system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

Result EnvironmentProber::CheckPrivilege() const {
    if (system_ops_->EffectiveUid() != 0) {
        return Result::Fail(ErrorKind::Preflight, "this tool must run as root", "re-run it with sudo");
    }
    return Result::Ok();
}

Result EnvironmentProber::CheckSystem(Report& report) const {
    LogStep("Checking the system");

    report.kernel = system_ops_->KernelName();
    if (report.kernel != "Linux") {
        return Result::Fail(ErrorKind::Preflight,
                            "unsupported kernel '" + report.kernel + "', Linux is required",
                            "run the deployment on a Debian-family Linux host");
    }

    report.debian = system_ops_->FileExists("/etc/debian_version");
    if (!report.debian) {
        LogWarn("Non-Debian system detected, the installation may fail");
        if (!decisions_.Confirm("Continue anyway?", false)) {
            return Result::Aborted("stopped on a non-Debian system");
        }
    }

    report.arch = system_ops_->Machine();
    LogInfo("Architecture: %s", report.arch.c_str());

    if (auto os_release = system_ops_->ReadFile("/etc/os-release")) {
        report.pretty_name = ParseOsReleasePrettyName(*os_release);
        if (!report.pretty_name.empty()) LogInfo("System: %s", report.pretty_name.c_str());
    }
    if (auto model = system_ops_->ReadFile("/proc/device-tree/model")) {
        report.hardware_model = StripNul(*model);
        if (!report.hardware_model.empty()) LogInfo("Hardware: %s", report.hardware_model.c_str());
    }

    LogSuccess("System check complete");
    return Result::Ok();
}

Result EnvironmentProber::CheckConnectivity(const std::string& url) const {
    LogStep("Checking network access");
    auto resp = http_.Head(url);
    if (!resp) {
        return Result::Fail(ErrorKind::Preflight, "cannot reach " + url + ": " + resp.error(),
                            "check the network connection and DNS, then retry");
    }
    LogSuccess("Network access OK");
    return Result::Ok();
}

Result EnvironmentProber::Run(Report* report) const {
    Report local;
    Report& out = report ? *report : local;

    if (auto r = CheckPrivilege(); !r.is_ok()) return r;
    if (auto r = CheckSystem(out); !r.is_ok()) return r;
    return CheckConnectivity();
}

} // namespace mdeploy
