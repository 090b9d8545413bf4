#include "deploy/dependency_provisioner.hpp"

#include "io/atomic_file.hpp"
#include "util/logger.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

constexpr std::chrono::seconds kAptTimeout{1800};
constexpr std::chrono::seconds kPipTimeout{1800};

std::string Trim(std::string_view s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(" \t\r");
    return std::string(s.substr(b, e - b + 1));
}

std::string LastLine(const std::string& output) {
    const auto end = output.find_last_not_of('\n');
    if (end == std::string::npos) return {};
    const auto nl = output.rfind('\n', end);
    const auto start = nl == std::string::npos ? 0 : nl + 1;
    return output.substr(start, end - start + 1);
}

std::string Failure(const CommandResult& r) {
    if (!r.started) return r.error;
    std::string s = "exit code " + std::to_string(r.exit_code);
    const std::string tail = LastLine(r.output);
    if (!tail.empty()) s += ": " + tail;
    return s;
}

} // namespace

std::vector<std::string> ParseRequirements(std::string_view text) {
    std::vector<std::string> out;
    std::istringstream is{std::string(text)};
    std::string line;
    while (std::getline(is, line)) {
        std::string t = Trim(line);
        if (t.empty() || t.front() == '#') continue;
        out.push_back(std::move(t));
    }
    return out;
}

Result DependencyProvisioner::InstallOsPackages() {
    LogStep("Installing system dependencies");

    CommandOptions opt;
    opt.timeout = kAptTimeout;
    opt.env = {"DEBIAN_FRONTEND=noninteractive"};

    LogInfo("Updating package lists...");
    auto upd = runner_.Run({"apt-get", "update", "-qq"}, opt);
    if (!upd.Succeeded()) {
        LogWarn("apt-get update failed: %s", Failure(upd).c_str());
    }

    if (apt_packages_.empty()) return Result::Ok();

    std::vector<std::string> argv{"apt-get", "install", "-y"};
    argv.insert(argv.end(), apt_packages_.begin(), apt_packages_.end());
    LogInfo("Installing packages: %s", DescribeCommand(apt_packages_).c_str());

    auto inst = runner_.Run(argv, opt);
    if (!inst.Succeeded()) {
        return Result::Fail(ErrorKind::Degraded, "some packages could not be installed: " + Failure(inst),
                            "install the missing packages with apt-get and run repair");
    }
    LogSuccess("System dependencies installed");
    return Result::Ok();
}

bool DependencyProvisioner::RuntimePresent(const InstallationLayout& layout) const {
    std::error_code ec;
    return fs::is_directory(layout.VenvDir(), ec);
}

bool DependencyProvisioner::InterpreterWorks(const InstallationLayout& layout) {
    std::error_code ec;
    if (!fs::exists(layout.Python(), ec)) return false;
    CommandOptions opt;
    opt.timeout = std::chrono::seconds{30};
    return runner_.Run({layout.Python().string(), "-c", "import sys"}, opt).Succeeded();
}

Result DependencyProvisioner::CreateRuntime(const InstallationLayout& layout) {
    LogInfo("Creating the virtual environment (with system packages)...");
    CommandOptions opt;
    opt.timeout = std::chrono::seconds{300};
    auto r = runner_.Run({"python3", "-m", "venv", "--system-site-packages", layout.VenvDir().string()}, opt);
    if (!r.Succeeded()) {
        return Result::Fail(ErrorKind::Fatal, "cannot create the Python runtime: " + Failure(r),
                            "check that python3-venv is installed");
    }
    return Result::Ok();
}

Result DependencyProvisioner::InstallRequirements(const InstallationLayout& layout, Report& report) {
    std::error_code ec;
    if (!fs::exists(layout.Requirements(), ec)) {
        LogWarn("requirements.txt not found");
        return Result::Ok();
    }

    CommandOptions opt;
    opt.timeout = kPipTimeout;
    const std::string pip = layout.Pip().string();

    LogInfo("Installing Python dependencies...");
    auto bulk = runner_.Run({pip, "install", "-r", layout.Requirements().string()}, opt);
    if (bulk.Succeeded()) return Result::Ok();

    report.bulk_install_ok = false;
    LogWarn("Some pip packages could not be installed");
    LogInfo("Retrying the missing packages one by one...");

    std::string text;
    if (auto r = ReadFileToString(layout.Requirements().string(), text); !r.is_ok()) {
        return Result::Fail(ErrorKind::Degraded, r.msg);
    }
    for (const auto& entry : ParseRequirements(text)) {
        auto one = runner_.Run({pip, "install", entry}, opt);
        if (!one.Succeeded()) {
            LogWarn("Package %s not installable via pip (it may be provided by the system)", entry.c_str());
            report.failed_entries.push_back(entry);
        }
    }

    if (!report.failed_entries.empty()) {
        return Result::Fail(ErrorKind::Degraded,
                            std::to_string(report.failed_entries.size()) + " Python package(s) missing",
                            "run repair once the packages are installable");
    }
    return Result::Ok();
}

bool DependencyProvisioner::ProbeStreamingCapability(const InstallationLayout& layout) {
    CommandOptions opt;
    opt.timeout = std::chrono::seconds{60};
    auto r = runner_.Run({layout.Python().string(), "-c", "import cv2"}, opt);
    if (r.Succeeded()) {
        LogSuccess("OpenCV available in the runtime");
        return true;
    }
    LogWarn("OpenCV not available, MJPEG streaming will be disabled");
    LogInfo("To install OpenCV: sudo apt install python3-opencv");
    return false;
}

Result DependencyProvisioner::ProvisionRuntime(const InstallationLayout& layout, Report& report) {
    LogStep("Setting up the Python environment");

    if (auto r = CreateRuntime(layout); !r.is_ok()) return r;

    LogInfo("Upgrading pip...");
    CommandOptions opt;
    opt.timeout = kPipTimeout;
    auto up = runner_.Run({layout.Pip().string(), "install", "--upgrade", "pip", "wheel", "setuptools"}, opt);
    if (!up.Succeeded()) LogWarn("pip upgrade failed: %s", Failure(up).c_str());

    Result req = InstallRequirements(layout, report);
    report.streaming_enabled = ProbeStreamingCapability(layout);

    if (req.is_ok()) LogSuccess("Python environment ready");
    return req;
}

Result DependencyProvisioner::RecreateRuntime(const InstallationLayout& layout, Report& report) {
    std::error_code ec;
    fs::remove_all(layout.VenvDir(), ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot remove " + layout.VenvDir().string() + ": " + ec.message());
    }
    return ProvisionRuntime(layout, report);
}

Result DependencyProvisioner::CheckHealth(const InstallationLayout& layout) {
    CommandOptions opt;
    opt.timeout = std::chrono::seconds{120};
    auto r = runner_.Run({layout.Pip().string(), "check"}, opt);
    if (!r.Succeeded()) {
        return Result::Fail(ErrorKind::Repairable, "pip check failed: " + Failure(r));
    }
    return Result::Ok();
}

Result DependencyProvisioner::ReinstallRequirements(const InstallationLayout& layout) {
    CommandOptions opt;
    opt.timeout = kPipTimeout;
    auto r = runner_.Run({layout.Pip().string(), "install", "-r", layout.Requirements().string()}, opt);
    if (!r.Succeeded()) {
        return Result::Fail(ErrorKind::Degraded, "reinstalling requirements failed: " + Failure(r));
    }
    return Result::Ok();
}

} // namespace mdeploy
