#include "system/port_registry.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

constexpr std::string_view kTcpListen = "0A";

bool IsNumeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string ReadWhole(const fs::path& p) {
    std::ifstream is(p);
    if (!is) return {};
    std::ostringstream os;
    os << is.rdbuf();
    return os.str();
}

} // namespace

std::vector<unsigned long> ParseListeningInodes(std::string_view table, std::uint16_t port) {
    std::vector<unsigned long> out;
    std::istringstream is{std::string(table)};
    std::string line;
    bool header = true;
    while (std::getline(is, line)) {
        if (header) {
            header = false;
            continue;
        }
        // sl local_address rem_address st tx:rx tr:when retrnsmt uid timeout inode
        std::istringstream ls(line);
        std::string sl, local, remote, st, txrx, trwhen, retr, uid, timeout, inode;
        if (!(ls >> sl >> local >> remote >> st >> txrx >> trwhen >> retr >> uid >> timeout >> inode)) {
            continue;
        }
        if (st != kTcpListen) continue;
        const auto colon = local.rfind(':');
        if (colon == std::string::npos) continue;
        const unsigned long local_port = std::strtoul(local.c_str() + colon + 1, nullptr, 16);
        if (local_port != port) continue;
        const unsigned long ino = std::strtoul(inode.c_str(), nullptr, 10);
        if (ino != 0) out.push_back(ino);
    }
    return out;
}

std::vector<int> ProcPortRegistry::ListOwners(std::uint16_t port) {
    std::set<std::string> wanted;
    for (const char* table : {"net/tcp", "net/tcp6"}) {
        for (unsigned long ino : ParseListeningInodes(ReadWhole(fs::path(proc_root_) / table), port)) {
            wanted.insert("socket:[" + std::to_string(ino) + "]");
        }
    }
    if (wanted.empty()) return {};

    std::vector<int> owners;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(proc_root_, ec)) {
        const std::string name = entry.path().filename().string();
        if (!IsNumeric(name)) continue;

        std::error_code fd_ec;
        for (const auto& fd : fs::directory_iterator(entry.path() / "fd", fd_ec)) {
            std::error_code link_ec;
            const auto target = fs::read_symlink(fd.path(), link_ec);
            if (link_ec) continue;
            if (wanted.count(target.string())) {
                owners.push_back(std::atoi(name.c_str()));
                break;
            }
        }
    }
    return owners;
}

Result ProcPortRegistry::Signal(int pid, int signo) {
    if (::kill(pid, signo) != 0) {
        const int err = errno;
        if (err == ESRCH) return Result::Ok();
        return Result::Fail(err, "kill(" + std::to_string(pid) + "): " + std::strerror(err));
    }
    return Result::Ok();
}

bool ProcPortRegistry::IsAlive(int pid) {
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

PortReleaser::PortReleaser(IPortRegistry& registry)
    : PortReleaser(registry, Policy{}, Sleeper{}) {}

PortReleaser::PortReleaser(IPortRegistry& registry, Policy policy, Sleeper sleeper)
    : registry_(registry), policy_(policy), sleep_(std::move(sleeper)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::vector<int> PortReleaser::OtherOwners(std::uint16_t port) {
    const int self = static_cast<int>(::getpid());
    auto owners = registry_.ListOwners(port);
    owners.erase(std::remove(owners.begin(), owners.end(), self), owners.end());
    return owners;
}

bool PortReleaser::WaitReleased(std::uint16_t port) {
    auto backoff = policy_.initial_backoff;
    for (int attempt = 0; attempt < policy_.max_attempts; ++attempt) {
        if (OtherOwners(port).empty()) return true;
        sleep_(backoff);
        backoff = std::min(backoff * 2, policy_.max_backoff);
    }
    return OtherOwners(port).empty();
}

Result PortReleaser::FreePort(std::uint16_t port) {
    auto owners = OtherOwners(port);
    if (owners.empty()) return Result::Ok();

    for (int pid : owners) {
        LogWarn("Process %d holds port %u, requesting termination", pid, (unsigned)port);
        auto r = registry_.Signal(pid, SIGTERM);
        if (!r.is_ok()) LogWarn("%s", r.msg.c_str());
    }
    terminated_ += static_cast<int>(owners.size());

    if (WaitReleased(port)) return Result::Ok();

    for (int pid : OtherOwners(port)) {
        LogWarn("Process %d still holds port %u, killing it", pid, (unsigned)port);
        auto r = registry_.Signal(pid, SIGKILL);
        if (!r.is_ok()) LogWarn("%s", r.msg.c_str());
    }

    if (WaitReleased(port)) return Result::Ok();

    return Result::Fail(-1, "port " + std::to_string(port) + " is still in use after " +
                                std::to_string(policy_.max_attempts * 2) + " checks");
}

Result PortReleaser::FreePorts(const std::vector<std::uint16_t>& ports) {
    terminated_ = 0;
    Result first_failure = Result::Ok();
    for (std::uint16_t port : ports) {
        auto r = FreePort(port);
        if (!r.is_ok() && first_failure.is_ok()) first_failure = std::move(r);
    }
    if (terminated_ > 0) {
        LogDebug("terminated %d port holder(s), settling %lld ms",
                 terminated_, (long long)policy_.settle.count());
        sleep_(policy_.settle);
    }
    return first_failure;
}

} // namespace mdeploy
