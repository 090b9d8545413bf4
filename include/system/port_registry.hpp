#pragma once

#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mdeploy {

// Who holds a listening TCP port, and how to make them let go.
class IPortRegistry {
  public:
    virtual ~IPortRegistry() = default;

    virtual std::vector<int> ListOwners(std::uint16_t port) = 0;
    virtual Result Signal(int pid, int signo) = 0;
    virtual bool IsAlive(int pid) = 0;
};

// Reads the kernel socket tables under a proc root ("/proc" on a real host).
class ProcPortRegistry final : public IPortRegistry {
  public:
    explicit ProcPortRegistry(std::string proc_root = "/proc") : proc_root_(std::move(proc_root)) {}

    std::vector<int> ListOwners(std::uint16_t port) override;
    Result Signal(int pid, int signo) override;
    bool IsAlive(int pid) override;

  private:
    std::string proc_root_;
};

// Socket inodes in LISTEN state bound to `port`, from one /proc/net/tcp{,6} table.
std::vector<unsigned long> ParseListeningInodes(std::string_view table, std::uint16_t port);

// Frees ports with graceful-then-forceful termination and bounded backoff.
class PortReleaser {
  public:
    struct Policy {
        int max_attempts = 6;
        std::chrono::milliseconds initial_backoff{100};
        std::chrono::milliseconds max_backoff{1600};
        // Fixed wait after terminating anything, before the service binds.
        std::chrono::milliseconds settle{1000};
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit PortReleaser(IPortRegistry& registry);
    PortReleaser(IPortRegistry& registry, Policy policy, Sleeper sleeper);

    Result FreePorts(const std::vector<std::uint16_t>& ports);

    int TerminatedCount() const { return terminated_; }

  private:
    Result FreePort(std::uint16_t port);
    bool WaitReleased(std::uint16_t port);
    // Holders of `port` other than this process.
    std::vector<int> OtherOwners(std::uint16_t port);

    IPortRegistry& registry_;
    Policy policy_;
    Sleeper sleep_;
    int terminated_ = 0;
};

} // namespace mdeploy
