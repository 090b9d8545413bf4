#pragma once

#include "net/http_client.hpp"
#include "system/decision_source.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace mdeploy {

inline constexpr const char* kRepositoryHostProbeUrl = "https://github.com";

// Read-only preflight. Never mutates the host.
class EnvironmentProber {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual uid_t EffectiveUid() const = 0;
        // uname(2) sysname and machine.
        virtual std::string KernelName() const = 0;
        virtual std::string Machine() const = 0;
        virtual bool FileExists(const std::string& path) const = 0;
        virtual std::optional<std::string> ReadFile(const std::string& path) const = 0;
    };

    struct Report {
        std::string kernel;
        std::string arch;
        std::string pretty_name;
        std::string hardware_model;
        bool debian = false;
    };

    EnvironmentProber(IHttpClient& http, IDecisionSource& decisions,
                      std::shared_ptr<const ISystemOps> system_ops = nullptr);

    Result CheckPrivilege() const;
    Result CheckSystem(Report& report) const;
    Result CheckConnectivity(const std::string& url = kRepositoryHostProbeUrl) const;

    // All three, in order, stopping at the first failure.
    Result Run(Report* report = nullptr) const;

    const ISystemOps& SystemOps() const { return *system_ops_; }

  private:
    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    IHttpClient& http_;
    IDecisionSource& decisions_;
    std::shared_ptr<const ISystemOps> system_ops_;
};

// PRETTY_NAME from an os-release document, unquoted.
std::string ParseOsReleasePrettyName(const std::string& os_release);

} // namespace mdeploy
