#pragma once

#include "system/command_runner.hpp"
#include "util/result.hpp"

#include <string>

namespace mdeploy {

// Host service manager operations on unit names ("motion-frontend", the
// ".service" suffix is implied).
class IServiceManager {
  public:
    virtual ~IServiceManager() = default;

    virtual Result DaemonReload() = 0;
    virtual Result Enable(const std::string& unit) = 0;
    virtual Result Disable(const std::string& unit) = 0;
    virtual Result Start(const std::string& unit) = 0;
    virtual Result Stop(const std::string& unit) = 0;
    virtual Result Restart(const std::string& unit) = 0;

    virtual bool IsActive(const std::string& unit) = 0;
    virtual bool IsEnabled(const std::string& unit) = 0;
};

class SystemctlServiceManager final : public IServiceManager {
  public:
    explicit SystemctlServiceManager(ICommandRunner& runner) : runner_(runner) {}

    Result DaemonReload() override;
    Result Enable(const std::string& unit) override;
    Result Disable(const std::string& unit) override;
    Result Start(const std::string& unit) override;
    Result Stop(const std::string& unit) override;
    Result Restart(const std::string& unit) override;

    bool IsActive(const std::string& unit) override;
    bool IsEnabled(const std::string& unit) override;

  private:
    Result RunSystemctl(const std::vector<std::string>& args, const char* what);

    ICommandRunner& runner_;
};

} // namespace mdeploy
