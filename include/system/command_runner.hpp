#pragma once

#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace mdeploy {

struct CommandResult {
    bool started = false;
    int exit_code = -1;
    std::string output;  // stdout+stderr when captured
    std::string error;   // spawn/wait failure

    bool Succeeded() const { return started && exit_code == 0; }
};

struct CommandOptions {
    bool capture_output = true;
    // Extra environment entries, "KEY=value".
    std::vector<std::string> env;
    std::chrono::seconds timeout{600};
};

// argv[0] is resolved through PATH. No shell is involved.
class ICommandRunner {
  public:
    virtual ~ICommandRunner() = default;
    virtual CommandResult Run(const std::vector<std::string>& argv,
                              const CommandOptions& opt) = 0;

    CommandResult Run(const std::vector<std::string>& argv) { return Run(argv, CommandOptions{}); }

    // True when the program is found in PATH.
    virtual bool HasProgram(const std::string& name) const = 0;
};

class PosixCommandRunner final : public ICommandRunner {
  public:
    using ICommandRunner::Run;
    CommandResult Run(const std::vector<std::string>& argv, const CommandOptions& opt) override;
    bool HasProgram(const std::string& name) const override;
};

std::string DescribeCommand(const std::vector<std::string>& argv);

} // namespace mdeploy
