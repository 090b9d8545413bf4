#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace mdeploy {

// Every operator prompt goes through one of these.
class IDecisionSource {
  public:
    virtual ~IDecisionSource() = default;

    virtual bool Confirm(const std::string& question, bool default_yes) = 0;

    // Gate for a destructive action as a whole. Defaults to no when asked;
    // assumed yes when running non-interactively.
    virtual bool ConfirmAction(const std::string& question) = 0;

    // Free-form answer; empty when the operator gives none.
    virtual std::string Ask(const std::string& question) = 0;

    // Numbered menu. Returns the picked index, `default_index` on a bare
    // Enter, nullopt on invalid input.
    virtual std::optional<std::size_t> Choose(const std::string& title,
                                              const std::vector<std::string>& options,
                                              std::size_t default_index) = 0;

    virtual bool IsInteractive() const = 0;
};

class TerminalDecisionSource final : public IDecisionSource {
  public:
    TerminalDecisionSource(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool Confirm(const std::string& question, bool default_yes) override;
    bool ConfirmAction(const std::string& question) override { return Confirm(question, false); }
    std::string Ask(const std::string& question) override;
    std::optional<std::size_t> Choose(const std::string& title,
                                      const std::vector<std::string>& options,
                                      std::size_t default_index) override;
    bool IsInteractive() const override { return true; }

  private:
    bool ReadLine(std::string& line);

    std::istream& in_;
    std::ostream& out_;
};

// Non-interactive: answers every confirmation with its default, picks the
// default entry, and has no free-form answers.
class PolicyDecisionSource final : public IDecisionSource {
  public:
    bool Confirm(const std::string& question, bool default_yes) override;
    bool ConfirmAction(const std::string& question) override;
    std::string Ask(const std::string& question) override;
    std::optional<std::size_t> Choose(const std::string& title,
                                      const std::vector<std::string>& options,
                                      std::size_t default_index) override;
    bool IsInteractive() const override { return false; }
};

} // namespace mdeploy
