#include "system/decision_source.hpp"

#include "util/logger.hpp"

#include <cctype>
#include <charconv>
#include <istream>
#include <ostream>

namespace mdeploy {

namespace {

std::string Trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

bool TerminalDecisionSource::ReadLine(std::string& line) {
    line.clear();
    if (!std::getline(in_, line)) return false;
    line = Trim(line);
    return true;
}

bool TerminalDecisionSource::Confirm(const std::string& question, bool default_yes) {
    out_ << question << (default_yes ? " [Y/n]: " : " [y/N]: ") << std::flush;
    std::string answer;
    if (!ReadLine(answer) || answer.empty()) {
        out_ << '\n';
        return default_yes;
    }
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

std::string TerminalDecisionSource::Ask(const std::string& question) {
    out_ << question << ": " << std::flush;
    std::string answer;
    (void)ReadLine(answer);
    return answer;
}

std::optional<std::size_t> TerminalDecisionSource::Choose(const std::string& title,
                                                          const std::vector<std::string>& options,
                                                          std::size_t default_index) {
    if (options.empty()) return std::nullopt;

    out_ << '\n' << title << '\n';
    for (std::size_t i = 0; i < options.size(); ++i) {
        out_ << "  " << (i + 1) << ") " << options[i];
        if (i == default_index) out_ << " (default)";
        out_ << '\n';
    }
    out_ << "\nChoose 1-" << options.size();
    if (default_index < options.size()) {
        out_ << " or press Enter for '" << options[default_index] << "'";
    }
    out_ << ": " << std::flush;

    std::string answer;
    if (!ReadLine(answer) || answer.empty()) {
        if (default_index < options.size()) return default_index;
        return std::nullopt;
    }

    std::size_t n = 0;
    const auto* first = answer.data();
    const auto* last = answer.data() + answer.size();
    const auto [ptr, ec] = std::from_chars(first, last, n);
    if (ec != std::errc{} || ptr != last || n < 1 || n > options.size()) {
        return std::nullopt;
    }
    return n - 1;
}

bool PolicyDecisionSource::Confirm(const std::string& question, bool default_yes) {
    LogDebug("non-interactive: '%s' -> %s", question.c_str(), default_yes ? "yes" : "no");
    return default_yes;
}

bool PolicyDecisionSource::ConfirmAction(const std::string& question) {
    LogDebug("non-interactive: '%s' -> yes", question.c_str());
    return true;
}

std::string PolicyDecisionSource::Ask(const std::string& question) {
    LogDebug("non-interactive: '%s' left empty", question.c_str());
    return {};
}

std::optional<std::size_t> PolicyDecisionSource::Choose(const std::string& title,
                                                        const std::vector<std::string>& options,
                                                        std::size_t default_index) {
    LogDebug("non-interactive: '%s' -> default entry", title.c_str());
    if (default_index < options.size()) return default_index;
    return std::nullopt;
}

} // namespace mdeploy
