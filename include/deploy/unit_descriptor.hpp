#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mdeploy {

struct UnitParams {
    std::string service_name;
    std::string root;
    std::string user;
    std::string group;
    std::string bind_host = "0.0.0.0";
    std::uint16_t port = 8765;
    std::string repo_owner;
    std::string repo_name;
};

// section -> key -> values in file order (a key may repeat, e.g. Environment).
using UnitSections = std::map<std::string, std::map<std::string, std::vector<std::string>>>;

std::string RenderServiceUnit(const UnitParams& p);

// INI-style unit parser: comments, blank lines and "\" continuations are
// handled; runs of whitespace in values are collapsed.
std::expected<UnitSections, std::string> ParseUnit(std::string_view text);

// One line per differing section/key, empty when the shapes match.
std::vector<std::string> DiffUnits(const UnitSections& expected, const UnitSections& actual);

} // namespace mdeploy
