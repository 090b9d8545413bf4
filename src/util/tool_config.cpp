#include "util/tool_config.hpp"

#include "util/config_json_utils.hpp"

namespace mdeploy {

void ToolConfig::Reset() {
    *this = ToolConfig{};
}

Result ToolConfig::LoadFile(const std::string& path) {
    nlohmann::json json;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "config: " + err);
    }

    ToolConfig parsed;
    if (!config::detail::FillConfigFromJson(json, parsed, err)) {
        return Result::Fail(-1, "config: " + err + " in " + path);
    }

    *this = std::move(parsed);
    return Result::Ok();
}

std::vector<std::uint16_t> ToolConfig::DeclaredPorts() const {
    std::vector<std::uint16_t> ports{port};
    for (unsigned p = stream_port_first; p <= stream_port_last; ++p) {
        if (p != port) ports.push_back(static_cast<std::uint16_t>(p));
    }
    return ports;
}

} // namespace mdeploy
