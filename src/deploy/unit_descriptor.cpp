#include "deploy/unit_descriptor.hpp"

#include <sstream>

namespace mdeploy {

namespace {

std::string Trim(std::string_view s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(" \t\r");
    return std::string(s.substr(b, e - b + 1));
}

std::string CollapseSpaces(std::string_view s) {
    std::string out;
    bool space = false;
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            space = true;
            continue;
        }
        if (space && !out.empty()) out.push_back(' ');
        space = false;
        out.push_back(c);
    }
    return out;
}

std::string Join(const std::vector<std::string>& v) {
    std::string s;
    for (const auto& e : v) {
        if (!s.empty()) s += " | ";
        s += e;
    }
    return s;
}

} // namespace

std::string RenderServiceUnit(const UnitParams& p) {
    const std::string venv = p.root + "/.venv";
    std::ostringstream os;
    os << "[Unit]\n"
       << "Description=Motion Frontend - Web Interface for Video Surveillance\n"
       << "Documentation=https://github.com/" << p.repo_owner << "/" << p.repo_name << "\n"
       << "After=network-online.target\n"
       << "Wants=network-online.target\n"
       << "\n"
       << "[Service]\n"
       << "Type=simple\n"
       << "User=" << p.user << "\n"
       << "Group=" << p.group << "\n"
       << "WorkingDirectory=" << p.root << "\n"
       << "Environment=\"PATH=" << venv << "/bin:/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin\"\n"
       << "Environment=\"PYTHONUNBUFFERED=1\"\n"
       << "Environment=\"HOME=" << p.root << "\"\n"
       << "\n"
       << "ExecStart=" << venv << "/bin/python -m backend.server \\\n"
       << "    --host " << p.bind_host << " \\\n"
       << "    --port " << p.port << " \\\n"
       << "    --root " << p.root << "\n"
       << "\n"
       << "# Graceful shutdown: SIGTERM, then up to 15 seconds for a clean exit\n"
       << "KillMode=mixed\n"
       << "KillSignal=SIGTERM\n"
       << "TimeoutStopSec=15\n"
       << "\n"
       << "Restart=always\n"
       << "RestartSec=5\n"
       << "StartLimitBurst=5\n"
       << "StartLimitIntervalSec=60\n"
       << "\n"
       << "NoNewPrivileges=true\n"
       << "PrivateTmp=true\n"
       << "\n"
       << "StandardOutput=journal\n"
       << "StandardError=journal\n"
       << "SyslogIdentifier=" << p.service_name << "\n"
       << "\n"
       << "[Install]\n"
       << "WantedBy=multi-user.target\n";
    return os.str();
}

std::expected<UnitSections, std::string> ParseUnit(std::string_view text) {
    UnitSections out;
    std::istringstream is{std::string(text)};
    std::string raw;
    std::string section;
    int lineno = 0;

    while (std::getline(is, raw)) {
        ++lineno;
        std::string line = Trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';') continue;

        while (!line.empty() && line.back() == '\\') {
            line.pop_back();
            std::string next;
            if (!std::getline(is, next)) break;
            ++lineno;
            line += " " + Trim(next);
        }
        // A lone trailing backslash continues into nothing.
        line = Trim(line);
        if (line.empty()) continue;

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                return std::unexpected("line " + std::to_string(lineno) + ": malformed section header");
            }
            section = line.substr(1, line.size() - 2);
            out[section];
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            return std::unexpected("line " + std::to_string(lineno) + ": expected key=value");
        }
        if (section.empty()) {
            return std::unexpected("line " + std::to_string(lineno) + ": assignment outside a section");
        }
        const std::string key = Trim(std::string_view(line).substr(0, eq));
        const std::string value = CollapseSpaces(Trim(std::string_view(line).substr(eq + 1)));
        out[section][key].push_back(value);
    }
    return out;
}

std::vector<std::string> DiffUnits(const UnitSections& expected, const UnitSections& actual) {
    std::vector<std::string> diff;

    for (const auto& [section, keys] : expected) {
        auto sit = actual.find(section);
        if (sit == actual.end()) {
            diff.push_back("missing section [" + section + "]");
            continue;
        }
        for (const auto& [key, values] : keys) {
            auto kit = sit->second.find(key);
            if (kit == sit->second.end()) {
                diff.push_back("[" + section + "] missing " + key);
            } else if (kit->second != values) {
                diff.push_back("[" + section + "] " + key + ": '" + Join(kit->second) + "', expected '" +
                               Join(values) + "'");
            }
        }
        for (const auto& kv : sit->second) {
            if (!keys.count(kv.first)) diff.push_back("[" + section + "] unexpected " + kv.first);
        }
    }
    for (const auto& kv : actual) {
        if (!expected.count(kv.first)) diff.push_back("unexpected section [" + kv.first + "]");
    }
    return diff;
}

} // namespace mdeploy
