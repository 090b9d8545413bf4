#pragma once

#include "deploy/environment_prober.hpp"
#include "deploy/identity_provisioner.hpp"
#include "io/byte_source.hpp"
#include "net/http_client.hpp"
#include "system/command_runner.hpp"
#include "system/decision_source.hpp"
#include "system/port_registry.hpp"
#include "system/service_manager.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/mdeploy_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::filesystem::path operator/(const std::string& rel) const { return std::filesystem::path(path_) / rel; }

  private:
    std::string path_;
};

inline void WriteFile(const std::filesystem::path& p, const std::string& contents) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string ReadFile(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline mode_t ModeOf(const std::filesystem::path& p) {
    struct stat st{};
    if (::lstat(p.c_str(), &st) != 0) return 0;
    return st.st_mode & 07777;
}

class MemorySource final : public mdeploy::IByteSource {
  public:
    explicit MemorySource(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemorySource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> SizeHint() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

    std::string Describe() const override { return "memory"; }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

struct TarEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
    std::string link_target;
};

// pax tar, optionally gzip-compressed, built in memory.
inline std::string BuildTar(const std::vector<TarEntry>& entries, bool gzip = false) {
    std::vector<char> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK ||
        (gzip && archive_write_add_filter_gzip(a) != ARCHIVE_OK)) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive format setup failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        if (entry.file_type == AE_IFLNK) {
            archive_entry_set_symlink(hdr, entry.link_target.c_str());
        }
        const bool has_data = entry.file_type == AE_IFREG;
        archive_entry_set_size(hdr, has_data ? static_cast<la_int64_t>(entry.contents.size()) : 0);
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (has_data && !entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    return std::string(out.data(), used);
}

// Source snapshot shaped like a repository archive: one top-level directory
// holding the code subpaths and a requirements manifest.
inline std::string BuildReleaseTarball(const std::string& top = "Mme-main", bool with_config = false) {
    std::vector<TarEntry> entries{
        {top + "/", "", AE_IFDIR},
        {top + "/backend/server.py", "print('serve')\n"},
        {top + "/static/js/main.js", "// ui\n"},
        {top + "/templates/index.html", "<html></html>\n"},
        {top + "/scripts/run.sh", "#!/bin/sh\n"},
        {top + "/requirements.txt", "aiohttp\n# comment\njinja2\n"},
    };
    if (with_config) entries.push_back({top + "/config/motion_frontend.json", "{\"from_archive\": true}\n"});
    return BuildTar(entries, true);
}

// Routes by method and exact URL. Unrouted requests are transport errors.
class FakeHttpClient final : public mdeploy::IHttpClient {
  public:
    struct Call {
        mdeploy::HttpMethod method;
        std::string url;
        std::string body;
    };

    void Respond(mdeploy::HttpMethod m, const std::string& url, long status, std::string body = {}) {
        routes_[{m, url}] = mdeploy::HttpResponse{status, std::move(body)};
    }
    void ServeFile(const std::string& url, std::string bytes) { files_[url] = std::move(bytes); }

    std::expected<mdeploy::HttpResponse, std::string> Send(const mdeploy::HttpRequest& req) override {
        calls.push_back({req.method, req.url, req.body});
        auto it = routes_.find({req.method, req.url});
        if (it == routes_.end()) return std::unexpected("Could not resolve host: " + req.url);
        return it->second;
    }

    mdeploy::Result Download(const std::string& url, const std::string& dest_path,
                             const mdeploy::HttpTimeouts&) override {
        calls.push_back({mdeploy::HttpMethod::Get, url, {}});
        auto it = files_.find(url);
        if (it == files_.end()) return mdeploy::Result::Fail(-1, "download " + url + ": HTTP 404");
        WriteFile(dest_path, it->second);
        return mdeploy::Result::Ok();
    }

    int CountCalls(mdeploy::HttpMethod m, const std::string& url) const {
        return static_cast<int>(std::count_if(calls.begin(), calls.end(),
                                              [&](const Call& c) { return c.method == m && c.url == url; }));
    }

    std::vector<Call> calls;

  private:
    std::map<std::pair<mdeploy::HttpMethod, std::string>, mdeploy::HttpResponse> routes_;
    std::map<std::string, std::string> files_;
};

// Records every command. Exit codes come from `handler` when set, 0 otherwise.
// "python3 -m venv <dir>" creates <dir>/bin/python so runtime checks see it.
class FakeCommandRunner final : public mdeploy::ICommandRunner {
  public:
    using ICommandRunner::Run;
    using Handler = std::function<std::optional<mdeploy::CommandResult>(const std::vector<std::string>&)>;

    mdeploy::CommandResult Run(const std::vector<std::string>& argv, const mdeploy::CommandOptions&) override {
        commands.push_back(argv);
        if (handler) {
            if (auto r = handler(argv)) return *r;
        }
        if (argv.size() >= 4 && argv[0] == "python3" && argv[1] == "-m" && argv[2] == "venv") {
            WriteFile(std::filesystem::path(argv.back()) / "bin" / "python", "");
        }
        return Exit(0);
    }

    bool HasProgram(const std::string& name) const override { return programs.count(name) > 0; }

    static mdeploy::CommandResult Exit(int code, std::string output = {}) {
        mdeploy::CommandResult r;
        r.started = true;
        r.exit_code = code;
        r.output = std::move(output);
        return r;
    }

    // Commands whose joined argv starts with `prefix`.
    int CountPrefix(const std::string& prefix) const {
        return static_cast<int>(std::count_if(commands.begin(), commands.end(), [&](const auto& argv) {
            return mdeploy::DescribeCommand(argv).rfind(prefix, 0) == 0;
        }));
    }

    std::vector<std::vector<std::string>> commands;
    std::set<std::string> programs;
    Handler handler;
};

class FakeServiceManager final : public mdeploy::IServiceManager {
  public:
    struct Unit {
        bool active = false;
        bool enabled = false;
    };

    mdeploy::Result DaemonReload() override {
        ++reloads;
        return mdeploy::Result::Ok();
    }
    mdeploy::Result Enable(const std::string& unit) override {
        log.push_back("enable " + unit);
        units[unit].enabled = true;
        return mdeploy::Result::Ok();
    }
    mdeploy::Result Disable(const std::string& unit) override {
        log.push_back("disable " + unit);
        units[unit].enabled = false;
        return mdeploy::Result::Ok();
    }
    mdeploy::Result Start(const std::string& unit) override {
        log.push_back("start " + unit);
        if (on_start) on_start(unit);
        if (refuse_start.count(unit)) return mdeploy::Result::Fail(1, "systemctl start " + unit + ": exit code 1");
        units[unit].active = !stays_inactive.count(unit);
        return mdeploy::Result::Ok();
    }
    mdeploy::Result Stop(const std::string& unit) override {
        log.push_back("stop " + unit);
        units[unit].active = false;
        return mdeploy::Result::Ok();
    }
    mdeploy::Result Restart(const std::string& unit) override {
        log.push_back("restart " + unit);
        units[unit].active = true;
        return mdeploy::Result::Ok();
    }
    bool IsActive(const std::string& unit) override { return units[unit].active; }
    bool IsEnabled(const std::string& unit) override { return units[unit].enabled; }

    int Count(const std::string& entry) const {
        return static_cast<int>(std::count(log.begin(), log.end(), entry));
    }

    std::map<std::string, Unit> units;
    std::vector<std::string> log;
    std::set<std::string> refuse_start;
    std::set<std::string> stays_inactive;
    std::function<void(const std::string&)> on_start;
    int reloads = 0;
};

// Port holders that exit on SIGTERM unless listed as stubborn.
class FakePortRegistry final : public mdeploy::IPortRegistry {
  public:
    std::vector<int> ListOwners(std::uint16_t port) override {
        ++list_calls;
        auto it = owners.find(port);
        return it == owners.end() ? std::vector<int>{} : it->second;
    }

    mdeploy::Result Signal(int pid, int signo) override {
        signals.emplace_back(pid, signo);
        if (signo == SIGKILL || !stubborn.count(pid)) Drop(pid);
        return mdeploy::Result::Ok();
    }

    bool IsAlive(int pid) override {
        for (const auto& [port, pids] : owners) {
            if (std::find(pids.begin(), pids.end(), pid) != pids.end()) return true;
        }
        return false;
    }

    std::map<std::uint16_t, std::vector<int>> owners;
    std::set<int> stubborn;
    std::vector<std::pair<int, int>> signals;
    int list_calls = 0;

  private:
    void Drop(int pid) {
        for (auto& [port, pids] : owners) {
            pids.erase(std::remove(pids.begin(), pids.end(), pid), pids.end());
        }
    }
};

// Answers from queues; an empty queue falls back to the prompt's default.
class ScriptedDecisionSource final : public mdeploy::IDecisionSource {
  public:
    bool Confirm(const std::string& question, bool default_yes) override {
        questions.push_back(question);
        if (confirms.empty()) return default_yes;
        const bool a = confirms.front();
        confirms.pop_front();
        return a;
    }
    bool ConfirmAction(const std::string& question) override {
        questions.push_back(question);
        return action_confirmed;
    }
    std::string Ask(const std::string& question) override {
        questions.push_back(question);
        if (answers.empty()) return {};
        auto a = answers.front();
        answers.pop_front();
        return a;
    }
    std::optional<std::size_t> Choose(const std::string& title, const std::vector<std::string>& options,
                                      std::size_t default_index) override {
        questions.push_back(title);
        offered = options;
        if (invalid_choice) return std::nullopt;
        if (choice) return choice;
        if (default_index < options.size()) return default_index;
        return std::nullopt;
    }
    bool IsInteractive() const override { return interactive; }

    bool Asked(const std::string& fragment) const {
        return std::any_of(questions.begin(), questions.end(),
                           [&](const std::string& q) { return q.find(fragment) != std::string::npos; });
    }

    std::deque<bool> confirms;
    std::deque<std::string> answers;
    std::optional<std::size_t> choice;
    bool invalid_choice = false;
    bool action_confirmed = true;
    bool interactive = true;
    std::vector<std::string> questions;
    std::vector<std::string> offered;
};

// In-memory accounts. Ownership is tracked per path; nothing is chowned.
class FakeIdentityOps final : public mdeploy::IdentityProvisioner::ISystemOps {
  public:
    bool UserExists(const std::string& user) const override { return users.count(user) > 0; }
    bool GroupExists(const std::string& group) const override { return groups.count(group) > 0; }
    std::vector<std::string> GroupsOf(const std::string& user) const override {
        auto it = users.find(user);
        if (it == users.end()) return {};
        return {it->second.begin(), it->second.end()};
    }

    mdeploy::Result CreateGroup(const std::string& group) const override {
        groups.insert(group);
        return mdeploy::Result::Ok();
    }
    mdeploy::Result CreateUser(const std::string& user, const std::string& group,
                               const std::string& home) const override {
        users[user] = {group};
        homes[user] = home;
        return mdeploy::Result::Ok();
    }
    mdeploy::Result AddToGroup(const std::string& user, const std::string& group) const override {
        users[user].insert(group);
        return mdeploy::Result::Ok();
    }
    mdeploy::Result DeleteUser(const std::string& user) const override {
        users.erase(user);
        return mdeploy::Result::Ok();
    }
    mdeploy::Result DeleteGroup(const std::string& group) const override {
        groups.erase(group);
        return mdeploy::Result::Ok();
    }

    // Ownership sticks to the inode: a file replaced by rename reads back as root.
    mdeploy::Result ChangeOwner(const std::filesystem::path& path, const std::string& user,
                                const std::string&) const override {
        owners[path.lexically_normal().string()] = {user, InodeOf(path)};
        return mdeploy::Result::Ok();
    }
    std::optional<std::string> OwnerName(const std::filesystem::path& path) const override {
        auto it = owners.find(path.lexically_normal().string());
        if (it == owners.end() || it->second.second != InodeOf(path)) return std::string("root");
        return it->second.first;
    }

    static ino_t InodeOf(const std::filesystem::path& path) {
        struct stat st{};
        if (::lstat(path.c_str(), &st) != 0) return 0;
        return st.st_ino;
    }

    mutable std::map<std::string, std::set<std::string>> users;
    mutable std::set<std::string> groups;
    mutable std::map<std::string, std::string> homes;
    mutable std::map<std::string, std::pair<std::string, ino_t>> owners;
};

class FakeProbeOps final : public mdeploy::EnvironmentProber::ISystemOps {
  public:
    uid_t EffectiveUid() const override { return uid; }
    std::string KernelName() const override { return kernel; }
    std::string Machine() const override { return machine; }
    bool FileExists(const std::string& path) const override { return files.count(path) > 0; }
    std::optional<std::string> ReadFile(const std::string& path) const override {
        auto it = files.find(path);
        if (it == files.end()) return std::nullopt;
        return it->second;
    }

    uid_t uid = 0;
    std::string kernel = "Linux";
    std::string machine = "aarch64";
    std::map<std::string, std::string> files{
        {"/etc/debian_version", "12.5\n"},
        {"/etc/os-release", "PRETTY_NAME=\"Debian GNU/Linux 12 (bookworm)\"\nID=debian\n"},
    };
};

inline void NoSleep(std::chrono::milliseconds) {}

} // namespace testutil
