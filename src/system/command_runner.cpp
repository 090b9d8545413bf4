#include "system/command_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <string_view>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mdeploy {

namespace {

std::vector<char*> ToArgv(const std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 1);
    for (const auto& a : args) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

std::vector<std::string> MergedEnvironment(const std::vector<std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string_view entry(*e);
        const auto eq = entry.find('=');
        bool overridden = false;
        for (const auto& x : extra) {
            if (eq != std::string_view::npos && x.compare(0, eq + 1, entry.substr(0, eq + 1)) == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.emplace_back(entry);
    }
    env.insert(env.end(), extra.begin(), extra.end());
    return env;
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::string DescribeCommand(const std::vector<std::string>& argv) {
    std::ostringstream os;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) os << ' ';
        os << argv[i];
    }
    return os.str();
}

bool PosixCommandRunner::HasProgram(const std::string& name) const {
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    std::string_view rest(path ? path : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin");
    while (!rest.empty()) {
        const auto pos = rest.find(':');
        const std::string dir(rest.substr(0, pos));
        if (!dir.empty()) {
            const std::string candidate = dir + "/" + name;
            struct stat st{};
            if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
                ::access(candidate.c_str(), X_OK) == 0) {
                return true;
            }
        }
        if (pos == std::string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }
    return false;
}

CommandResult PosixCommandRunner::Run(const std::vector<std::string>& argv,
                                      const CommandOptions& opt) {
    CommandResult rr;
    if (argv.empty()) {
        rr.error = "empty command";
        return rr;
    }

    LogDebug("exec: %s", DescribeCommand(argv).c_str());

    int pipe_fds[2] = {-1, -1};
    if (opt.capture_output && ::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        rr.error = std::string("pipe failed: ") + std::strerror(errno);
        return rr;
    }
    Fd read_end(pipe_fds[0]);
    Fd write_end(pipe_fds[1]);

    const auto env = MergedEnvironment(opt.env);
    auto c_argv = ToArgv(argv);
    auto c_env = ToArgv(env);

    const pid_t pid = ::fork();
    if (pid < 0) {
        rr.error = std::string("fork failed: ") + std::strerror(errno);
        return rr;
    }

    if (pid == 0) {
        if (opt.capture_output) {
            ::dup2(write_end.Get(), STDOUT_FILENO);
            ::dup2(write_end.Get(), STDERR_FILENO);
        }
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvpe(c_argv[0], c_argv.data(), c_env.data());
        _exit(127);
    }

    rr.started = true;
    write_end.Close();

    const auto deadline = std::chrono::steady_clock::now() + opt.timeout;
    bool timed_out = false;

    if (opt.capture_output) {
        char buf[4096];
        while (true) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                timed_out = true;
                break;
            }
            pollfd pfd{read_end.Get(), POLLIN, 0};
            const int pr = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left.count(), 1000)));
            if (pr < 0 && errno != EINTR) break;
            if (pr <= 0) continue;
            const ssize_t n = ::read(read_end.Get(), buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            rr.output.append(buf, static_cast<size_t>(n));
        }
    }

    if (timed_out) ::kill(pid, SIGKILL);

    int status = 0;
    while (true) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0) {
            if (errno == EINTR) continue;
            rr.error = std::string("waitpid failed: ") + std::strerror(errno);
            return rr;
        }
        if (!timed_out && std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            ::kill(pid, SIGKILL);
        }
        ::usleep(50 * 1000);
    }

    rr.exit_code = DecodeWaitStatus(status);
    if (timed_out) {
        rr.error = "timed out after " + std::to_string(opt.timeout.count()) + "s";
        if (rr.exit_code == 0) rr.exit_code = -1;
    }
    if (rr.exit_code == 127 && rr.output.empty()) {
        rr.error = "command not found: " + argv[0];
    }
    return rr;
}

} // namespace mdeploy
