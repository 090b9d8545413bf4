#include "deploy/deploy_actions.hpp"
#include "deploy/deploy_context.hpp"
#include "deploy/host_services.hpp"
#include "net/http_client.hpp"
#include "system/command_runner.hpp"
#include "system/decision_source.hpp"
#include "system/port_registry.hpp"
#include "system/service_manager.hpp"
#include "util/logger.hpp"
#include "util/tool_config.hpp"

#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

enum LongOnly : int {
    kOptAction = 1000,
    kOptUpdate,
    kOptRepair,
    kOptUpdateService,
    kOptRef,
    kOptSkipActivation,
    kOptDeviceKey,
    kOptToken,
    kOptDryRun,
    kOptConfig,
    kOptLogFile,
};

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [install|update|uninstall|repair|refresh-unit] [options]\n"
        "\n"
        "Actions:\n"
        "      --action <name>       Action to run (default: install)\n"
        "      --update              Same as 'update'\n"
        "  -u, --uninstall           Same as 'uninstall'\n"
        "      --repair              Same as 'repair'\n"
        "      --update-service      Same as 'refresh-unit'\n"
        "\n"
        "Options:\n"
        "  -b, --branch              Choose the branch from a list\n"
        "      --ref <name>          Branch or tag to deploy\n"
        "  -y, --yes                 Answer every confirmation with its default\n"
        "      --skip-activation     Do not activate the device (alias --skip-meeting)\n"
        "      --device-key <key>    Device key for activation\n"
        "      --token <code>        Token code for activation\n"
        "      --dry-run             Check and print the planned phases, change nothing\n"
        "      --config <path>       Tool configuration (default %s)\n"
        "  -v, --verbose             Debug output\n"
        "      --log-file <path>     Also write the log to a file\n"
        "  -h, --help                Show this help\n",
        argv0, mdeploy::kDefaultToolConfigPath);
}

bool SetAction(std::optional<mdeploy::DeployAction>& slot, mdeploy::DeployAction a) {
    if (slot && *slot != a) {
        std::fprintf(stderr, "Conflicting actions: %s and %s\n", mdeploy::ToString(*slot), mdeploy::ToString(a));
        return false;
    }
    slot = a;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using namespace mdeploy;

    std::optional<DeployAction> action;
    DeployContext ctx;
    std::string config_path = kDefaultToolConfigPath;
    bool config_explicit = false;
    bool verbose = false;
    std::string log_file;

    static option long_opts[] = {
        {"action", required_argument, nullptr, kOptAction},
        {"update", no_argument, nullptr, kOptUpdate},
        {"uninstall", no_argument, nullptr, 'u'},
        {"repair", no_argument, nullptr, kOptRepair},
        {"update-service", no_argument, nullptr, kOptUpdateService},
        {"branch", no_argument, nullptr, 'b'},
        {"ref", required_argument, nullptr, kOptRef},
        {"yes", no_argument, nullptr, 'y'},
        {"skip-activation", no_argument, nullptr, kOptSkipActivation},
        {"skip-meeting", no_argument, nullptr, kOptSkipActivation},
        {"device-key", required_argument, nullptr, kOptDeviceKey},
        {"token", required_argument, nullptr, kOptToken},
        {"dry-run", no_argument, nullptr, kOptDryRun},
        {"config", required_argument, nullptr, kOptConfig},
        {"verbose", no_argument, nullptr, 'v'},
        {"log-file", required_argument, nullptr, kOptLogFile},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hubyv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case kOptAction: {
                auto parsed = ParseDeployAction(optarg);
                if (!parsed) {
                    std::fprintf(stderr, "Unknown action: %s\n", optarg);
                    return 2;
                }
                if (!SetAction(action, *parsed)) return 2;
                break;
            }
            case kOptUpdate:
                if (!SetAction(action, DeployAction::Update)) return 2;
                break;
            case 'u':
                if (!SetAction(action, DeployAction::Uninstall)) return 2;
                break;
            case kOptRepair:
                if (!SetAction(action, DeployAction::Repair)) return 2;
                break;
            case kOptUpdateService:
                if (!SetAction(action, DeployAction::RefreshUnit)) return 2;
                break;

            case 'b':
                ctx.select_branch = true;
                break;
            case kOptRef:
                ctx.ref = optarg;
                break;
            case 'y':
                ctx.assume_yes = true;
                break;
            case kOptSkipActivation:
                ctx.skip_activation = true;
                break;
            case kOptDeviceKey:
                ctx.credential.device_key = optarg;
                break;
            case kOptToken:
                ctx.credential.token_code = optarg;
                break;
            case kOptDryRun:
                ctx.dry_run = true;
                break;
            case kOptConfig:
                config_path = optarg;
                config_explicit = true;
                break;
            case 'v':
                verbose = true;
                break;
            case kOptLogFile:
                log_file = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    for (int i = optind; i < argc; ++i) {
        auto parsed = ParseDeployAction(argv[i]);
        if (!parsed) {
            std::fprintf(stderr, "Unknown action: %s\n", argv[i]);
            PrintUsage(argv[0]);
            return 2;
        }
        if (!SetAction(action, *parsed)) return 2;
    }
    ctx.action = action.value_or(DeployAction::Install);

    if (ctx.credential.device_key.empty() != ctx.credential.token_code.empty()) {
        std::fprintf(stderr, "--device-key and --token must be given together\n");
        return 2;
    }
    if (ctx.skip_activation && !ctx.credential.Empty()) {
        std::fprintf(stderr, "--skip-activation cannot be combined with --device-key/--token\n");
        return 2;
    }
    if (ctx.select_branch && !ctx.ref.empty()) {
        std::fprintf(stderr, "--branch and --ref are mutually exclusive\n");
        return 2;
    }

    auto& logger = Logger::Instance();
    logger.SetLevel(verbose ? LogLevel::Debug : LogLevel::Info);
    logger.SetColor(::isatty(STDERR_FILENO) == 1);
    if (!log_file.empty() && !logger.SetMirrorFile(log_file)) {
        LogError("cannot open log file: %s", log_file.c_str());
        return 1;
    }

    std::error_code ec;
    if (config_explicit || std::filesystem::exists(config_path, ec)) {
        if (auto r = ctx.config.LoadFile(config_path); !r.is_ok()) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
        LogDebug("tool configuration loaded from %s", config_path.c_str());
    }

    PosixCommandRunner runner;
    SystemctlServiceManager services(runner);
    ProcPortRegistry ports;
    CurlHttpClient http;

    std::unique_ptr<IDecisionSource> decisions;
    if (ctx.assume_yes) {
        decisions = std::make_unique<PolicyDecisionSource>();
    } else {
        decisions = std::make_unique<TerminalDecisionSource>(std::cin, std::cout);
    }

    HostServices host{.runner = runner,
                      .services = services,
                      .ports = ports,
                      .http = http,
                      .decisions = *decisions};

    DeployActions actions(ctx, host);
    auto res = actions.Run();
    if (!res.is_ok()) {
        if (res.kind == ErrorKind::Aborted) {
            LogWarn("%s", res.msg.c_str());
        } else {
            LogError("%s", res.msg.c_str());
        }
        if (!res.hint.empty()) LogInfo("%s", res.hint.c_str());
        return 1;
    }
    return 0;
}
