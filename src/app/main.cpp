/**
 * @file main.cpp
 * @brief vm_sandbox daemon and command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a complete sandbox service:
 *   Config → Logger → Hypervisor → Images/Domains/IP → Jobs/Workspaces/Terminals → Telemetry
 *
 * Without a subcommand the process runs as a daemon until SIGINT/SIGTERM.
 */

#include "core/config.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/sandbox_service.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace vm_sandbox;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cerr << R"(
  ╔═══════════════════════════════════════════╗
  ║            vm_sandbox v1.0.0              ║
  ║   Isolated code execution and             ║
  ║   workspace VMs on libvirt                ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

void print_usage() {
    std::cout << "Usage: vm_sandbox [OPTIONS] [COMMAND]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>   Log output directory (default: stdout)\n"
              << "  --mock             In-memory hypervisor and SSH host\n"
              << "  --help, -h         Show this help message\n"
              << "\nCommands:\n"
              << "  run <script> [--timeout N] [--profile P]\n"
              << "  workspace create <name> [--memory MB] [--vcpus N]\n"
              << "  workspace list\n"
              << "  workspace get|start|stop|delete <id>\n"
              << "\nWithout a command, runs as a daemon until interrupted.\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool mock = false;
    std::vector<std::string> command;
    uint32_t timeout_s = 10;
    std::string profile = "default";
    std::optional<uint32_t> memory_mb;
    std::optional<uint32_t> vcpus;
};

std::optional<uint32_t> parse_uint(const std::string& text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    auto numeric = [&](int& i, const std::string& flag) -> Result<uint32_t> {
        if (i + 1 >= argc) return Error{ErrorCode::InvalidArgument, flag + " requires a value"};
        auto value = parse_uint(argv[++i]);
        if (!value) return Error{ErrorCode::InvalidArgument, flag + " expects a number"};
        return *value;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--mock") {
            args.mock = true;
        } else if (arg == "--profile" && i + 1 < argc) {
            args.profile = argv[++i];
        } else if (arg == "--timeout") {
            auto v = numeric(i, arg);
            if (!v) return v.error();
            args.timeout_s = *v;
        } else if (arg == "--memory") {
            auto v = numeric(i, arg);
            if (!v) return v.error();
            args.memory_mb = *v;
        } else if (arg == "--vcpus") {
            auto v = numeric(i, arg);
            if (!v) return v.error();
            args.vcpus = *v;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (arg.starts_with("--")) {
            return Error{ErrorCode::InvalidArgument, "Unknown option " + arg};
        } else {
            args.command.push_back(arg);
        }
    }
    return args;
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

int run_script(SandboxService& svc, const CLIArgs& args) {
    if (args.command.size() != 2) {
        std::cerr << "run expects exactly one script path\n";
        return 2;
    }
    std::ifstream in(args.command[1], std::ios::binary);
    if (!in) {
        std::cerr << "Cannot read " << args.command[1] << "\n";
        return 2;
    }
    std::ostringstream code;
    code << in.rdbuf();

    auto id = svc.jobs().submit(code.str(), "python", args.timeout_s, args.profile);
    if (!id) {
        std::cerr << "Submit failed: " << id.error().message << "\n";
        return 2;
    }
    svc.logger().info("Submitted job " + *id);

    std::optional<JobSnapshot> snap;
    while (!g_shutdown_requested) {
        snap = svc.jobs().get_status(*id);
        if (!snap || is_terminal(snap->status)) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    // Wait for cleanup to finish before printing the final state.
    svc.jobs().shutdown();
    snap = svc.jobs().get_status(*id);
    if (!snap) {
        std::cerr << "Job " << *id << " disappeared\n";
        return 1;
    }
    std::cout << to_json(*snap) << std::endl;
    if (snap->status == JobStatus::Completed && snap->result) return snap->result->exit_code == 0 ? 0 : 1;
    return 1;
}

int require_id(const CLIArgs& args) {
    if (args.command.size() != 3) {
        std::cerr << "workspace " << args.command[1] << " expects an id\n";
        return 2;
    }
    return 0;
}

int report(const Result<void>& result, const std::string& what) {
    if (!result) {
        std::cerr << what << " failed: " << result.error().message << "\n";
        return 1;
    }
    std::cout << "{\"ok\":true}" << std::endl;
    return 0;
}

int workspace_command(SandboxService& svc, const CLIArgs& args) {
    if (args.command.size() < 2) {
        print_usage();
        return 2;
    }
    const std::string& verb = args.command[1];
    auto& ws = svc.workspaces();

    if (verb == "list") {
        auto all = ws.list();
        if (!all) {
            std::cerr << "List failed: " << all.error().message << "\n";
            return 1;
        }
        std::cout << to_json(*all) << std::endl;
        return 0;
    }

    if (int rc = require_id(args); rc != 0) return rc;
    const std::string& id = args.command[2];

    if (verb == "create") {
        auto created = ws.create(WorkspaceRequest{.name = id, .memory_mb = args.memory_mb, .vcpus = args.vcpus});
        if (!created) {
            std::cerr << "Create failed: " << created.error().message << "\n";
            return 1;
        }
        std::cout << "{\"workspace_id\":\"" << json_escape(*created) << "\"}" << std::endl;
        return 0;
    }
    if (verb == "get") {
        auto details = ws.get(id);
        if (!details) {
            std::cerr << "Get failed: " << details.error().message << "\n";
            return 1;
        }
        if (!details->has_value()) {
            std::cerr << "Workspace " << id << " not found\n";
            return 1;
        }
        std::cout << to_json(**details) << std::endl;
        return 0;
    }
    if (verb == "start") return report(ws.start(id), "Start");
    if (verb == "stop") return report(ws.stop(id), "Stop");
    if (verb == "delete") return report(ws.remove(id), "Delete");

    std::cerr << "Unknown workspace command " << verb << "\n";
    return 2;
}

int run_daemon(SandboxService& svc) {
    auto& logger = svc.logger();
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 60 seconds at 100ms intervals)
        if (loop_count % 600 == 0 && loop_count > 0) {
            logger.info("Status: " + std::to_string(svc.jobs().job_count()) + " jobs tracked, "
                        + std::to_string(svc.jobs().active_pipelines()) + " pipelines running, "
                        + std::to_string(svc.terminals().session_count()) + " terminals");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }
    logger.info("Shutdown requested. Cleaning up...");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << "\n";
        print_usage();
        return 2;
    }
    const CLIArgs& args = *parsed;
    if (args.command.empty()) print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();
    if (auto env = apply_env_overrides(config); !env) {
        std::cerr << "Invalid environment: " << env.error().message << std::endl;
        return 2;
    }

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.mock) config.hypervisor.mock = true;

    // ── Initialize Logger and telemetry ──────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "vm_sandbox",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "vm_sandbox_events",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else if (args.command.empty()) {
        log_sink = std::make_unique<StdoutSink>();
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SandboxService::Options opts{
        .config = std::move(config),
        .log_sink = std::move(log_sink),
        .metrics_sink = std::move(metrics_sink),
        .hypervisor = nullptr,
        .connector = {},
        .terminal_sink = {},
    };
    auto service = SandboxService::create(std::move(opts));
    if (!service) {
        std::cerr << "Failed to start sandbox service: " << service.error().message << std::endl;
        return 1;
    }
    SandboxService& svc = **service;

    int rc = 0;
    if (args.command.empty()) {
        rc = run_daemon(svc);
    } else if (args.command[0] == "run") {
        rc = run_script(svc, args);
    } else if (args.command[0] == "workspace") {
        rc = workspace_command(svc, args);
    } else {
        std::cerr << "Unknown command " << args.command[0] << "\n";
        print_usage();
        rc = 2;
    }

    svc.shutdown();
    svc.logger().info("vm_sandbox stopped. Jobs finished: " + std::to_string(svc.metrics().jobs_finished())
                      + ", failed: " + std::to_string(svc.metrics().jobs_failed()));
    return rc;
}
