#include "ligaproxy/audit.hpp"
#include "ligaproxy/config.hpp"
#include "ligaproxy/dispatcher.hpp"
#include "ligaproxy/env.hpp"
#include "ligaproxy/http_server.hpp"
#include "ligaproxy/shutdown.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CliArgs {
    std::string command;
    std::string operation;
    std::string payload = "{}";
    std::string env_file = ".env";
};

void print_usage() {
    std::cerr << R"(Usage: ligaproxy <command> [options]
  serve                          Run the HTTP front-end (HOST, PORT)
  operations                     Print supported operations and their schemas
  exec <Operation> [payload]     Execute one operation; payload is JSON (default {})
  --env <path>                   Environment file to load (default: .env)

Configuration comes from the environment: RATE_LIMIT_REQUESTS, RATE_LIMIT_WINDOW,
MAX_RETRIES, BASE_DELAY, MAX_DELAY, BACKOFF_MULTIPLIER, JITTER_RANGE, LOG_LEVEL.
)";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliArgs args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--env") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for --env\n";
                return std::nullopt;
            }
            args.env_file = argv[++i];
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) return std::nullopt;
    args.command = positional[0];

    if (args.command == "exec") {
        if (positional.size() < 2 || positional.size() > 3) return std::nullopt;
        args.operation = positional[1];
        if (positional.size() == 3) args.payload = positional[2];
    } else if (args.command != "serve" && args.command != "operations") {
        std::cerr << "Unknown command: " << args.command << "\n";
        return std::nullopt;
    } else if (positional.size() != 1) {
        return std::nullopt;
    }

    return args;
}

std::atomic<bool> g_shutdown_requested{false};

void handle_signal(int) {
    g_shutdown_requested.store(true);
}

int run_exec(ligaproxy::OperationDispatcher& dispatcher, const CliArgs& args) {
    auto payload = nlohmann::json::parse(args.payload, nullptr, false);
    if (payload.is_discarded()) {
        std::cerr << "Payload is not valid JSON\n";
        return 1;
    }

    ligaproxy::RequestContext ctx{ligaproxy::new_request_id(), {}};
    auto result = dispatcher.execute(ctx, args.operation, payload);
    if (!result) {
        std::cout << ligaproxy::error_to_json(result.error()).dump(2) << "\n";
        return 1;
    }

    std::cout << ligaproxy::result_to_json(*result).dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    ligaproxy::load_env(args->env_file);

    auto config = ligaproxy::load_config();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error() << "\n";
        return 1;
    }

    ligaproxy::audit::init_logging(config->log_level, config->log_pattern);

    auto provider = ligaproxy::create_provider(*config);
    if (!provider) {
        std::cerr << provider.error() << "\n";
        return 1;
    }

    ligaproxy::OperationDispatcher dispatcher(**provider);

    int rc = 0;
    if (args->command == "operations") {
        nlohmann::ordered_json info = {
            {"supported_operations", dispatcher.operations()},
            {"schemas", dispatcher.operation_info()},
        };
        std::cout << info.dump(2) << "\n";
    } else if (args->command == "exec") {
        rc = run_exec(dispatcher, *args);
    } else {
        ligaproxy::ProxyServer server(dispatcher);
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        ligaproxy::ShutdownWatcher watcher(g_shutdown_requested, [&server] { server.stop(); });

        if (!server.listen(config->host, config->port)) {
            std::cerr << "Failed to listen on " << config->host << ":" << config->port << "\n";
            rc = 1;
        }
    }

    ligaproxy::audit::shutdown_logging();
    return rc;
}
