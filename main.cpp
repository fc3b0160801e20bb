#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "spdlog/async.h"
#include "spdlog/spdlog.h"
#include "spdlog/cfg/env.h"
#include "spdlog/sinks/daily_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include "game_context.hpp"
#include "game_world.hpp"
#include "server.hpp"


void InitializeLogging() {
    spdlog::init_thread_pool(8192, 1); // queue size, number of threads
    const auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const auto fileSink    = std::make_shared<spdlog::sinks::daily_file_sink_mt>("logs/raid_server.log", 0, 0, true);

    std::vector<spdlog::sink_ptr> sinks{consoleSink, fileSink};
    const auto logger = std::make_shared<spdlog::async_logger>("Raid Server", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::err);
    spdlog::flush_every(std::chrono::seconds(10));

    // SPDLOG_LEVEL=debug etc. overrides the level set above
    spdlog::cfg::load_env_levels();

    std::atexit([]() { spdlog::shutdown(); });
}

void PrintUsage() {
    std::cout << "Usage: raid_server [options]\n"
              << "Options:\n"
              << "  -H, --host <address>       Address to listen on (default: 0.0.0.0)\n"
              << "  -p, --port <port>          Port to listen on (default: 8080)\n"
              << "  -m, --max-players <count>  Maximum number of players (default: 4)\n"
              << "  -t, --threads <count>      Worker threads (default: "
              << std::thread::hardware_concurrency() << ")\n"
              << "  -f, --max-frame <bytes>    Largest accepted message (default: 1048576)\n"
              << "  -h, --help                 Print this help message\n"
              << std::endl;
}

// Returns an exit code when the process should exit instead of serving.
std::optional<int> ParseCommandLineArguments(const int argc, char** argv, raid_server::ServerConfig& config) {
    const auto args = std::vector<std::string>(argv + 1, argv + argc);
    const raid_server::ServerConfig defaults;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& option = args[i];
        if (option == "-h" || option == "--help") {
            PrintUsage();
            return 0;
        }

        if (i + 1 >= args.size()) {
            std::cerr << "Missing value for " << option << "\n";
            return 1;
        }
        const std::string& value = args[++i];

        try {
            if (option == "-H" || option == "--host") {
                config.host = value;
            } else if (option == "-p" || option == "--port") {
                const int port = std::stoi(value);
                if (port < 1 || port > 65535) {
                    std::cerr << "Invalid port number, defaulting to " << defaults.port << "\n";
                    config.port = defaults.port;
                } else {
                    config.port = static_cast<uint16_t>(port);
                }
            } else if (option == "-m" || option == "--max-players") {
                const int maxPlayers = std::stoi(value);
                if (maxPlayers < 1) {
                    std::cerr << "Invalid player count, defaulting to " << defaults.maxPlayers << "\n";
                    config.maxPlayers = defaults.maxPlayers;
                } else {
                    config.maxPlayers = static_cast<size_t>(maxPlayers);
                }
            } else if (option == "-t" || option == "--threads") {
                const int threads = std::stoi(value);
                if (threads < 1 || static_cast<unsigned>(threads) > std::thread::hardware_concurrency()) {
                    std::cerr << "Invalid thread count, defaulting to " << defaults.threadCount << "\n";
                    config.threadCount = defaults.threadCount;
                } else {
                    config.threadCount = static_cast<size_t>(threads);
                }
            } else if (option == "-f" || option == "--max-frame") {
                const long long maxFrame = std::stoll(value);
                if (maxFrame < 1) {
                    std::cerr << "Invalid frame size, defaulting to " << defaults.maxFrameSize << "\n";
                    config.maxFrameSize = defaults.maxFrameSize;
                } else {
                    config.maxFrameSize = static_cast<size_t>(maxFrame);
                }
            } else {
                std::cerr << "Unknown option " << option << "\n";
                PrintUsage();
                return 1;
            }
        } catch (const std::logic_error&) {
            // std::stoi and friends throw invalid_argument / out_of_range
            std::cerr << "Invalid value '" << value << "' for " << option << "\n";
            return 1;
        }
    }
    return std::nullopt;
}

int main(const int argc, char** argv) {
    raid_server::ServerConfig config;
    if (const auto exitCode = ParseCommandLineArguments(argc, argv, config)) {
        return *exitCode;
    }

    InitializeLogging();

    try {
        auto world = std::make_unique<raid_server::GameWorld>();
        world->spawnBoss("Dragon", {500.0, 300.0});
        raid_server::GameContext context(std::move(world));

        raid_server::Server server(context);
        server.start(config);
        spdlog::info("Press Ctrl+C to exit");

        raid_server::Server::waitForSignal();
        server.stop();
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
