#include "logger.h"
#include "peer.h"
#include "peer_config.h"
#include "socket.h"
#include "stop_token.h"
#include "version.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace blockshare;

// Set from the signal handler, forwarded to the stop token by a watcher thread
static std::atomic<bool> g_signal_received{false};

static void signal_handler(int) {
    g_signal_received = true;
}

int main(int argc, char* argv[]) {
    const std::string program_name = argc > 0 ? argv[0] : "blockshare";
    std::vector<std::string> args(argv + 1, argv + argc);

    PeerConfig config;
    try {
        if (!parse_command_line(args, config)) {
            version::print_version_info();
            std::cout << usage_text(program_name);
            return static_cast<int>(ExitCode::OK);
        }
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage_text(program_name);
        return static_cast<int>(ExitCode::USAGE);
    }

    LogLevel level = LogLevel::INFO;
    parse_log_level(config.log_level, level);
    Logger::getInstance().set_log_level(level);

    LOG_MAIN_INFO("blockshare " << version::STRING << " starting as "
                  << (config.seed ? "seeder" : "leecher") << " on " << config.host << ":" << config.port);

    std::signal(SIGINT, signal_handler);
#ifndef _WIN32
    std::signal(SIGTERM, signal_handler);
#endif

    StopToken stop_token;
    std::atomic<bool> finished{false};
    std::thread signal_watcher([&]() {
        while (!finished.load()) {
            if (g_signal_received.load()) {
                LOG_MAIN_INFO("Signal received, shutting down");
                stop_token.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    if (!init_socket_library()) {
        finished = true;
        signal_watcher.join();
        return static_cast<int>(ExitCode::USAGE);
    }

    ExitCode code;
    {
        Peer peer(config, stop_token);
        code = peer.run();
        LOG_MAIN_DEBUG("Final statistics: " << peer.get_statistics_json().dump());
    }

    finished = true;
    signal_watcher.join();
    cleanup_socket_library();

    LOG_MAIN_INFO("Exiting with status " << static_cast<int>(code));
    return static_cast<int>(code);
}
