#include <atomic>
#include <csignal>
#include <memory>
#include <iostream>
#include "Config.hpp"
#include "EntryStore.hpp"
#include "server.hpp"

// read from the signal handler; lock-free atomic pointer
static std::atomic<Server*> g_server(nullptr);

static void signal_handler(int sig) {
    (void)sig;
    Server* server = g_server.load();
    if (server) {
        server->stop();
    }
}

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    auto store = std::make_shared<EntryStore>(config.data_file);

    try {
        Server server(store, config.port, config.max_connections);

        g_server = &server;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::cout << "Data file: " << store->path() << std::endl;
        server.start();

        g_server = nullptr;
    } catch (const std::exception& e) {
        g_server = nullptr;
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
