#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <EntryStore.hpp>

class Server {
public:
    // constructor - shares ownership of the store with every handler thread;
    // port 0 picks an ephemeral port, max_connections 0 means no cap
    explicit Server(std::shared_ptr<EntryStore> store, int port = 8080, std::size_t max_connections = 0);

    ~Server(); // destructor to clean up socket descriptors

    // prevent copying the server
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // main loop: accept connections and spawn threads, returns after stop()
    void start();

    // safe to call from another thread or a signal handler
    void stop();

    int port() const { return port_; }
    std::size_t max_connections() const { return max_connections_; }
    std::size_t active_connections() const;

private:
    // shared with detached handler threads so it outlives the Server if needed
    struct Admission {
        std::mutex mtx;
        std::condition_variable cv;
        std::size_t active = 0;
    };

    std::shared_ptr<EntryStore> store_;
    int port_;
    int server_fd_; // file descriptor for the server socket
    std::size_t max_connections_;
    std::atomic<bool> running_;
    std::shared_ptr<Admission> admission_;

    // blocks while max_connections_ handlers are active
    bool wait_for_slot();

    // helper to handle single client connection, runs on its own thread
    static void handle_client(const std::shared_ptr<EntryStore>& store, Admission& admission, int client_socket);
};
