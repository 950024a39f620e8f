#include "server.hpp"
#include "ConnectionHandler.hpp"
#include <iostream>
#include <sys/socket.h>
#include <unistd.h>
#include <thread>
#include <stdexcept>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <system_error>
#include <utility>
#include <cstring>  // strerror
#include <arpa/inet.h> // htons
#include <netinet/in.h> // sockaddr_in

/*
    Constructor method for Server class.
    Args:
        store: the EntryStore, kept alive by any handler still running after stop()
        port: port number to listen on (0 for any free port)
        max_connections: cap on concurrently served connections, 0 for none
    Returns:
        void
*/
Server::Server(std::shared_ptr<EntryStore> store, int port, std::size_t max_connections)
    : store_(std::move(store)),
      port_(port),
      server_fd_(-1),
      max_connections_(max_connections),
      running_(false),
      admission_(std::make_shared<Admission>()) {
    // create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0); // IPv4, TCP
    if (server_fd_ < 0) { // socket creation error
        throw std::runtime_error(std::string("Failed to create socket: ") + std::strerror(errno));
    }

    // set socket options
    int opt = 1;
    // SO_REUSEADDR: allow reuse of local address
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close(server_fd_);
        throw std::runtime_error(std::string("Failed to set socket options: ") + std::strerror(errno));
    }

    // bind socket to address
    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY; // bind to all interfaces
    address.sin_port = htons(static_cast<uint16_t>(port_)); // network byte order
    if (bind(server_fd_, (struct sockaddr*) &address, sizeof(address)) < 0) {
        int err = errno;
        close(server_fd_);
        throw std::runtime_error("Failed to bind socket to port " + std::to_string(port_) + ": " + std::strerror(err));
    }

    // read back the port actually bound (differs when port_ was 0)
    socklen_t address_len = sizeof(address);
    if (getsockname(server_fd_, (struct sockaddr*) &address, &address_len) == 0) {
        port_ = ntohs(address.sin_port);
    }

    // start listening
    if (listen(server_fd_, SOMAXCONN) < 0) { // SOMAXCONN: maximum pending connections
        int err = errno;
        close(server_fd_);
        throw std::runtime_error(std::string("Failed to listen on socket: ") + std::strerror(err));
    }

    running_ = true;
}

/*
    Destructor method for Server class.
*/
Server::~Server() {
    if (server_fd_ != -1) {
        close(server_fd_);
        std::cout << "Server shutting down" << std::endl;
    }
}

/*
    Start the server to accept incoming connections. Runs a listening loop
    until stop() is called.
    Args:
        none
    Returns:
        void
*/
void Server::start() {
    std::cout << "Server starting on port " << port_ << std::endl;
    if (max_connections_ > 0) {
        std::cout << "Connection cap: " << max_connections_ << std::endl;
    }

    struct sockaddr_in client_address; // stores client IP address and port

    while (running_) {
        if (!wait_for_slot()) {
            break; // stopped while waiting
        }

        // call accept() to get a client socket
        socklen_t client_address_len = sizeof(client_address); // needed for accept()
        int client_fd = accept(server_fd_, (struct sockaddr*) &client_address, &client_address_len);
        if (client_fd < 0) { // accept() error
            if (!running_) {
                break; // listening socket was shut down by stop()
            }
            if (errno != EINTR) {
                std::cerr << "Failed to accept client connection: " << std::strerror(errno) << std::endl;
            }
            continue; // skip to next iteration
        }

        {
            std::lock_guard<std::mutex> lock(admission_->mtx);
            ++admission_->active;
        }

        /*
            Spawn a new thread to handle this client
            Store, Admission: copied shared_ptrs, a handler may outlive the Server
            Detach: thread runs independently of the main thread
        */
        std::shared_ptr<EntryStore> store = store_;
        std::shared_ptr<Admission> admission = admission_;
        try {
            std::thread([store, admission, client_fd]() {
                handle_client(store, *admission, client_fd);
            }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "Failed to spawn handler thread: " << e.what() << std::endl;
            close(client_fd);
            std::lock_guard<std::mutex> lock(admission_->mtx);
            --admission_->active;
        }
    }

    running_ = false;
    std::cout << "Server stopped accepting connections" << std::endl;
}

/*
    Ask the accept loop to exit. Only touches an atomic and shutdown(),
    so it may be called from a signal handler.
    Args:
        none
    Returns:
        void
*/
void Server::stop() {
    running_ = false;
    if (server_fd_ != -1) {
        shutdown(server_fd_, SHUT_RDWR); // wakes a blocked accept()
    }
}

std::size_t Server::active_connections() const {
    std::lock_guard<std::mutex> lock(admission_->mtx);
    return admission_->active;
}

/*
    Wait until another connection may be admitted.
    Args:
        none
    Returns:
        false if the server was stopped while waiting
*/
bool Server::wait_for_slot() {
    if (max_connections_ == 0) {
        return running_; // unbounded
    }

    std::unique_lock<std::mutex> lock(admission_->mtx);
    // timed wait so a stop() from a signal handler is noticed without a notify
    while (running_ && admission_->active >= max_connections_) {
        admission_->cv.wait_for(lock, std::chrono::milliseconds(100));
    }
    return running_;
}

/*
    Handle a single client connection, then release its admission slot.
    Args:
        store: the shared EntryStore
        admission: slot counter of the owning Server
        client_socket: the socket file descriptor for the client
    Returns:
        void
*/
void Server::handle_client(const std::shared_ptr<EntryStore>& store, Admission& admission, int client_socket) {
    try {
        ConnectionHandler handler(*store, client_socket);
        handler.run();
    } catch (const std::exception& e) {
        std::cerr << "Connection handler error: " << e.what() << std::endl;
    }

    std::lock_guard<std::mutex> lock(admission.mtx);
    --admission.active;
    admission.cv.notify_one();
}
