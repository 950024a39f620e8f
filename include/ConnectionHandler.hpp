#pragma once

#include <string>
#include "EntryStore.hpp"
#include "RequestParser.hpp"
#include "Response.hpp"
#include "SocketStream.hpp"

// serves exactly one request on one accepted socket, then closes it
class ConnectionHandler {
public:
    enum class State {
        AwaitRequestLine,
        AwaitHeaders,
        Dispatch,
        Respond,
        Closed
    };

    // takes ownership of client_socket
    ConnectionHandler(EntryStore& store, int client_socket);
    ~ConnectionHandler();

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    // drives the state machine until Closed
    void run();

    State state() const { return state_; }

private:
    EntryStore& store_;
    int client_socket_;
    SocketStream stream_;
    State state_;

    RequestLine request_;
    Headers headers_;
    Response response_;
    bool send_response_; // false when the peer vanished before a request line

    void await_request_line();
    void await_headers();
    void dispatch();
    void respond();
    void close_connection();

    Response handle_get();
    Response handle_post(std::size_t content_length);
};
