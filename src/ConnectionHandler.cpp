#include "ConnectionHandler.hpp"
#include <iostream>
#include <unistd.h>

/*
    Constructor method for ConnectionHandler class.
    Args:
        store: reference to the shared EntryStore
        client_socket: accepted socket, closed by this handler
*/
ConnectionHandler::ConnectionHandler(EntryStore& store, int client_socket)
    : store_(store),
      client_socket_(client_socket),
      stream_(client_socket),
      state_(State::AwaitRequestLine),
      response_(StatusCode::BAD_REQUEST),
      send_response_(true) {}

ConnectionHandler::~ConnectionHandler() {
    close_connection();
}

/*
    Serve one request: read the request line and headers, dispatch, write
    the response and close.
    Args:
        none
    Returns:
        void
*/
void ConnectionHandler::run() {
    while (state_ != State::Closed) {
        switch (state_) {
            case State::AwaitRequestLine:
                await_request_line();
                break;
            case State::AwaitHeaders:
                await_headers();
                break;
            case State::Dispatch:
                dispatch();
                break;
            case State::Respond:
                respond();
                break;
            case State::Closed:
                break;
        }
    }
}

void ConnectionHandler::await_request_line() {
    std::string line;
    if (!stream_.read_line(line)) {
        // nothing to answer: the client went away before sending a request
        std::cerr << "Error reading request line" << std::endl;
        send_response_ = false;
        state_ = State::Respond;
        return;
    }

    request_ = parse_request_line(line);
    if (!request_.valid()) {
        response_ = Response(StatusCode::BAD_REQUEST);
        state_ = State::Respond;
        return;
    }
    state_ = State::AwaitHeaders;
}

void ConnectionHandler::await_headers() {
    std::string line;
    while (true) {
        if (!stream_.read_line(line)) {
            std::cerr << "Error reading headers for " << request_.method << " " << request_.path << std::endl;
            response_ = Response(StatusCode::BAD_REQUEST);
            state_ = State::Respond;
            return;
        }
        if (!parse_header_line(line, headers_)) {
            break; // blank line
        }
    }
    state_ = State::Dispatch;
}

void ConnectionHandler::dispatch() {
    std::cout << request_.method << " " << request_.path << std::endl;

    if (request_.method == "GET" && request_.path == "/data") {
        response_ = handle_get();
    } else if (request_.method == "POST" && request_.path == "/data") {
        response_ = handle_post(parse_content_length(headers_));
    } else {
        response_ = Response(StatusCode::NOT_FOUND);
    }
    state_ = State::Respond;
}

void ConnectionHandler::respond() {
    if (send_response_ && !stream_.write_all(response_.to_string())) {
        std::cerr << "Error writing response: connection broken" << std::endl;
    }
    close_connection();
}

void ConnectionHandler::close_connection() {
    if (client_socket_ != -1) {
        close(client_socket_);
        client_socket_ = -1;
    }
    state_ = State::Closed;
}

/*
    Fetch-all: serve the whole collection as JSON.
    Args:
        none
    Returns:
        200 with the collection, or 500 if the store cannot be read
*/
Response ConnectionHandler::handle_get() {
    try {
        std::vector<Entry> entries = store_.read_all();
        Response response(StatusCode::OK);
        response.json = true;
        response.body = serialize_collection(entries);
        return response;
    } catch (const StoreError& e) {
        std::cerr << "Error reading store: " << e.what() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error serializing collection: " << e.what() << std::endl;
    }
    return Response(StatusCode::INTERNAL_SERVER_ERROR);
}

/*
    Append: read the body, parse it as a batch and add it to the store.
    The store lock is only taken inside append_batch, never while reading the body.
    Args:
        content_length: number of body bytes the client declared
    Returns:
        201 on success, 400 for a short or malformed body, 500 on a store failure
*/
Response ConnectionHandler::handle_post(std::size_t content_length) {
    std::string body;
    if (!stream_.read_exact(content_length, body)) {
        std::cerr << "Error reading POST body: expected " << content_length << " bytes" << std::endl;
        return Response(StatusCode::BAD_REQUEST);
    }

    std::cout << "Received POST body: " << body << std::endl;

    std::vector<NewEntry> batch;
    try {
        batch = parse_batch(body);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error parsing JSON: " << e.what() << std::endl;
        return Response(StatusCode::BAD_REQUEST);
    } catch (const BatchError& e) {
        std::cerr << "Error parsing JSON: " << e.what() << std::endl;
        return Response(StatusCode::BAD_REQUEST);
    }

    try {
        store_.append_batch(batch);
    } catch (const StoreError& e) {
        std::cerr << "Error writing store: " << e.what() << std::endl;
        return Response(StatusCode::INTERNAL_SERVER_ERROR);
    }
    return Response(StatusCode::CREATED);
}
