#include "SocketStream.hpp"
#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

SocketStream::SocketStream(int fd) : fd_(fd) {}

/*
    Read one chunk from the socket into the buffer.
    Args:
        none
    Returns:
        true if bytes were appended, false on EOF or error
*/
bool SocketStream::fill() {
    char chunk[1024];

    while (true) {
        ssize_t bytes_read = read(fd_, chunk, sizeof(chunk));
        if (bytes_read < 0 && errno == EINTR) {
            continue; // interrupted by a signal, retry
        }
        if (bytes_read <= 0) { // connection closed or error
            return false;
        }
        buffer_.append(chunk, static_cast<size_t>(bytes_read));
        return true;
    }
}

/*
    Read one newline-terminated line.
    Args:
        line: receives the line including its '\n'
    Returns:
        true if a full line was read
*/
bool SocketStream::read_line(std::string& line) {
    size_t pos;
    while ((pos = buffer_.find('\n')) == std::string::npos) {
        if (!fill()) {
            return false;
        }
    }
    line = buffer_.substr(0, pos + 1); // extract one line
    buffer_.erase(0, pos + 1); // remove the line from the buffer
    return true;
}

/*
    Read exactly n bytes, using what is already buffered first.
    Args:
        n: number of bytes wanted
        out: receives the bytes
    Returns:
        true if all n bytes arrived before the peer closed
*/
bool SocketStream::read_exact(std::size_t n, std::string& out) {
    while (buffer_.size() < n) {
        if (!fill()) {
            return false;
        }
    }
    out = buffer_.substr(0, n);
    buffer_.erase(0, n);
    return true;
}

/*
    Write the whole string.
    Args:
        data: bytes to send
    Returns:
        false if the connection is broken
*/
bool SocketStream::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        // MSG_NOSIGNAL: a peer that already hung up must not raise SIGPIPE
        ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}
