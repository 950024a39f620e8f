#pragma once
#include <cstddef>
#include <string>

// buffered reads and full writes on a connected socket; does not own the descriptor
class SocketStream {
public:
    explicit SocketStream(int fd);

    // reads up to and including '\n'; false if the peer closes or errors first
    bool read_line(std::string& line);

    // blocks until exactly n bytes arrive; false on a short read
    bool read_exact(std::size_t n, std::string& out);

    // false if the peer is gone
    bool write_all(const std::string& data);

private:
    int fd_;
    std::string buffer_; // bytes received but not yet consumed

    bool fill(); // one read() into buffer_
};
