#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct ServerConfig {
    static constexpr int DEFAULT_PORT = 8080;

    int port = DEFAULT_PORT;
    std::string data_file = "data.json";
    std::size_t max_connections = 0; // 0 = unbounded
    bool show_help = false;
};

// -p PORT, -f FILE, -c MAX_CONNECTIONS, -h; throws ConfigError on bad input
ServerConfig parse_args(int argc, char* argv[]);

std::string usage(const std::string& program);
