#include "Config.hpp"
#include <getopt.h>
#include <sstream>

constexpr int ServerConfig::DEFAULT_PORT;

/*
    Parse a whole string as a non-negative integer.
    Args:
        text: option argument
        out: receives the value
    Returns:
        false if text is not entirely digits or overflows
*/
static bool parse_unsigned(const std::string& text, unsigned long long& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    std::istringstream iss(text);
    return static_cast<bool>(iss >> out);
}

/*
    Build the server configuration from the command line.
    Args:
        argc, argv: as passed to main
    Returns:
        the configuration, defaults for anything not given
*/
ServerConfig parse_args(int argc, char* argv[]) {
    ServerConfig config;
    unsigned long long value = 0;

    optind = 0; // glibc: 0 forces a full rescan, so parse_args may be called again
    opterr = 0; // errors are reported through ConfigError
    int opt;
    while ((opt = getopt(argc, argv, ":p:f:c:h")) != -1) {
        switch (opt) {
            case 'p':
                if (!parse_unsigned(optarg, value) || value == 0 || value > 65535) {
                    throw ConfigError(std::string("Invalid port number: ") + optarg);
                }
                config.port = static_cast<int>(value);
                break;
            case 'f':
                if (std::string(optarg).empty()) {
                    throw ConfigError("Data file path must not be empty");
                }
                config.data_file = optarg;
                break;
            case 'c':
                if (!parse_unsigned(optarg, value)) {
                    throw ConfigError(std::string("Invalid connection limit: ") + optarg);
                }
                config.max_connections = static_cast<std::size_t>(value);
                break;
            case 'h':
                config.show_help = true;
                break;
            case ':':
                throw ConfigError(std::string("Option -") + static_cast<char>(optopt) + " requires an argument");
            default:
                throw ConfigError(std::string("Unknown option -") + static_cast<char>(optopt));
        }
    }

    if (optind < argc) {
        throw ConfigError(std::string("Unexpected argument: ") + argv[optind]);
    }
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "Options:\n"
       << "  -p PORT    Set server port (default: " << ServerConfig::DEFAULT_PORT << ")\n"
       << "  -f FILE    Set data file (default: data.json)\n"
       << "  -c N       Max concurrent connections, 0 for no limit (default: 0)\n"
       << "  -h         Show this help message\n";
    return ss.str();
}
