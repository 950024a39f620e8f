#include "RequestParser.hpp"
#include <sstream>

static std::string trim(const std::string& s) {
    const auto a = s.find_first_not_of(" \t\r\n");
    const auto b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

/*
    Split a request line such as "POST /data HTTP/1.1" into method and path.
    Args:
        line: the raw request line, trailing newline allowed
    Returns:
        method and path, both empty if the line has fewer than two tokens
*/
RequestLine parse_request_line(const std::string& line) {
    std::istringstream iss(line);
    RequestLine req;
    if (!(iss >> req.method >> req.path)) {
        return RequestLine{};
    }
    return req;
}

/*
    Parse one header line. Lines without ": " are dropped without error.
    Args:
        line: the raw header line
        headers: map to add the header to
    Returns:
        false if the line is blank (end of headers), true otherwise
*/
bool parse_header_line(const std::string& line, Headers& headers) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return false;
    }

    size_t sep = trimmed.find(": ");
    if (sep != std::string::npos) {
        headers[trimmed.substr(0, sep)] = trimmed.substr(sep + 2);
    }
    return true;
}

Headers parse_headers(const std::vector<std::string>& lines) {
    Headers headers;
    for (const auto& line : lines) {
        if (!parse_header_line(line, headers)) {
            break;
        }
    }
    return headers;
}

/*
    Body length for a POST. Leading digits are used ("12abc" is 12); a missing,
    negative or non-numeric value counts as zero.
    Args:
        headers: parsed request headers
    Returns:
        the declared body length
*/
std::size_t parse_content_length(const Headers& headers) {
    auto it = headers.find("Content-Length");
    if (it == headers.end()) {
        return 0;
    }

    std::istringstream iss(it->second);
    long long value = 0;
    if (!(iss >> value) || value < 0) {
        return 0;
    }
    return static_cast<std::size_t>(value);
}
