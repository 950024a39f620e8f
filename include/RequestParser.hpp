#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

// header names are kept exactly as received (case-sensitive)
using Headers = std::map<std::string, std::string>;

struct RequestLine {
    std::string method;
    std::string path;

    bool valid() const { return !method.empty() && !path.empty(); }
};

// first two whitespace-delimited tokens; both empty if there are fewer than two
RequestLine parse_request_line(const std::string& line);

// adds one "Name: value" line to headers; returns false on the blank line ending the headers
bool parse_header_line(const std::string& line, Headers& headers);

// parses lines up to the first blank one
Headers parse_headers(const std::vector<std::string>& lines);

// Content-Length as a non-negative integer, 0 if absent or unparsable
std::size_t parse_content_length(const Headers& headers);
