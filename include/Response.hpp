#pragma once
#include <string>

enum class StatusCode {
    OK = 200,
    CREATED = 201,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    INTERNAL_SERVER_ERROR = 500
};

// "200 OK", "404 Not Found", ...
std::string status_code_to_string(StatusCode code);

struct Response {
    StatusCode status;
    std::string body;
    bool json = false; // adds Content-Type: application/json

    explicit Response(StatusCode code) : status(code) {}

    // status line, optional content type, blank line, body
    std::string to_string() const;
};
