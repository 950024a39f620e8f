#include "Response.hpp"

std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "200 OK";
        case StatusCode::CREATED:
            return "201 Created";
        case StatusCode::BAD_REQUEST:
            return "400 Bad Request";
        case StatusCode::NOT_FOUND:
            return "404 Not Found";
        case StatusCode::INTERNAL_SERVER_ERROR:
        default:
            return "500 Internal Server Error";
    }
}

/*
    Render the response. The connection is closed after it is sent, so no
    Content-Length is needed to delimit the body.
    Args:
        none
    Returns:
        the bytes to write to the client
*/
std::string Response::to_string() const {
    std::string out = "HTTP/1.1 " + status_code_to_string(status) + "\r\n";
    if (json) {
        out += "Content-Type: application/json\r\n";
    }
    out += "\r\n";
    out += body;
    return out;
}
