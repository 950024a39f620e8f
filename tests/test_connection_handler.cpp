// ConnectionHandler request/response behaviour over a socketpair.

#include "ConnectionHandler.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>

using json = nlohmann::json;

int main() {
    int passed = 0;
    int failed = 0;

    std::cout << "========================================\n";
    std::cout << "  Connection Handler Tests\n";
    std::cout << "========================================\n\n";

    {
        std::cout << "Test 1: GET on empty store returns 200 and [] ... ";
        try {
            EntryStore store(temp_data_file("get_empty"));
            std::string response = round_trip(store, GET_REQUEST);
            assert(status_line(response) == "HTTP/1.1 200 OK");
            assert(response.find("Content-Type: application/json\r\n") != std::string::npos);
            json body = json::parse(body_of(response));
            assert(body.is_array() && body.empty());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: POST one entry then GET it back... ";
        try {
            std::string path = temp_data_file("post_get");
            EntryStore store(path);

            std::string response = round_trip(store, post_request("[{\"item\":\"a\",\"completed\":false}]"));
            assert(response == "HTTP/1.1 201 Created\r\n\r\n");

            response = round_trip(store, GET_REQUEST);
            assert(status_line(response) == "HTTP/1.1 200 OK");
            json body = json::parse(body_of(response));
            assert(body.size() == 1);
            assert(body[0]["id"] == 1);
            assert(body[0]["item"] == "a");
            assert(body[0]["completed"] == false);
            std::remove(path.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Invalid POST body gives 400 and no change... ";
        try {
            std::string path = temp_data_file("bad_body");
            EntryStore store(path);
            assert(status_line(round_trip(store, post_request("[{\"item\":\"keep\"}]"))) == "HTTP/1.1 201 Created");

            assert(status_line(round_trip(store, post_request("this is not json"))) == "HTTP/1.1 400 Bad Request");
            assert(status_line(round_trip(store, post_request("{\"item\":\"x\"}"))) == "HTTP/1.1 400 Bad Request");
            assert(status_line(round_trip(store, post_request("[{\"item\":7}]"))) == "HTTP/1.1 400 Bad Request");

            json body = json::parse(body_of(round_trip(store, GET_REQUEST)));
            assert(body.size() == 1);
            assert(body[0]["item"] == "keep");

            // a null element is a blank entry, not a malformed body
            assert(status_line(round_trip(store, post_request("[null]"))) == "HTTP/1.1 201 Created");
            body = json::parse(body_of(round_trip(store, GET_REQUEST)));
            assert(body.size() == 2);
            assert(body[1]["id"] == 2);
            assert(body[1]["item"] == "");
            assert(body[1]["completed"] == false);
            std::remove(path.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: One-token request line gives 400... ";
        try {
            EntryStore store(temp_data_file("one_token"));
            assert(round_trip(store, "GET\n") == "HTTP/1.1 400 Bad Request\r\n\r\n");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Unknown method or path gives 404... ";
        try {
            EntryStore store(temp_data_file("not_found"));
            assert(round_trip(store, "PUT /data HTTP/1.1\r\n\r\n") == "HTTP/1.1 404 Not Found\r\n\r\n");
            assert(status_line(round_trip(store, "GET /other HTTP/1.1\r\n\r\n")) == "HTTP/1.1 404 Not Found");
            assert(status_line(round_trip(store, "get /data HTTP/1.1\r\n\r\n")) == "HTTP/1.1 404 Not Found");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Short POST body gives 400 and leaves store intact... ";
        try {
            std::string path = temp_data_file("short_body");
            EntryStore store(path);
            round_trip(store, post_request("[{\"item\":\"before\",\"completed\":true}]"));
            std::string before = read_file(path);

            std::string body = "[{\"item\":\"partial\"}]";
            std::string request = "POST /data HTTP/1.1\r\nContent-Length: " +
                                  std::to_string(body.size() + 50) + "\r\n\r\n" + body;
            assert(status_line(round_trip(store, request)) == "HTTP/1.1 400 Bad Request");

            assert(read_file(path) == before);
            json entries = json::parse(body_of(round_trip(store, GET_REQUEST)));
            assert(entries.size() == 1);
            assert(entries[0]["item"] == "before");
            std::remove(path.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Connection closed before a request line gets no reply... ";
        try {
            EntryStore store(temp_data_file("no_line"));
            assert(round_trip(store, "").empty());
            assert(round_trip(store, "GET /data HTTP/1.1").empty()); // no newline
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: Headers cut off before blank line give 400... ";
        try {
            EntryStore store(temp_data_file("cut_headers"));
            assert(round_trip(store, "GET /data HTTP/1.1\r\nHost: localhost\r\n") ==
                   "HTTP/1.1 400 Bad Request\r\n\r\n");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 9: Missing or lowercase Content-Length reads no body... ";
        try {
            std::string path = temp_data_file("no_length");
            EntryStore store(path);
            // zero-length body is not a valid batch
            std::string request = "POST /data HTTP/1.1\r\ncontent-length: 2\r\n\r\n[]";
            assert(status_line(round_trip(store, request)) == "HTTP/1.1 400 Bad Request");
            assert(json::parse(body_of(round_trip(store, GET_REQUEST))).empty());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 10: Malformed data file gives 500 for GET and POST... ";
        try {
            std::string path = temp_data_file("corrupt");
            EntryStore store(path);
            write_file(path, "[{\"id\": 1, \"item\": ");

            assert(round_trip(store, GET_REQUEST) == "HTTP/1.1 500 Internal Server Error\r\n\r\n");
            assert(status_line(round_trip(store, post_request("[{\"item\":\"new\"}]"))) ==
                   "HTTP/1.1 500 Internal Server Error");
            assert(read_file(path) == "[{\"id\": 1, \"item\": ");
            std::remove(path.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 11: Unwritable store gives 500 on POST... ";
        try {
            EntryStore store("/nonexistent-entrystore-dir/data.json");
            assert(status_line(round_trip(store, post_request("[{\"item\":\"x\"}]"))) ==
                   "HTTP/1.1 500 Internal Server Error");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 12: Handler ends in Closed state... ";
        try {
            EntryStore store(temp_data_file("state"));
            int fds[2];
            assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
            send_all(fds[0], "PUT /x HTTP/1.1\r\n\r\n");

            ConnectionHandler handler(store, fds[1]);
            assert(handler.state() == ConnectionHandler::State::AwaitRequestLine);
            handler.run();
            assert(handler.state() == ConnectionHandler::State::Closed);

            assert(recv_all(fds[0]) == "HTTP/1.1 404 Not Found\r\n\r\n");
            close(fds[0]);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n========================================\n";
    std::cout << "  Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << "========================================\n";

    return failed == 0 ? 0 : 1;
}
