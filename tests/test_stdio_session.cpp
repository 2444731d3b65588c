// Tests for the stdio session over real pipes: ordering, notifications,
// malformed input, chunked delivery and shutdown.

#include "mcp/mcp_stdio.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;
using test_support::check;

namespace test_stdio_session {

// Answers every request with its id and method; notifications get nothing.
static json echo_method(const json &message) {
    if (!message.contains("id") || message["id"].is_null()) {
        return nullptr;
    }
    return {{"jsonrpc", "2.0"}, {"id", message["id"]}, {"result", {{"method", message.value("method", "")}}}};
}

static std::string framed(const std::string &body) {
    return mcp_stdio::frame_message(body);
}

static bool write_all(int descriptor, const std::string &data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t result = write(descriptor, data.data() + written, data.size() - written);
        if (result <= 0) {
            return false;
        }
        written += static_cast<size_t>(result);
    }
    return true;
}

// Splits everything the session wrote back into response bodies.
static std::vector<json> parse_output(const std::string &output) {
    mcp_stdio::MessageFramer framer;
    framer.append(output);
    std::vector<json> responses;
    for (;;) {
        std::optional<std::string> body = framer.next_message();
        if (!body) {
            break;
        }
        responses.push_back(json::parse(*body, nullptr, false));
    }
    return responses;
}

// Runs a session over a pipe that already holds input and is closed for writing.
static std::string run_with_input(const std::string &input, size_t *handled = nullptr) {
    int descriptors[2];
    if (pipe(descriptors) != 0) {
        return "";
    }
    write_all(descriptors[1], input);
    close(descriptors[1]);

    std::ostringstream output;
    std::atomic<bool> stop{false};
    mcp_stdio::StdioSession session(descriptors[0], output, echo_method);
    session.run(stop);
    close(descriptors[0]);

    if (handled != nullptr) {
        *handled = session.handled_count();
    }
    return output.str();
}

// Test: Two requests and a notification in one chunk produce two responses, in order.
static bool test_ordered_responses() {
    std::string input = framed("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}") +
                        framed("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}") +
                        framed("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}");
    size_t handled = 0;
    std::vector<json> responses = parse_output(run_with_input(input, &handled));

    bool success = handled == 3 && responses.size() == 2 && responses[0]["id"] == 1 &&
                   responses[0]["result"]["method"] == "initialize" && responses[1]["id"] == 2;

    if (success) {
        std::cout << "  OK: Responses follow request order; notification is silent" << std::endl;
    } else {
        std::cout << "  FAIL: handled " << handled << " messages, wrote " << responses.size() << " responses"
                  << std::endl;
    }
    return success;
}

// Test: Every response is written with a Content-Length header.
static bool test_responses_are_length_prefixed() {
    std::string output = run_with_input("{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"ping\"}\n");
    std::string expected_body = echo_method(json{{"id", 7}, {"method", "ping"}}).dump();
    return check(output == "Content-Length: " + std::to_string(expected_body.size()) + "\r\n\r\n" + expected_body,
                 "Line-delimited request gets a length-prefixed response");
}

// Test: A body that is not JSON is dropped and the session carries on.
static bool test_malformed_message_dropped() {
    size_t handled = 0;
    std::string input = "{this is not json}\n" + framed("{\"id\":3,\"method\":\"ping\"}");
    std::vector<json> responses = parse_output(run_with_input(input, &handled));
    return check(handled == 1 && responses.size() == 1 && responses[0]["id"] == 3,
                 "Malformed body is dropped without a response");
}

// Test: Input trickling in small pieces is reassembled across reads.
static bool test_chunked_delivery() {
    int descriptors[2];
    if (pipe(descriptors) != 0) {
        return check(false, "pipe() for chunked delivery");
    }

    std::string input = framed("{\"jsonrpc\":\"2.0\",\"id\":11,\"method\":\"first\"}") +
                        framed("{\"jsonrpc\":\"2.0\",\"id\":12,\"method\":\"second\"}");
    std::thread writer([&input, &descriptors] {
        for (size_t offset = 0; offset < input.size(); offset += 9) {
            write_all(descriptors[1], input.substr(offset, 9));
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        close(descriptors[1]);
    });

    std::ostringstream output;
    std::atomic<bool> stop{false};
    mcp_stdio::StdioSession session(descriptors[0], output, echo_method);
    session.run(stop);
    writer.join();
    close(descriptors[0]);

    std::vector<json> responses = parse_output(output.str());
    return check(responses.size() == 2 && responses[0]["id"] == 11 && responses[1]["id"] == 12 &&
                     responses[1]["result"]["method"] == "second",
                 "Chunked input is reassembled in order");
}

// Test: A stop request ends the session while the input is still open.
static bool test_stop_request() {
    int descriptors[2];
    if (pipe(descriptors) != 0) {
        return check(false, "pipe() for stop request");
    }

    std::ostringstream output;
    std::atomic<bool> stop{false};
    mcp_stdio::StdioSession session(descriptors[0], output, echo_method);

    std::thread stopper([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop.store(true);
    });

    auto started = std::chrono::steady_clock::now();
    session.run(stop);
    auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    close(descriptors[1]);
    close(descriptors[0]);

    return check(elapsed < std::chrono::seconds(2) && output.str().empty(),
                 "Stop flag ends the session without waiting for EOF");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_ordered_responses();
    all_passed &= test_responses_are_length_prefixed();
    all_passed &= test_malformed_message_dropped();
    all_passed &= test_chunked_delivery();
    all_passed &= test_stop_request();
    return all_passed;
}

} // namespace test_stdio_session
