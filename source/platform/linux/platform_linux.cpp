#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <system_error>

namespace platform {

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool ensure_parent_directory(const std::string &file_path, std::string &error_message) {
    std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
    if (parent.empty()) {
        return true;
    }

    std::error_code error_code;
    std::filesystem::create_directories(parent, error_code);
    if (error_code) {
        error_message = "cannot create " + parent.string() + ": " + error_code.message();
        return false;
    }
    return true;
}

InputStatus wait_for_input(int descriptor, int timeout_milliseconds) {
    struct pollfd poll_descriptor;
    poll_descriptor.fd = descriptor;
    poll_descriptor.events = POLLIN;
    poll_descriptor.revents = 0;

    int poll_result = poll(&poll_descriptor, 1, timeout_milliseconds);
    if (poll_result < 0) {
        return (errno == EINTR) ? InputStatus::Timeout : InputStatus::Error;
    }
    if (poll_result == 0) {
        return InputStatus::Timeout;
    }
    if (poll_descriptor.revents & POLLNVAL) {
        return InputStatus::Error;
    }
    // POLLHUP without POLLIN still means read() will return 0 (EOF).
    return InputStatus::Ready;
}

long read_some(int descriptor, char *buffer, unsigned long capacity) {
    for (;;) {
        ssize_t bytes_read = read(descriptor, buffer, capacity);
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        return static_cast<long>(bytes_read);
    }
}

} // namespace platform
