#include "mcp/mcp_stdio.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <chrono>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>

namespace mcp_stdio {

namespace {

constexpr int kPollIntervalMilliseconds = 100;
constexpr size_t kReadChunkBytes = 64 * 1024;

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string to_lower(std::string text) {
    for (auto &character : text) {
        character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
    }
    return text;
}

bool is_token_character(char character) {
    unsigned char value = static_cast<unsigned char>(character);
    return std::isalnum(value) || character == '-' || character == '_';
}

// "Name: value" with a token name. A JSON body can never look like this.
bool is_header_field(const std::string &line, std::string *name, std::string *value) {
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    for (size_t index = 0; index < colon; ++index) {
        if (!is_token_character(line[index])) {
            return false;
        }
    }
    if (name != nullptr) {
        *name = line.substr(0, colon);
    }
    if (value != nullptr) {
        *value = trim(line.substr(colon + 1));
    }
    return true;
}

// Content-Length of a header block, or std::nullopt when the block is not
// made of header fields or has no usable Content-Length.
std::optional<size_t> parse_content_length(const std::string &header_block) {
    std::optional<size_t> content_length;
    size_t line_start = 0;

    while (line_start <= header_block.size()) {
        size_t line_end = header_block.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = header_block.size();
        }
        std::string line = header_block.substr(line_start, line_end - line_start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string name;
        std::string value;
        if (!is_header_field(line, &name, &value)) {
            return std::nullopt;
        }

        if (to_lower(name) == "content-length") {
            if (value.empty()) {
                return std::nullopt;
            }
            size_t parsed = 0;
            for (char character : value) {
                if (!std::isdigit(static_cast<unsigned char>(character))) {
                    return std::nullopt;
                }
                size_t digit = static_cast<size_t>(character - '0');
                if (parsed > (std::numeric_limits<size_t>::max() - digit) / 10) {
                    return std::nullopt;
                }
                parsed = parsed * 10 + digit;
            }
            content_length = parsed;
        }

        line_start = line_end + 1;
    }

    return content_length;
}

// End of the header block: the first blank line, "\r\n\r\n" or "\n\n".
// terminator_length receives the length of the separator found.
size_t find_header_end(const std::string &buffer, size_t *terminator_length) {
    size_t crlf = buffer.find("\r\n\r\n");
    size_t lf = buffer.find("\n\n");
    if (lf != std::string::npos && (crlf == std::string::npos || lf < crlf)) {
        *terminator_length = 2;
        return lf;
    }
    *terminator_length = 4;
    return crlf;
}

// True while every complete line in the buffer is a header field: a header
// block that may still get its blank line. Any other line ends the wait.
bool awaiting_header_terminator(const std::string &buffer) {
    size_t line_start = 0;
    bool saw_line = false;
    for (;;) {
        size_t line_end = buffer.find('\n', line_start);
        if (line_end == std::string::npos) {
            return saw_line;
        }
        std::string line = buffer.substr(line_start, line_end - line_start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!is_header_field(line, nullptr, nullptr)) {
            return false;
        }
        saw_line = true;
        line_start = line_end + 1;
    }
}

} // namespace

void MessageFramer::append(const std::string &chunk) {
    buffer_ += chunk;
}

std::optional<std::string> MessageFramer::next_message() {
    for (;;) {
        if (buffer_.empty()) {
            return std::nullopt;
        }

        // 1. Length-prefixed framing.
        size_t terminator_length = 0;
        size_t header_end = find_header_end(buffer_, &terminator_length);
        if (header_end != std::string::npos) {
            std::optional<size_t> content_length = parse_content_length(buffer_.substr(0, header_end));
            if (content_length) {
                size_t body_start = header_end + terminator_length;
                if (buffer_.size() - body_start < *content_length) {
                    return std::nullopt; // Wait for the rest of the body.
                }
                std::string body = buffer_.substr(body_start, *content_length);
                buffer_.erase(0, body_start + *content_length);
                return body;
            }
        }

        // 2. Line-delimited fallback.
        size_t line_end = buffer_.find('\n');
        if (line_end == std::string::npos) {
            return std::nullopt; // Wait for a complete line.
        }

        std::string first_line = buffer_.substr(0, line_end);
        if (!first_line.empty() && first_line.back() == '\r') {
            first_line.pop_back();
        }
        if (header_end == std::string::npos && awaiting_header_terminator(buffer_)) {
            return std::nullopt; // A header whose blank line has not arrived yet.
        }

        std::string line = trim(first_line);
        buffer_.erase(0, line_end + 1);
        if (!line.empty()) {
            return line;
        }
    }
}

std::string frame_message(const std::string &json_text) {
    return "Content-Length: " + std::to_string(json_text.size()) + "\r\n\r\n" + json_text;
}

void log_message(const std::string &message) {
    std::cerr << "[inkwell] " << message << std::endl;
}

void ChunkQueue::push(std::string chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.push_back(std::move(chunk));
    }
    condition_.notify_one();
}

void ChunkQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

ChunkQueue::PopStatus ChunkQueue::pop(std::string &chunk, int timeout_milliseconds) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_for(lock, std::chrono::milliseconds(timeout_milliseconds),
                        [this] { return !chunks_.empty() || closed_; });
    if (!chunks_.empty()) {
        chunk = std::move(chunks_.front());
        chunks_.pop_front();
        return PopStatus::Chunk;
    }
    return closed_ ? PopStatus::Closed : PopStatus::Timeout;
}

StdioSession::StdioSession(int input_descriptor, std::ostream &output, MessageHandler handler)
    : input_descriptor_(input_descriptor), output_(output), handler_(std::move(handler)) {}

void StdioSession::reader_loop() {
    std::vector<char> buffer(kReadChunkBytes);

    while (!reader_stop_.load()) {
        platform::InputStatus status = platform::wait_for_input(input_descriptor_, kPollIntervalMilliseconds);
        if (status == platform::InputStatus::Timeout) {
            continue;
        }
        if (status == platform::InputStatus::Error) {
            debug_log::log("Polling stdin failed. Ending input.");
            break;
        }

        long bytes_read = platform::read_some(input_descriptor_, buffer.data(), buffer.size());
        if (bytes_read <= 0) {
            debug_log::log(bytes_read == 0 ? "EOF on stdin." : "Read from stdin failed.");
            break;
        }
        queue_.push(std::string(buffer.data(), static_cast<size_t>(bytes_read)));
    }

    queue_.close();
}

void StdioSession::handle_body(const std::string &body, const std::atomic<bool> &stop_requested) {
    json message = json::parse(body, nullptr, false);
    if (message.is_discarded()) {
        debug_log::log("Dropping malformed message (" + std::to_string(body.size()) + " bytes).");
        return;
    }

    ++handled_count_;
    json response = handler_(message);
    if (response.is_null() || stop_requested.load()) {
        return;
    }

    output_ << frame_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    output_.flush();
}

void StdioSession::run(const std::atomic<bool> &stop_requested) {
    reader_stop_.store(false);
    std::thread reader([this] { reader_loop(); });

    std::string chunk;
    bool input_open = true;
    while (input_open && !stop_requested.load()) {
        ChunkQueue::PopStatus status = queue_.pop(chunk, kPollIntervalMilliseconds);
        if (status == ChunkQueue::PopStatus::Timeout) {
            continue;
        }
        if (status == ChunkQueue::PopStatus::Closed) {
            input_open = false;
            break;
        }

        framer_.append(chunk);
        while (!stop_requested.load()) {
            std::optional<std::string> body = framer_.next_message();
            if (!body) {
                break;
            }
            handle_body(*body, stop_requested);
        }
    }

    if (framer_.buffered_size() > 0) {
        debug_log::log("Discarding " + std::to_string(framer_.buffered_size()) + " unframed byte(s).");
    }

    reader_stop_.store(true);
    reader.join();
}

} // namespace mcp_stdio
