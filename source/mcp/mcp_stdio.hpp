#ifndef INKWELL_MCP_STDIO_HPP
#define INKWELL_MCP_STDIO_HPP

// MCP stdio transport: reassembling JSON-RPC messages from the input byte
// stream and writing framed responses to the output stream.

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace mcp_stdio {

using json = nlohmann::json;

// Splits an arbitrarily chunked byte stream into message bodies.
//
// Two framings are accepted, tried in this order on every pass:
//   1. "Content-Length: N" header, ended by a blank line (CRLF or LF),
//      followed by exactly N body bytes;
//   2. one message per line, trimmed; blank lines are skipped.
// Header field lines are held while nothing but header fields has arrived, so
// a header split across chunks is never read as a line. The first line of any
// other kind releases them to line mode, where they are dropped as bad JSON.
class MessageFramer {
public:
    void append(const std::string &chunk);

    // The next complete body, or std::nullopt until more input arrives.
    std::optional<std::string> next_message();

    size_t buffered_size() const { return buffer_.size(); }

private:
    std::string buffer_;
};

// "Content-Length: <bytes>\r\n\r\n<json_text>". The length counts UTF-8 bytes.
std::string frame_message(const std::string &json_text);

// Write a log message to stderr (MCP allows this for logging).
void log_message(const std::string &message);

// Raw input chunks handed from the reader thread to the session thread.
class ChunkQueue {
public:
    enum class PopStatus { Chunk, Timeout, Closed };

    void push(std::string chunk);

    // No more chunks will be pushed. Already queued chunks are still popped.
    void close();

    PopStatus pop(std::string &chunk, int timeout_milliseconds);

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<std::string> chunks_;
    bool closed_ = false;
};

// Receives a parsed message; returns the response, or null for none.
using MessageHandler = std::function<json(const json &message)>;

// One session over an input descriptor and an output stream.
//
// A reader thread only moves bytes from the descriptor into a ChunkQueue.
// The thread calling run() is the only owner of the framer buffer and the
// only caller of the handler, so messages are handled one at a time, in the
// order they arrived, while further input keeps being read.
class StdioSession {
public:
    StdioSession(int input_descriptor, std::ostream &output, MessageHandler handler);

    // Returns on end of input, or soon after stop_requested becomes true.
    // After a stop, responses still being produced are not written.
    void run(const std::atomic<bool> &stop_requested);

    // Messages handed to the handler so far (malformed bodies excluded).
    size_t handled_count() const { return handled_count_; }

private:
    void reader_loop();
    void handle_body(const std::string &body, const std::atomic<bool> &stop_requested);

    int input_descriptor_;
    std::ostream &output_;
    MessageHandler handler_;
    MessageFramer framer_;
    ChunkQueue queue_;
    std::atomic<bool> reader_stop_{false};
    size_t handled_count_ = 0;
};

} // namespace mcp_stdio

#endif // INKWELL_MCP_STDIO_HPP
