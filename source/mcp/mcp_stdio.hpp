#ifndef TBMCPS_MCP_STDIO_HPP
#define TBMCPS_MCP_STDIO_HPP

// MCP stdio transport: newline-delimited JSON messages.
// A dedicated reader thread pulls lines off the input stream into a queue so
// the dispatch loop can wait with a timeout (and notice shutdown) instead of
// being stuck inside a blocking read.

#include <chrono>
#include <condition_variable>
#include <deque>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace mcp_stdio {

class LineChannel {
public:
    enum class PopStatus {
        Line,     // A line was returned.
        Timeout,  // Nothing arrived within the wait.
        Closed    // Input reached EOF and every line has been consumed.
    };

    // Starts reading input immediately. The stream must outlive the reader.
    explicit LineChannel(std::istream &input);
    ~LineChannel();

    LineChannel(const LineChannel &) = delete;
    LineChannel &operator=(const LineChannel &) = delete;

    PopStatus pop(std::string &line, std::chrono::milliseconds wait);

private:
    struct SharedState {
        std::mutex mutex;
        std::condition_variable condition;
        std::deque<std::string> lines;
        bool closed = false;
    };

    std::shared_ptr<SharedState> state_;
    std::thread reader_;
};

// Write one message followed by a newline, then flush.
void write_message(std::ostream &output, const std::string &json_string);

// Log to stderr with the server prefix; stdout is reserved for protocol messages.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // TBMCPS_MCP_STDIO_HPP
