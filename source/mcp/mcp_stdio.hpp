#ifndef CHATBRIDGE_MCP_STDIO_HPP
#define CHATBRIDGE_MCP_STDIO_HPP

// MCP stdio transport: JSON messages in on one stream, out on another.
// stdout belongs to the protocol; anything else written there corrupts it.

#include <istream>
#include <mutex>
#include <ostream>
#include <string>

namespace mcp_stdio {

class StdioChannel {
public:
    StdioChannel(std::istream &input, std::ostream &output) : input_(input), output_(output) {}

    // Read a single complete JSON object. Brace-counting with string/escape
    // awareness, so it works with newline-delimited and streamed JSON alike.
    // Returns an empty string on EOF.
    // Only the transport loop reads; no locking.
    std::string read_message();

    // Write one message followed by a newline. Safe to call from any thread;
    // concurrent writers never interleave.
    void write_message(const std::string &json_string);

    // True if both streams are usable.
    bool healthy() const;

private:
    std::istream &input_;
    std::ostream &output_;
    std::mutex write_mutex_;
};

} // namespace mcp_stdio

#endif // CHATBRIDGE_MCP_STDIO_HPP
