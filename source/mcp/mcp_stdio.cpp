#include "mcp/mcp_stdio.hpp"

namespace mcp_stdio {

std::string StdioChannel::read_message() {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input_.get(character)) {
        if (!started) {
            // Ignore anything before the first '{' (whitespace, newlines, etc.)
            if (character == '{') {
                started = true;
                brace_depth = 1;
                buffer += character;
            }
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
            continue;
        }
        if (inside_string) {
            if (character == '\\') {
                escape_next = true;
            } else if (character == '"') {
                inside_string = false;
            }
            continue;
        }

        switch (character) {
        case '"':
            inside_string = true;
            break;
        case '{':
            brace_depth++;
            break;
        case '}':
            if (--brace_depth == 0) {
                return buffer;
            }
            break;
        default:
            break;
        }
    }

    // EOF reached without a complete message.
    return "";
}

void StdioChannel::write_message(const std::string &json_string) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    output_ << json_string << "\n";
    output_.flush();
}

bool StdioChannel::healthy() const {
    return !input_.bad() && !output_.bad() && !output_.fail();
}

} // namespace mcp_stdio
