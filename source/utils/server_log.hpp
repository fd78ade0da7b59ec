#ifndef CHATBRIDGE_SERVER_LOG_HPP
#define CHATBRIDGE_SERVER_LOG_HPP

// Leveled logging with two sinks: the console (stderr) and an optional file.
// Each sink has its own threshold. Nothing here ever writes to stdout, which
// carries the MCP message stream.

#include <optional>
#include <ostream>
#include <string>

namespace server_log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Critical = 4
};

// Parse "debug", "info", "warning"/"warn", "error", "critical" (any case).
std::optional<Level> parse_level(const std::string &text);

const char *level_name(Level level);

void set_console_level(Level level);
Level console_level();

// Lower console output to critical-only. Used right before the stdio
// transport starts; the file sink is unaffected.
void suppress_console();

// Redirect the console sink (tests). Pass nullptr to restore stderr.
void set_console_stream(std::ostream *stream);

// Open (append) the file sink, creating parent directories. Returns false
// and leaves the file sink closed if the file cannot be opened.
bool open_file_sink(const std::string &file_path, Level level);
void close_file_sink();
bool file_sink_open();

void log(Level level, const std::string &component, const std::string &message);

void debug(const std::string &component, const std::string &message);
void info(const std::string &component, const std::string &message);
void warning(const std::string &component, const std::string &message);
void error(const std::string &component, const std::string &message);
void critical(const std::string &component, const std::string &message);

} // namespace server_log

#endif // CHATBRIDGE_SERVER_LOG_HPP
