#include "utils/server_log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace server_log {

namespace {

struct LogState {
    std::mutex mutex;
    Level console_threshold = Level::Info;
    std::ostream *console_stream = nullptr; // nullptr = std::cerr
    std::ofstream file_stream;
    Level file_threshold = Level::Info;
};

LogState &state() {
    static LogState instance;
    return instance;
}

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long milliseconds = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm broken_down{};
    gmtime_r(&seconds, &broken_down);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &broken_down);
    char with_millis[48];
    std::snprintf(with_millis, sizeof(with_millis), "%s.%03ldZ", buffer, milliseconds);
    return with_millis;
}

} // namespace

std::optional<Level> parse_level(const std::string &text) {
    std::string normalized = to_lower(text);
    if (normalized == "debug") {
        return Level::Debug;
    }
    if (normalized == "info") {
        return Level::Info;
    }
    if (normalized == "warning" || normalized == "warn") {
        return Level::Warning;
    }
    if (normalized == "error") {
        return Level::Error;
    }
    if (normalized == "critical") {
        return Level::Critical;
    }
    return std::nullopt;
}

const char *level_name(Level level) {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    case Level::Critical:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

void set_console_level(Level level) {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().console_threshold = level;
}

Level console_level() {
    std::lock_guard<std::mutex> lock(state().mutex);
    return state().console_threshold;
}

void suppress_console() {
    set_console_level(Level::Critical);
}

void set_console_stream(std::ostream *stream) {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().console_stream = stream;
}

bool open_file_sink(const std::string &file_path, Level level) {
    std::lock_guard<std::mutex> lock(state().mutex);
    LogState &log_state = state();
    if (log_state.file_stream.is_open()) {
        log_state.file_stream.close();
    }

    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::error_code error_code;
        std::filesystem::create_directories(path.parent_path(), error_code);
        if (error_code) {
            return false;
        }
    }

    log_state.file_stream.open(file_path, std::ios::out | std::ios::app);
    if (!log_state.file_stream.is_open()) {
        return false;
    }
    log_state.file_threshold = level;
    return true;
}

void close_file_sink() {
    std::lock_guard<std::mutex> lock(state().mutex);
    if (state().file_stream.is_open()) {
        state().file_stream.close();
    }
}

bool file_sink_open() {
    std::lock_guard<std::mutex> lock(state().mutex);
    return state().file_stream.is_open();
}

void log(Level level, const std::string &component, const std::string &message) {
    std::lock_guard<std::mutex> lock(state().mutex);
    LogState &log_state = state();

    if (level >= log_state.console_threshold) {
        std::ostream &console = log_state.console_stream ? *log_state.console_stream : std::cerr;
        console << "[chatbridge] [" << level_name(level) << "] [" << component << "] "
                << message << std::endl;
    }

    if (log_state.file_stream.is_open() && level >= log_state.file_threshold) {
        log_state.file_stream << timestamp_now() << " [" << level_name(level) << "] ["
                              << component << "] " << message << "\n";
        log_state.file_stream.flush();
    }
}

void debug(const std::string &component, const std::string &message) {
    log(Level::Debug, component, message);
}

void info(const std::string &component, const std::string &message) {
    log(Level::Info, component, message);
}

void warning(const std::string &component, const std::string &message) {
    log(Level::Warning, component, message);
}

void error(const std::string &component, const std::string &message) {
    log(Level::Error, component, message);
}

void critical(const std::string &component, const std::string &message) {
    log(Level::Critical, component, message);
}

} // namespace server_log
