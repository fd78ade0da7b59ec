// Tests for the two-sink logger: thresholds, suppression and the file sink.

#include "utils/server_log.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace test_server_log {

static bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

// Test: Level names parse case-insensitively; unknown names do not.
static bool test_parse_level() {
    bool success = server_log::parse_level("DEBUG") == server_log::Level::Debug &&
                   server_log::parse_level("warn") == server_log::Level::Warning &&
                   server_log::parse_level("Critical") == server_log::Level::Critical &&
                   !server_log::parse_level("trace").has_value();
    return report(success, "Level names parse case-insensitively");
}

// Test: The console threshold filters lower levels; suppress_console leaves only critical.
static bool test_console_threshold_and_suppression() {
    std::ostringstream console;
    server_log::set_console_stream(&console);
    server_log::set_console_level(server_log::Level::Info);

    server_log::debug("test", "hidden debug");
    server_log::info("test", "visible info");
    server_log::suppress_console();
    server_log::error("test", "suppressed error");
    server_log::critical("test", "visible critical");

    std::string text = console.str();
    bool success = text.find("hidden debug") == std::string::npos && text.find("visible info") != std::string::npos &&
                   text.find("suppressed error") == std::string::npos &&
                   text.find("[CRITICAL] [test] visible critical") != std::string::npos;

    server_log::set_console_stream(nullptr);
    server_log::set_console_level(server_log::Level::Info);
    if (!success) {
        std::cout << "  console: " << text << std::endl;
    }
    return report(success, "Console threshold and suppression filter correctly");
}

// Test: The file sink creates its directory and keeps recording while the console is suppressed.
static bool test_file_sink_independent_of_console() {
    std::filesystem::path directory = std::filesystem::temp_directory_path() / "chatbridge_log_test";
    std::filesystem::remove_all(directory);
    std::string log_path = (directory / "nested" / "server.log").string();

    std::ostringstream console;
    server_log::set_console_stream(&console);
    server_log::suppress_console();
    bool opened = server_log::open_file_sink(log_path, server_log::Level::Info);

    server_log::debug("test", "below file level");
    server_log::error("test", "recorded error");
    server_log::close_file_sink();

    std::ifstream log_file(log_path);
    std::stringstream contents;
    contents << log_file.rdbuf();

    bool success = opened && contents.str().find("[ERROR] [test] recorded error") != std::string::npos &&
                   contents.str().find("below file level") == std::string::npos && console.str().empty();

    server_log::set_console_stream(nullptr);
    server_log::set_console_level(server_log::Level::Info);
    std::filesystem::remove_all(directory);
    return report(success, "File sink records at its own level while the console is suppressed");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_parse_level();
    all_passed &= test_console_threshold_and_suppression();
    all_passed &= test_file_sink_independent_of_console();
    return all_passed;
}

} // namespace test_server_log
