// Tests for request tasks: draining, the in-flight limit and exceptions at
// the thread boundary.

#include "mcp/request_tasks.hpp"
#include "utils/server_log.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace test_request_tasks {

static bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

// Test: wait_all returns only after every spawned task has finished.
static bool test_wait_all_drains() {
    std::atomic<int> finished{0};
    mcp_stdio::RequestTasks tasks(8);
    for (int index = 0; index < 5; ++index) {
        tasks.spawn([&finished]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            finished++;
        });
    }
    tasks.wait_all();
    return report(finished.load() == 5 && tasks.in_flight() == 0, "wait_all drains every task");
}

// Test: No more than max_in_flight tasks ever run at once.
static bool test_in_flight_limit() {
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    mcp_stdio::RequestTasks tasks(2);
    for (int index = 0; index < 6; ++index) {
        tasks.spawn([&active, &max_active]() {
            int now = ++active;
            int seen = max_active.load();
            while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            active--;
        });
    }
    tasks.wait_all();

    bool success = max_active.load() == 2 && tasks.max_in_flight() == 2;
    if (!success) {
        std::cout << "  max_active=" << max_active.load() << std::endl;
    }
    return report(success, "In-flight tasks are capped at the configured limit");
}

// Test: A task throwing any type is logged and the counter still drops.
static bool test_throwing_tasks_are_contained() {
    std::ostringstream console;
    server_log::set_console_stream(&console);
    server_log::set_console_level(server_log::Level::Error);

    struct NotAnException {};
    mcp_stdio::RequestTasks tasks(4);
    tasks.spawn([]() { throw std::runtime_error("handler blew up"); });
    tasks.spawn([]() { throw NotAnException{}; });
    tasks.wait_all();

    std::string text = console.str();
    server_log::set_console_stream(nullptr);
    server_log::set_console_level(server_log::Level::Info);

    bool success = tasks.in_flight() == 0 && text.find("handler blew up") != std::string::npos &&
                   text.find("unknown exception") != std::string::npos;
    return report(success, "Exceptions of any type are logged at the task boundary");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_wait_all_drains();
    all_passed &= test_in_flight_limit();
    all_passed &= test_throwing_tasks_are_contained();
    return all_passed;
}

} // namespace test_request_tasks
