#include "mcp/request_tasks.hpp"
#include "utils/server_log.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace mcp_stdio {

RequestTasks::RequestTasks(std::size_t max_in_flight) : max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight) {}

RequestTasks::~RequestTasks() {
    wait_all();
}

void RequestTasks::spawn(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_condition_.wait(lock, [this]() { return running_ < max_in_flight_; });
        running_++;
    }

    try {
        std::thread([this, task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception &exception) {
                server_log::error("request_tasks", std::string("Request task failed: ") + exception.what());
            } catch (...) {
                server_log::error("request_tasks", "Request task failed: unknown exception");
            }
            finish_one();
        }).detach();
    } catch (const std::system_error &) {
        finish_one();
        throw;
    }
}

void RequestTasks::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_condition_.wait(lock, [this]() { return running_ == 0; });
}

std::size_t RequestTasks::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void RequestTasks::finish_one() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_--;
    idle_condition_.notify_all();
}

} // namespace mcp_stdio
