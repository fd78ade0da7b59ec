#ifndef CHATBRIDGE_REQUEST_TASKS_HPP
#define CHATBRIDGE_REQUEST_TASKS_HPP

// Runs accepted tool calls as independent tasks so the transport loop keeps
// reading while a query is being answered.

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace mcp_stdio {

class RequestTasks {
public:
    // At most max_in_flight tasks run at once; spawn() waits for a free slot.
    explicit RequestTasks(std::size_t max_in_flight = 32);
    RequestTasks(const RequestTasks &) = delete;
    RequestTasks &operator=(const RequestTasks &) = delete;

    // Waits for every task still running.
    ~RequestTasks();

    // Start task on its own thread, blocking while the limit is reached. The
    // task must not throw; anything it does throw is logged and dropped at the
    // thread boundary.
    void spawn(std::function<void()> task);

    // Block until no task is running.
    void wait_all();

    std::size_t in_flight() const;
    std::size_t max_in_flight() const { return max_in_flight_; }

private:
    void finish_one();

    mutable std::mutex mutex_;
    std::condition_variable idle_condition_;
    std::size_t max_in_flight_;
    std::size_t running_ = 0;
};

} // namespace mcp_stdio

#endif // CHATBRIDGE_REQUEST_TASKS_HPP
