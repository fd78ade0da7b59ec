#ifndef CHATBRIDGE_BACKEND_HANDLE_HPP
#define CHATBRIDGE_BACKEND_HANDLE_HPP

// Holds the one query engine the server forwards tool calls to.
// Written once during startup, read by every dispatch afterwards.

#include "backend/query_engine_abi.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace backend {

class BackendHandle {
public:
    BackendHandle() = default;
    BackendHandle(const BackendHandle &) = delete;
    BackendHandle &operator=(const BackendHandle &) = delete;

    // Adopts provided if non-null, otherwise builds an engine with
    // factory(default_model_id). Once an engine is held, later calls return
    // it and construct nothing. Throws server_errors::InitializationError if
    // the factory is missing, throws, or returns null.
    std::shared_ptr<query_engine::QueryEngine> initialize(std::shared_ptr<query_engine::QueryEngine> provided,
                                                          const std::string &default_model_id,
                                                          const query_engine::EngineFactory &factory);

    // Non-blocking. nullptr until initialize() has succeeded.
    query_engine::QueryEngine *get() const;

    bool ready() const { return get() != nullptr; }

    // Serializes calls into engines that do not support concurrent queries.
    std::mutex &serial_call_mutex() const { return serial_call_mutex_; }

private:
    std::mutex initialize_mutex_;
    std::shared_ptr<query_engine::QueryEngine> owner_;
    std::atomic<query_engine::QueryEngine *> instance_{nullptr};
    mutable std::mutex serial_call_mutex_;
};

} // namespace backend

#endif // CHATBRIDGE_BACKEND_HANDLE_HPP
