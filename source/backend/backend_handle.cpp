#include "backend/backend_handle.hpp"
#include "server/server_errors.hpp"
#include "utils/server_log.hpp"

#include <exception>
#include <utility>

namespace backend {

std::shared_ptr<query_engine::QueryEngine> BackendHandle::initialize(
    std::shared_ptr<query_engine::QueryEngine> provided,
    const std::string &default_model_id,
    const query_engine::EngineFactory &factory) {
    std::lock_guard<std::mutex> lock(initialize_mutex_);

    if (owner_) {
        server_log::debug("backend", "Query engine already initialized, keeping the existing instance.");
        return owner_;
    }

    std::shared_ptr<query_engine::QueryEngine> engine;
    if (provided) {
        server_log::info("backend", "Using the provided query engine instance.");
        engine = std::move(provided);
    } else {
        if (!factory) {
            throw server_errors::InitializationError("No query engine provided and no engine factory configured");
        }
        server_log::info("backend", "Creating query engine with embedding model " + default_model_id);
        try {
            engine = factory(default_model_id);
        } catch (const std::exception &exception) {
            throw server_errors::InitializationError(
                std::string("Query engine construction failed: ") + exception.what());
        } catch (...) {
            throw server_errors::InitializationError("Query engine construction failed: unknown exception");
        }
        if (!engine) {
            throw server_errors::InitializationError("Query engine construction returned no instance");
        }
    }

    owner_ = engine;
    instance_.store(owner_.get(), std::memory_order_release);
    return owner_;
}

query_engine::QueryEngine *BackendHandle::get() const {
    return instance_.load(std::memory_order_acquire);
}

} // namespace backend
