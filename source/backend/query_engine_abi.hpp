#ifndef CHATBRIDGE_QUERY_ENGINE_ABI_HPP
#define CHATBRIDGE_QUERY_ENGINE_ABI_HPP

// Query engine abstraction interface.
// The engine answers a question about the crawled content. The bridge only
// knows this call contract; retrieval and generation live behind it.

#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace query_engine {

using json = nlohmann::json;

// Answer to one query. Sources are opaque citation records, passed through
// to the caller untouched. An engine that reports no sources leaves the
// optional empty.
struct QueryResult {
    std::string response;
    std::optional<std::vector<json>> sources;
};

class QueryEngine {
public:
    virtual ~QueryEngine() = default;

    // May block for as long as the engine needs and may throw on failure.
    virtual QueryResult process_query(const std::string &query) = 0;

    // Engines that return false get their calls serialized by the backend.
    virtual bool supports_concurrent_queries() const { return false; }
};

// Builds the default engine for an embedding model identifier.
using EngineFactory = std::function<std::shared_ptr<QueryEngine>(const std::string &embedding_model)>;

// Result of calling an engine through call_engine(): exactly one of result
// (success) or error_detail (failure) is meaningful.
struct QueryOutcome {
    bool success = false;
    QueryResult result;
    std::string error_detail;
};

// Calls engine.process_query() and converts any exception into a failed
// outcome. Never throws.
QueryOutcome call_engine(QueryEngine &engine, const std::string &query);

} // namespace query_engine

#endif // CHATBRIDGE_QUERY_ENGINE_ABI_HPP
