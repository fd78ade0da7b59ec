#include "backend/query_engine_abi.hpp"

#include <exception>

namespace query_engine {

QueryOutcome call_engine(QueryEngine &engine, const std::string &query) {
    QueryOutcome outcome;
    try {
        outcome.result = engine.process_query(query);
        outcome.success = true;
    } catch (const std::exception &exception) {
        outcome.success = false;
        outcome.error_detail = exception.what();
    } catch (...) {
        outcome.success = false;
        outcome.error_detail = "unknown exception from query engine";
    }
    return outcome;
}

} // namespace query_engine
