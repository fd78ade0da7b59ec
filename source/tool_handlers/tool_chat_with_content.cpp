#include "tool_handlers/tool_chat_with_content.hpp"
#include "utils/server_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <mutex>
#include <utility>

namespace tool_chat_with_content {

ToolInvocationResult ToolInvocationResult::answer(std::string response, std::vector<json> sources) {
    ToolInvocationResult result;
    result.success = true;
    result.response = std::move(response);
    result.sources = std::move(sources);
    return result;
}

ToolInvocationResult ToolInvocationResult::failure(std::string error) {
    ToolInvocationResult result;
    result.success = false;
    result.error = std::move(error);
    return result;
}

json ToolInvocationResult::to_json() const {
    json payload;
    if (success) {
        payload["response"] = response;
        payload["sources"] = json::array();
        for (const auto &source : sources) {
            payload["sources"].push_back(source);
        }
    } else {
        payload["error"] = error;
    }
    utf8_sanitize::sanitize_json(payload);
    return payload;
}

ToolInvocationResult chat_with_content(const backend::BackendHandle &backend, const std::string &query) {
    query_engine::QueryEngine *engine = backend.get();
    if (engine == nullptr) {
        server_log::warning("chat_with_content", "Query received before the query engine was ready.");
        return ToolInvocationResult::failure(NOT_INITIALIZED_MESSAGE);
    }

    std::unique_lock<std::mutex> serial_lock(backend.serial_call_mutex(), std::defer_lock);
    if (!engine->supports_concurrent_queries()) {
        serial_lock.lock();
    }

    query_engine::QueryOutcome outcome = query_engine::call_engine(*engine, query);
    if (serial_lock.owns_lock()) {
        serial_lock.unlock();
    }

    if (!outcome.success) {
        server_log::error("chat_with_content", "Error in chat: " + outcome.error_detail);
        return ToolInvocationResult::failure(PROCESSING_ERROR_PREFIX + outcome.error_detail);
    }

    std::vector<json> sources;
    if (outcome.result.sources) {
        sources = std::move(*outcome.result.sources);
    }
    return ToolInvocationResult::answer(std::move(outcome.result.response), std::move(sources));
}

json handle_chat_with_content(const backend::BackendHandle &backend, const json &arguments) {
    auto query = arguments.find("query");
    if (query == arguments.end() || !query->is_string()) {
        return mcp_tools::build_text_result("Missing required parameter 'query' (string).", true);
    }

    ToolInvocationResult result = chat_with_content(backend, query->get<std::string>());
    return mcp_tools::build_structured_result(result.to_json(), !result.success);
}

void register_tool(mcp_tools::ToolRegistry &registry, const backend::BackendHandle &backend) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["query"] = {
        {"type", "string"},
        {"description", "User query to be answered based on crawled content."}
    };
    input_schema["required"] = json::array({"query"});

    bool registered = registry.register_tool({
        TOOL_NAME,
        "Chat with the crawled content by asking a question. "
        "Returns the answer together with the sources it was based on.",
        input_schema,
        [&backend](const json &arguments) { return handle_chat_with_content(backend, arguments); }
    });
    if (!registered) {
        server_log::warning("chat_with_content", "Tool already registered, keeping the first registration.");
    }
}

} // namespace tool_chat_with_content
