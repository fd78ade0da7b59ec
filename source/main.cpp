// chatbridge – MCP server for chatting with crawled content.
// Entry point: stdio MCP server exposing the chat_with_content tool.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr until the transport starts (critical-only afterwards) and
// to the log file throughout.

#include "backend/remote/remote_query_engine.hpp"
#include "config/server_config.hpp"
#include "server/server_errors.hpp"
#include "server/tool_server.hpp"
#include "utils/server_log.hpp"

#include <exception>
#include <string>

int main() {
    server_config::LoadResult loaded = server_config::load_server_config_from_environment();
    const server_config::ServerConfig &config = loaded.config;

    server_log::set_console_level(config.debug ? server_log::Level::Debug : config.log_level);
    if (!config.log_file.empty() && !server_log::open_file_sink(config.log_file, config.log_level)) {
        server_log::warning("main", "Could not open log file " + config.log_file + ", logging to stderr only.");
    }
    for (const auto &warning : loaded.warnings) {
        server_log::warning("config", warning);
    }

    server_log::info("main", "chatbridge " + config.server_version + ", build " + __DATE__ + " " + __TIME__);

    try {
        tool_server::ToolServer server(config,
                                       remote_query::make_remote_engine_factory(config.router_url,
                                                                                config.query_timeout_ms));
        server.start();
    } catch (const server_errors::InitializationError &error) {
        server_log::critical("main", std::string("Shared services must be initialized before starting the server: ") +
                                         error.what());
        return 1;
    } catch (const server_errors::TransportFailure &error) {
        server_log::critical("main", error.what());
        return 1;
    } catch (const std::exception &error) {
        server_log::critical("main", std::string("Unexpected failure: ") + error.what());
        return 1;
    }

    server_log::close_file_sink();
    return 0;
}
