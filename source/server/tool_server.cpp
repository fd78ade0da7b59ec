#include "server/tool_server.hpp"
#include "mcp/request_tasks.hpp"
#include "protocol/json_rpc.hpp"
#include "server/server_errors.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/server_log.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace tool_server {

namespace {

const char *const kComponent = "tool_server";

} // namespace

const char *state_name(ServerState state) {
    switch (state) {
    case ServerState::Uninitialized:
        return "Uninitialized";
    case ServerState::Initializing:
        return "Initializing";
    case ServerState::Serving:
        return "Serving";
    case ServerState::Failed:
        return "Failed";
    }
    return "Unknown";
}

ToolServer::ToolServer(server_config::ServerConfig config, query_engine::EngineFactory engine_factory)
    : config_(std::move(config)), engine_factory_(std::move(engine_factory)) {
    server_info_.name = config_.server_name;
    server_info_.version = config_.server_version;
    server_info_.description = config_.server_description;

    server_log::info(kComponent, "Initializing MCP server with port " + std::to_string(config_.mcp_port));
    tool_handlers::register_all_tools(tools_, backend_);
}

void ToolServer::start(std::shared_ptr<query_engine::QueryEngine> provided_engine) {
    start(std::move(provided_engine), std::cin, std::cout);
}

void ToolServer::start(std::shared_ptr<query_engine::QueryEngine> provided_engine, std::istream &input,
                       std::ostream &output) {
    ServerState expected = ServerState::Uninitialized;
    if (!state_.compare_exchange_strong(expected, ServerState::Initializing)) {
        throw std::logic_error(std::string("ToolServer::start called in state ") + state_name(expected));
    }

    try {
        backend_.initialize(std::move(provided_engine), config_.default_embedding_model, engine_factory_);
    } catch (const server_errors::InitializationError &error) {
        fail(std::string("Query engine initialization failed: ") + error.what());
        throw;
    }

    mcp_stdio::StdioChannel channel(input, output);
    if (!channel.healthy()) {
        fail("stdio streams are not usable");
        throw server_errors::TransportFailure("MCP server failed to start: stdio streams are not usable");
    }

    // From here on stdout carries JSON-RPC only. The file sink keeps its level.
    server_log::info(kComponent, "Starting MCP server on stdio transport.");
    server_log::suppress_console();

    state_ = ServerState::Serving;
    try {
        run_transport_loop(channel);
    } catch (const std::exception &exception) {
        server_log::critical(kComponent, std::string("MCP server failed to start or crashed: ") + exception.what());
        throw server_errors::TransportFailure(std::string("MCP transport loop crashed: ") + exception.what());
    }
}

json ToolServer::handle_message(const json &message) const {
    return mcp_dispatch::dispatch_message(server_info_, tools_, message);
}

void ToolServer::run_transport_loop(mcp_stdio::StdioChannel &channel) {
    mcp_stdio::RequestTasks tasks(static_cast<std::size_t>(config_.max_concurrent_requests));

    while (true) {
        std::string raw_message = channel.read_message();
        if (raw_message.empty()) {
            server_log::info(kComponent, "EOF on stdin. Waiting for " + std::to_string(tasks.in_flight()) +
                                             " in-flight request(s) before shutting down.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            server_log::warning(kComponent, "Failed to parse incoming JSON: " + std::string(error.what()));
            channel.write_message(json_rpc::build_parse_error_response(error.what()).dump());
            continue;
        }

        if (mcp_dispatch::is_long_running(parsed_message)) {
            try {
                tasks.spawn([this, &channel, message = parsed_message]() { respond(channel, message); });
                continue;
            } catch (const std::system_error &error) {
                server_log::error(kComponent, "Could not start a request task, answering inline: " +
                                                  std::string(error.what()));
            }
        }
        respond(channel, parsed_message);
    }

    tasks.wait_all();
    server_log::info(kComponent, "MCP server shut down.");
}

void ToolServer::respond(mcp_stdio::StdioChannel &channel, const json &message) const {
    json response;
    try {
        response = handle_message(message);
        if (response.is_null()) {
            return;
        }
        channel.write_message(response.dump());
    } catch (const std::exception &exception) {
        server_log::error(kComponent, "Failed to answer " + json_rpc::get_method(message) + ": " + exception.what());
        if (!json_rpc::is_notification(message)) {
            channel.write_message(json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::INTERNAL_ERROR,
                                                                 "Internal error")
                                      .dump());
        }
    }
}

void ToolServer::fail(const std::string &reason) {
    state_ = ServerState::Failed;
    server_log::critical(kComponent, reason);
}

} // namespace tool_server
