#include "config/server_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace server_config {

namespace {

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

// Reads a non-empty variable into target. Empty values count as unset.
bool read_string(const EnvironmentLookup &lookup, const char *name, std::string &target) {
    const char *value = lookup(name);
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    target = value;
    return true;
}

void read_int(const EnvironmentLookup &lookup, const char *name, int minimum, int &target,
              std::vector<std::string> &warnings) {
    std::string raw;
    if (!read_string(lookup, name, raw)) {
        return;
    }

    char *end = nullptr;
    long candidate = std::strtol(raw.c_str(), &end, 10);
    if (end == raw.c_str() || *end != '\0' || candidate < minimum || candidate > 2147483647L) {
        warnings.push_back(std::string(name) + "='" + raw + "' is not a valid number, using " +
                           std::to_string(target));
        return;
    }
    target = static_cast<int>(candidate);
}

} // namespace

bool is_truthy(const std::string &value) {
    std::string normalized = to_lower(value);
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

LoadResult load_server_config(const EnvironmentLookup &lookup) {
    LoadResult result;
    ServerConfig &config = result.config;

    read_int(lookup, "CHATBRIDGE_MCP_PORT", 1, config.mcp_port, result.warnings);
    if (config.mcp_port > 65535) {
        result.warnings.push_back("CHATBRIDGE_MCP_PORT is out of range, using 8002");
        config.mcp_port = 8002;
    }

    read_string(lookup, "CHATBRIDGE_SERVER_NAME", config.server_name);
    read_string(lookup, "CHATBRIDGE_SERVER_DESCRIPTION", config.server_description);
    read_string(lookup, "CHATBRIDGE_SERVER_VERSION", config.server_version);
    read_string(lookup, "CHATBRIDGE_EMBEDDING_MODEL", config.default_embedding_model);
    read_string(lookup, "CHATBRIDGE_ROUTER_URL", config.router_url);
    read_int(lookup, "CHATBRIDGE_QUERY_TIMEOUT_MS", 0, config.query_timeout_ms, result.warnings);
    read_int(lookup, "CHATBRIDGE_MAX_CONCURRENT_REQUESTS", 1, config.max_concurrent_requests, result.warnings);

    // An explicitly empty CHATBRIDGE_LOG_FILE disables the file sink.
    const char *log_file = lookup("CHATBRIDGE_LOG_FILE");
    if (log_file != nullptr) {
        config.log_file = log_file;
    }

    std::string level_text;
    if (read_string(lookup, "CHATBRIDGE_LOG_LEVEL", level_text)) {
        auto level = server_log::parse_level(level_text);
        if (level) {
            config.log_level = *level;
        } else {
            result.warnings.push_back("CHATBRIDGE_LOG_LEVEL='" + level_text +
                                      "' is not a known level, using info");
        }
    }

    std::string debug_text;
    if (read_string(lookup, "CHATBRIDGE_DEBUG", debug_text)) {
        config.debug = is_truthy(debug_text);
    }

    return result;
}

LoadResult load_server_config_from_environment() {
    return load_server_config([](const char *name) -> const char * { return std::getenv(name); });
}

} // namespace server_config
