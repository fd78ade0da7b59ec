#ifndef CHATBRIDGE_SERVER_ERRORS_HPP
#define CHATBRIDGE_SERVER_ERRORS_HPP

// Failures that end server startup. Per-request failures never use these;
// they are reported inside the tool result instead.

#include <stdexcept>
#include <string>

namespace server_errors {

// The query engine could not be constructed or adopted.
class InitializationError : public std::runtime_error {
public:
    explicit InitializationError(const std::string &message) : std::runtime_error(message) {}
};

// The stdio transport could not be entered or stopped abnormally.
class TransportFailure : public std::runtime_error {
public:
    explicit TransportFailure(const std::string &message) : std::runtime_error(message) {}
};

} // namespace server_errors

#endif // CHATBRIDGE_SERVER_ERRORS_HPP
