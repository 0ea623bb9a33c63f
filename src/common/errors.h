#ifndef MQBRIDGE_SRC_COMMON_ERRORS_H_
#define MQBRIDGE_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace MqBridge {

/**
 * Base of every error raised by the bridge. Callers that can make a
 * recovery decision catch the concrete type; main() maps whatever
 * reaches it to exit code 1.
 */
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& what) : std::runtime_error(what) {}
};

/// Malformed or missing route table, servers or other settings. Fatal.
class ConfigurationError : public BridgeError {
public:
    explicit ConfigurationError(const std::string& what) : BridgeError(what) {}
};

/// Broker unreachable or connection lost.
class ConnectionError : public BridgeError {
public:
    explicit ConnectionError(const std::string& what) : BridgeError(what) {}
};

/// Destination produce failed, was rejected or timed out.
class DeliveryError : public BridgeError {
public:
    explicit DeliveryError(const std::string& what) : BridgeError(what) {}
};

/// No usable route for a message's source or destination.
class RouteNotFoundError : public BridgeError {
public:
    explicit RouteNotFoundError(const std::string& what) : BridgeError(what) {}
};

/// Exchange, queue or binding declaration rejected by the broker.
class TopologyError : public BridgeError {
public:
    explicit TopologyError(const std::string& what) : BridgeError(what) {}
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_COMMON_ERRORS_H_
