#ifndef MQBRIDGE_SRC_REPLICATION_INTERFACES_H_
#define MQBRIDGE_SRC_REPLICATION_INTERFACES_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "common/config.h"
#include "message.h"

namespace MqBridge {

enum class ConnectionState { kDisconnected, kConnecting, kConnected, kFailed };

const char* ConnectionStateName(ConnectionState state);

/**
 * Connection lifecycle shared by every broker adapter. An adapter is
 * kConnected only after its partition assignment or topology and
 * subscriptions have been (re)established.
 */
class BrokerAdapter {
public:
	virtual ~BrokerAdapter() = default;

	// Component tag used in logs, e.g. "KafkaSource".
	virtual std::string name() const = 0;

	/**
	 * Establishes the connection with bounded retry.
	 * Throws ConnectionError once the attempts are exhausted.
	 */
	virtual void Connect() = 0;

	virtual void Reconnect() {
		Close();
		Connect();
	}

	virtual void Close() = 0;

	// Cheap liveness check; false means the caller should Reconnect().
	virtual bool Probe() = 0;

	virtual ConnectionState state() const = 0;
};

using MessageHandler = std::function<void(InFlightMessage&)>;

struct PartitionLag {
	std::string topic;
	int32_t partition = 0;
	int64_t lag = 0;
};

class MessageSource : public BrokerAdapter {
public:
	/**
	 * Waits up to `timeout_ms` for messages and hands each one to
	 * `handler` in receipt order. Returns the number handed over.
	 */
	virtual size_t Poll(int timeout_ms, const MessageHandler& handler) = 0;

	// Default wait for one supervisor iteration.
	virtual int PollTimeoutMs() const = 0;

	virtual void Acknowledge(const InFlightMessage& message) = 0;
	virtual void Reject(const InFlightMessage& message, bool requeue) = 0;

	// Estimated per-partition lag; empty where the broker has no offsets.
	virtual std::vector<PartitionLag> Lag() { return {}; }

	// True when reconnecting hands unacknowledged messages back to the
	// broker, which then delivers them again.
	virtual bool RedeliversUnacknowledgedOnReconnect() const { return false; }
};

class MessageSink : public BrokerAdapter {
public:
	/**
	 * Produces one message and blocks until the broker confirms it.
	 * Throws DeliveryError, ConnectionError or RouteNotFoundError.
	 */
	virtual void Publish(const OutboundMessage& message) = 0;

	virtual void Flush(int timeout_ms) = 0;

	// Called once per supervisor iteration to keep the connection serviced.
	virtual void Service() {}
};

/**
 * Runs `attempt` until it returns without throwing ConnectionError,
 * sleeping `backoff_ms` between tries. Gives up early when `stop` is set.
 * Rethrows the last ConnectionError once `max_attempts` is reached.
 */
void ConnectWithRetry(const std::string& component, const std::function<void()>& attempt,
		int max_attempts = kConnectMaxAttempts, int backoff_ms = kConnectRetryBackoffMs,
		const std::atomic<bool>* stop = nullptr);

} // namespace MqBridge

#endif // MQBRIDGE_SRC_REPLICATION_INTERFACES_H_
