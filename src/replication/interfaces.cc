#include "interfaces.h"

#include <chrono>
#include <thread>

#include <glog/logging.h>

#include "common/errors.h"

namespace MqBridge {

const char* ConnectionStateName(ConnectionState state) {
	switch (state) {
		case ConnectionState::kDisconnected: return "Disconnected";
		case ConnectionState::kConnecting: return "Connecting";
		case ConnectionState::kConnected: return "Connected";
		case ConnectionState::kFailed: return "Failed";
	}
	return "Unknown";
}

void ConnectWithRetry(const std::string& component, const std::function<void()>& attempt,
		int max_attempts, int backoff_ms, const std::atomic<bool>* stop) {
	if (max_attempts < 1) {
		max_attempts = 1;
	}
	for (int i = 1; ; ++i) {
		try {
			attempt();
			if (i > 1) {
				LOG(INFO) << "[" << component << "] Connected on attempt " << i << "/" << max_attempts;
			}
			return;
		} catch (const ConnectionError& e) {
			LOG(WARNING) << "[" << component << "] Connection attempt " << i << "/" << max_attempts
				<< " failed: " << e.what();
			if (i >= max_attempts) {
				LOG(ERROR) << "[" << component << "] Giving up after " << max_attempts << " attempts";
				throw;
			}
			if (stop && stop->load()) {
				throw ConnectionError(component + ": shutdown requested while connecting");
			}
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
	}
}

} // namespace MqBridge
