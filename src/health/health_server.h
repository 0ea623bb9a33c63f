#ifndef MQBRIDGE_SRC_HEALTH_HEALTH_SERVER_H_
#define MQBRIDGE_SRC_HEALTH_HEALTH_SERVER_H_

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include "common/config.h"
#include "common/stats.h"

namespace MqBridge {

using HealthRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HealthResponse = boost::beast::http::response<boost::beast::http::string_body>;

// {"status": "healthy", "direction": ..., "messages_processed": ..., "errors": ..., "uptime": ...}
std::string RenderHealthJson(const std::string& direction, const StatsSnapshot& snapshot);

// GET /health answers 200, anything else 404.
HealthResponse HandleRequest(const HealthRequest& request, const std::string& direction, const Stats& stats);

/**
 * Minimal HTTP/1.1 endpoint on its own thread. It only reads the
 * Stats counters and never touches the replication path.
 */
class HealthServer {
	public:
		HealthServer(std::string direction, const Stats& stats, int port = kHealthPort);
		~HealthServer();

		HealthServer(const HealthServer&) = delete;
		HealthServer& operator=(const HealthServer&) = delete;

		/**
		 * Binds and starts serving. Returns false (after logging a
		 * WARNING) when the port cannot be bound; the bridge keeps
		 * running without the endpoint.
		 */
		bool Start();
		void Stop();

		// Port actually bound; differs from the requested one when it was 0.
		int port() const { return bound_port_; }

	private:
		void MainThread();
		void ServeClient(boost::asio::ip::tcp::socket& socket);

		const std::string direction_;
		const Stats& stats_;
		const int requested_port_;
		int bound_port_ = -1;

		boost::asio::io_context ioc_;
		std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
		std::atomic<bool> stop_threads_{false};
		std::thread thread_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_HEALTH_HEALTH_SERVER_H_
