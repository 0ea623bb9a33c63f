#include "health_server.h"

#include <sys/socket.h>
#include <sys/time.h>

#include <chrono>
#include <cmath>
#include <utility>

#include <boost/asio/socket_base.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace MqBridge {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

// Sleep between accept attempts on the non-blocking acceptor.
const int kAcceptIdleMs = 50;

} // namespace

std::string RenderHealthJson(const std::string& direction, const StatsSnapshot& snapshot) {
	YAML::Emitter out;
	out.SetMapFormat(YAML::Flow);
	out.SetStringFormat(YAML::DoubleQuoted);
	out.SetDoublePrecision(12);
	out << YAML::BeginMap;
	out << YAML::Key << "status" << YAML::Value << "healthy";
	out << YAML::Key << "direction" << YAML::Value << direction;
	out << YAML::Key << "messages_processed" << YAML::Value << snapshot.messages_processed;
	out << YAML::Key << "errors" << YAML::Value << snapshot.errors;
	out << YAML::Key << "uptime" << YAML::Value << std::round(snapshot.uptime_sec * 100.0) / 100.0;
	out << YAML::EndMap;
	return out.c_str();
}

HealthResponse HandleRequest(const HealthRequest& request, const std::string& direction, const Stats& stats) {
	HealthResponse response;
	response.version(request.version());
	response.set(http::field::server, "mqbridge");
	response.keep_alive(false);
	if (request.method() == http::verb::get && request.target() == "/health") {
		response.result(http::status::ok);
		response.set(http::field::content_type, "application/json");
		response.body() = RenderHealthJson(direction, stats.Snapshot());
	} else {
		response.result(http::status::not_found);
	}
	response.prepare_payload();
	return response;
}

HealthServer::HealthServer(std::string direction, const Stats& stats, int port)
	: direction_(std::move(direction)),
	  stats_(stats),
	  requested_port_(port) {}

HealthServer::~HealthServer() {
	Stop();
}

bool HealthServer::Start() {
	beast::error_code ec;
	auto acceptor = std::make_unique<tcp::acceptor>(ioc_);
	const tcp::endpoint endpoint(tcp::v4(), static_cast<unsigned short>(requested_port_));

	acceptor->open(endpoint.protocol(), ec);
	if (ec) {
		LOG(WARNING) << "[HealthServer] Socket creation failed: " << ec.message();
		return false;
	}
	acceptor->set_option(asio::socket_base::reuse_address(true), ec);
	if (ec) {
		LOG(WARNING) << "[HealthServer] reuse_address failed: " << ec.message();
	}
	acceptor->bind(endpoint, ec);
	if (ec) {
		LOG(WARNING) << "[HealthServer] Could not start health server on port " << requested_port_
			<< ": " << ec.message();
		return false;
	}
	acceptor->listen(asio::socket_base::max_listen_connections, ec);
	if (ec) {
		LOG(WARNING) << "[HealthServer] listen failed: " << ec.message();
		return false;
	}
	acceptor->non_blocking(true, ec);
	if (ec) {
		LOG(WARNING) << "[HealthServer] non_blocking failed: " << ec.message();
		return false;
	}

	tcp::endpoint local = acceptor->local_endpoint(ec);
	bound_port_ = ec ? requested_port_ : local.port();
	acceptor_ = std::move(acceptor);

	stop_threads_ = false;
	thread_ = std::thread(&HealthServer::MainThread, this);
	LOG(INFO) << "[HealthServer] Health check server started on port " << bound_port_;
	return true;
}

void HealthServer::Stop() {
	stop_threads_ = true;
	if (thread_.joinable()) {
		thread_.join();
		LOG(INFO) << "[HealthServer] Stopped";
	}
	if (acceptor_) {
		beast::error_code ec;
		acceptor_->close(ec);
		acceptor_.reset();
	}
}

void HealthServer::MainThread() {
	while (!stop_threads_) {
		tcp::socket socket(ioc_);
		beast::error_code ec;
		acceptor_->accept(socket, ec);
		if (ec == asio::error::would_block || ec == asio::error::try_again) {
			std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptIdleMs));
			continue;
		}
		if (ec) {
			LOG(WARNING) << "[HealthServer] Error accepting connection: " << ec.message();
			continue;
		}
		ServeClient(socket);
	}
}

void HealthServer::ServeClient(tcp::socket& socket) {
	beast::error_code ec;
	// Accepted sockets may inherit non-blocking mode; serve each one synchronously.
	socket.non_blocking(false, ec);

	struct timeval timeout;
	timeout.tv_sec = kHealthPollTickMs / 1000;
	timeout.tv_usec = (kHealthPollTickMs % 1000) * 1000;
	if (setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
		VLOG(1) << "[HealthServer] setsockopt(SO_RCVTIMEO) failed";
	}

	beast::flat_buffer buffer;
	HealthRequest request;
	http::read(socket, buffer, request, ec);
	if (ec) {
		VLOG(1) << "[HealthServer] Dropping request: " << ec.message();
		return;
	}

	HealthResponse response = HandleRequest(request, direction_, stats_);
	VLOG(2) << "[HealthServer] " << request.method_string() << " " << request.target() << " -> "
		<< response.result_int();

	http::write(socket, response, ec);
	if (ec) {
		VLOG(1) << "[HealthServer] write failed: " << ec.message();
	}
	socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace MqBridge
