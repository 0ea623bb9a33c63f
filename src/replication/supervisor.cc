#include "supervisor.h"

#include <iomanip>
#include <sstream>
#include <thread>

#include <glog/logging.h>

#include "common/errors.h"

namespace MqBridge {

namespace {

const char* const kBanner = "==================================================";

std::string FormatSeconds(double seconds, int precision) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(precision) << seconds;
	return out.str();
}

} // namespace

const char* SupervisorStateName(SupervisorState state) {
	switch (state) {
		case SupervisorState::kStarting: return "Starting";
		case SupervisorState::kRunning: return "Running";
		case SupervisorState::kDraining: return "Draining";
		case SupervisorState::kStopped: return "Stopped";
	}
	return "Unknown";
}

std::vector<std::string> FormatHeartbeat(const std::string& direction_tag,
		const StatsSnapshot& snapshot, const std::vector<PartitionLag>& lag) {
	std::vector<std::string> lines;
	lines.push_back("HEARTBEAT [" + direction_tag + "] - Uptime: " + FormatSeconds(snapshot.uptime_sec, 0) + "s");
	lines.push_back("Messages processed: " + std::to_string(snapshot.messages_processed));
	lines.push_back("Errors: " + std::to_string(snapshot.errors));
	if (snapshot.since_last_message_sec) {
		lines.push_back("Last message: " + FormatSeconds(*snapshot.since_last_message_sec, 1) + "s ago");
	} else {
		lines.push_back("Last message: Never");
	}
	if (snapshot.messages_processed > 0) {
		lines.push_back("Average rate: " + FormatSeconds(snapshot.average_rate, 2) + " msg/s");
	}

	if (!lag.empty()) {
		int64_t total = 0;
		for (const auto& p : lag) {
			lines.push_back("  " + p.topic + "[" + std::to_string(p.partition) + "] lag: " + std::to_string(p.lag));
			total += p.lag;
		}
		lines.push_back("Total lag: " + std::to_string(total) + " messages");
	}
	return lines;
}

Supervisor::Supervisor(SupervisorOptions options, const MappingTable& mappings,
		std::unique_ptr<MessageSource> source, std::unique_ptr<MessageSink> sink,
		Stats& stats, std::atomic<bool>& stop)
	: options_(std::move(options)),
	  source_(std::move(source)),
	  sink_(std::move(sink)),
	  stats_(stats),
	  stop_(stop),
	  pipeline_(options_.dedup_prefix, mappings, *source_, *sink_, stats,
			  options_.failure_policy),
	  last_heartbeat_(std::chrono::steady_clock::now()) {}

int Supervisor::Run() {
	state_ = SupervisorState::kStarting;
	LOG(INFO) << "[Supervisor] Starting " << options_.direction_tag << " replication: "
		<< source_->name() << " -> " << sink_->name();

	// Destination first so that nothing is consumed without a place to put it.
	try {
		sink_->Connect();
		source_->Connect();
	} catch (const std::exception& e) {
		LOG(ERROR) << "[Supervisor] Startup failed: " << e.what();
		sink_->Close();
		source_->Close();
		state_ = SupervisorState::kStopped;
		return 1;
	}

	state_ = SupervisorState::kRunning;
	last_heartbeat_ = std::chrono::steady_clock::now();
	LOG(INFO) << "[Supervisor] Running, waiting for messages";

	while (!stop_.load()) {
		RunIteration();
	}

	state_ = SupervisorState::kDraining;
	Drain();
	state_ = SupervisorState::kStopped;
	return 0;
}

void Supervisor::RunIteration() {
	try {
		MaybeHeartbeat();
		RecoverFailedAdapters();

		int timeout_ms = options_.poll_timeout_ms >= 0 ? options_.poll_timeout_ms
			: source_->PollTimeoutMs();
		size_t received = source_->Poll(timeout_ms, [this](InFlightMessage& message) {
			pipeline_.Process(message);
		});

		if (received == 0) {
			OnEmptyPoll();
		} else {
			empty_polls_ = 0;
		}
		MaybeRecycleSource(received == 0);

		sink_->Service();
	} catch (const std::exception& e) {
		stats_.RecordError();
		LOG(ERROR) << "[Supervisor] Error in replication loop: " << e.what();
		std::this_thread::sleep_for(std::chrono::milliseconds(options_.error_pause_ms));
	}
}

void Supervisor::OnEmptyPoll() {
	++empty_polls_;
	if (empty_polls_ <= 5 || empty_polls_ % 30 == 0) {
		LOG(INFO) << "[Supervisor] No messages received (empty poll #" << empty_polls_ << ")";
	}
	if (empty_polls_ < options_.max_empty_polls) {
		return;
	}
	// Reset first so a failing reconnect does not probe on every iteration.
	empty_polls_ = 0;
	if (source_->Probe()) {
		VLOG(1) << "[Supervisor] " << source_->name() << " probe ok after "
			<< options_.max_empty_polls << " empty polls";
		return;
	}
	LOG(WARNING) << "[Supervisor] " << source_->name() << " probe failed after "
		<< options_.max_empty_polls << " empty polls, reconnecting";
	ReconnectSource();
}

void Supervisor::RecoverFailedAdapters() {
	if (sink_->state() == ConnectionState::kFailed) {
		LOG(WARNING) << "[Supervisor] " << sink_->name() << " failed, reconnecting";
		sink_->Reconnect();
	}
	if (source_->state() == ConnectionState::kFailed) {
		LOG(WARNING) << "[Supervisor] " << source_->name() << " failed, reconnecting";
		ReconnectSource();
	}
}

void Supervisor::MaybeRecycleSource(bool idle) {
	const size_t left = pipeline_.left_unacknowledged();
	if (left == 0 || !source_->RedeliversUnacknowledgedOnReconnect()) {
		return;
	}
	// Retry only once the destination has shown it can take messages again.
	if (!pipeline_.replicated_since_leave() && !(idle && sink_->Probe())) {
		return;
	}
	LOG(INFO) << "[Supervisor] Recycling " << source_->name() << " to redeliver " << left
		<< " unacknowledged message(s)";
	ReconnectSource();
}

void Supervisor::ReconnectSource() {
	if (source_->RedeliversUnacknowledgedOnReconnect()) {
		pipeline_.ClearLeftUnacknowledged();
	}
	source_->Reconnect();
}

void Supervisor::MaybeHeartbeat() {
	auto now = std::chrono::steady_clock::now();
	if (now - last_heartbeat_ >= std::chrono::seconds(options_.heartbeat_interval_sec)) {
		LogHeartbeat();
		last_heartbeat_ = now;
	}
}

void Supervisor::LogHeartbeat() {
	LOG(INFO) << kBanner;
	for (const auto& line : FormatHeartbeat(options_.direction_tag, stats_.Snapshot(), source_->Lag())) {
		LOG(INFO) << line;
	}
	LOG(INFO) << kBanner;
}

void Supervisor::Drain() {
	LOG(INFO) << "[Supervisor] Shutdown requested, draining";
	try {
		sink_->Flush(options_.flush_timeout_ms);
	} catch (const BridgeError& e) {
		LOG(ERROR) << "[Supervisor] Flush failed during shutdown: " << e.what();
	}
	sink_->Close();
	source_->Close();

	StatsSnapshot snapshot = stats_.Snapshot();
	LOG(INFO) << "[Supervisor] Final stats: " << snapshot.messages_processed
		<< " messages processed, " << snapshot.errors << " errors";
}

} // namespace MqBridge
