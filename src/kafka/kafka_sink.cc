#include "kafka_sink.h"

#include <chrono>

#include <glog/logging.h>

#include "common/errors.h"

namespace MqBridge {

namespace {

// Time given to the broker for each produce/poll round.
constexpr int kPollSliceMs = 100;

} // namespace

void KafkaSink::DeliveryReporter::dr_cb(RdKafka::Message& message) {
	auto* holder = static_cast<std::shared_ptr<DeliveryState>*>(message.msg_opaque());
	if (holder == nullptr) {
		return;
	}
	DeliveryState& state = **holder;
	state.err = message.err();
	state.partition = message.partition();
	state.offset = message.offset();
	state.done = true;
	delete holder;
}

KafkaSink::KafkaSink(KafkaSinkOptions options)
	: options_(std::move(options)),
	  event_logger_(options_.component) {}

KafkaSink::~KafkaSink() {
	ReleaseProducer();
}

void KafkaSink::Connect() {
	state_ = ConnectionState::kConnecting;
	LOG(INFO) << "[" << name() << "] Connecting to " << options_.bootstrap_servers;
	try {
		ConnectWithRetry(name(), [this] { ConnectOnce(); }, kConnectMaxAttempts,
				kConnectRetryBackoffMs, options_.stop);
	} catch (const BridgeError&) {
		state_ = ConnectionState::kFailed;
		throw;
	}
	state_ = ConnectionState::kConnected;
}

void KafkaSink::ConnectOnce() {
	ReleaseProducer();

	auto conf = MakeKafkaConf({
		{"bootstrap.servers", options_.bootstrap_servers},
		{"client.id", "mqbridge-" + options_.component},
		{"acks", "all"},
		{"enable.idempotence", "true"},
		{"max.in.flight.requests.per.connection", "1"},
		{"retries", "5"},
		{"retry.backoff.ms", "1000"},
		{"request.timeout.ms", "30000"},
		{"delivery.timeout.ms", "120000"},
		{"linger.ms", "5"},
		{"batch.size", "16384"},
		{"compression.type", "gzip"},
		{"queue.buffering.max.kbytes", "32768"},
	});
	std::string errstr;
	if (conf->set("dr_cb", &delivery_reporter_, errstr) != RdKafka::Conf::CONF_OK ||
			conf->set("event_cb", &event_logger_, errstr) != RdKafka::Conf::CONF_OK) {
		throw ConfigurationError("Kafka callback rejected: " + errstr);
	}

	producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
	if (!producer_) {
		throw ConnectionError("Failed to create Kafka producer: " + errstr);
	}

	// The producer connects lazily; a metadata round trip proves a broker answers.
	RdKafka::Metadata* raw_metadata = nullptr;
	RdKafka::ErrorCode err = producer_->metadata(true, nullptr, &raw_metadata, kKafkaMetadataTimeoutMs);
	std::unique_ptr<RdKafka::Metadata> metadata(raw_metadata);
	if (err != RdKafka::ERR_NO_ERROR) {
		ReleaseProducer();
		throw ConnectionError("No brokers available at " + options_.bootstrap_servers + ": " +
				RdKafka::err2str(err));
	}
	LOG(INFO) << "[" << name() << "] Connected, " << metadata->brokers()->size() << " brokers";
}

void KafkaSink::ReleaseProducer() {
	if (!producer_) {
		return;
	}
	// Purged messages still get a delivery report, which frees their state.
	producer_->purge(RdKafka::Producer::PURGE_QUEUE | RdKafka::Producer::PURGE_INFLIGHT);
	producer_->poll(0);
	producer_.reset();
}

void KafkaSink::Close() {
	ReleaseProducer();
	state_ = ConnectionState::kDisconnected;
	LOG(INFO) << "[" << name() << "] Closed";
}

bool KafkaSink::CheckFatal() {
	std::string errstr;
	RdKafka::ErrorCode err = producer_->fatal_error(errstr);
	if (err == RdKafka::ERR_NO_ERROR) {
		return false;
	}
	LOG(ERROR) << "[" << name() << "] Producer fatal error " << RdKafka::err2str(err) << ": " << errstr;
	state_ = ConnectionState::kFailed;
	return true;
}

bool KafkaSink::Probe() {
	return producer_ && !CheckFatal();
}

void KafkaSink::Publish(const OutboundMessage& message) {
	if (!producer_) {
		throw ConnectionError(name() + " is not connected");
	}

	RdKafka::Headers* headers = RdKafka::Headers::create();
	for (const auto& header : message.headers) {
		RdKafka::ErrorCode err;
		if (header.value.kind == HeaderValue::Kind::kNull) {
			err = headers->add(header.name, nullptr, 0);
		} else {
			err = headers->add(header.name, header.value.ToBytes());
		}
		if (err != RdKafka::ERR_NO_ERROR) {
			delete headers;
			throw DeliveryError("Cannot add header " + header.name + ": " + RdKafka::err2str(err));
		}
	}

	auto state = std::make_shared<DeliveryState>();
	auto* opaque = new std::shared_ptr<DeliveryState>(state);
	const void* key = message.key ? message.key->data() : nullptr;
	const size_t key_len = message.key ? message.key->size() : 0;

	const auto deadline = std::chrono::steady_clock::now() +
		std::chrono::milliseconds(options_.confirm_timeout_ms);
	RdKafka::ErrorCode err;
	while (true) {
		err = producer_->produce(message.destination.topic, RdKafka::Topic::PARTITION_UA,
				RdKafka::Producer::RK_MSG_COPY,
				const_cast<char*>(message.payload.data()), message.payload.size(),
				key, key_len, 0, headers, opaque);
		if (err != RdKafka::ERR__QUEUE_FULL || std::chrono::steady_clock::now() >= deadline) {
			break;
		}
		producer_->poll(kPollSliceMs);
	}
	if (err != RdKafka::ERR_NO_ERROR) {
		// Ownership of headers and opaque only passes to librdkafka on success.
		delete headers;
		delete opaque;
		if (err == RdKafka::ERR__FATAL) {
			CheckFatal();
			throw ConnectionError("Producer is in a fatal state");
		}
		throw DeliveryError("Produce to " + message.destination.topic + " failed: " +
				RdKafka::err2str(err));
	}

	while (!state->done && std::chrono::steady_clock::now() < deadline) {
		producer_->poll(kPollSliceMs);
	}
	if (!state->done) {
		throw DeliveryError("Delivery to " + message.destination.topic + " not confirmed within " +
				std::to_string(options_.confirm_timeout_ms / 1000) + "s");
	}
	if (state->err != RdKafka::ERR_NO_ERROR) {
		if (CheckFatal()) {
			throw ConnectionError("Producer is in a fatal state: " + RdKafka::err2str(state->err));
		}
		throw DeliveryError("Delivery to " + message.destination.topic + " failed: " +
				RdKafka::err2str(state->err));
	}
	VLOG(2) << "[" << name() << "] Delivered " << message.replication_id << " to "
		<< message.destination.topic << "[" << state->partition << "]@" << state->offset;
}

void KafkaSink::Flush(int timeout_ms) {
	if (!producer_) {
		return;
	}
	RdKafka::ErrorCode err = producer_->flush(timeout_ms);
	if (err != RdKafka::ERR_NO_ERROR) {
		LOG(WARNING) << "[" << name() << "] Flush incomplete after " << timeout_ms << "ms, "
			<< producer_->outq_len() << " messages outstanding";
	}
}

void KafkaSink::Service() {
	if (!producer_) {
		return;
	}
	producer_->poll(0);
	CheckFatal();
}

} // namespace MqBridge
