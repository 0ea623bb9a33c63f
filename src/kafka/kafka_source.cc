#include "kafka_source.h"

#include <algorithm>
#include <map>

#include <glog/logging.h>

#include "common/errors.h"

namespace MqBridge {

KafkaSource::KafkaSource(KafkaSourceOptions options)
	: options_(std::move(options)),
	  event_logger_(options_.component) {}

KafkaSource::~KafkaSource() {
	ReleaseConsumer();
}

void KafkaSource::Connect() {
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

void KafkaSource::ConnectOnce() {
	ReleaseConsumer();

	const std::string group = options_.consumer_group.empty() ? "mqbridge-replicator"
		: options_.consumer_group;
	auto conf = MakeKafkaConf({
		{"bootstrap.servers", options_.bootstrap_servers},
		{"client.id", "mqbridge-" + options_.component},
		{"group.id", group},
		{"enable.auto.commit", "false"},
		{"enable.auto.offset.store", "false"},
		{"enable.partition.eof", "false"},
		{"auto.offset.reset", "latest"},
	});
	std::string errstr;
	if (conf->set("event_cb", &event_logger_, errstr) != RdKafka::Conf::CONF_OK) {
		throw ConfigurationError("Kafka event_cb rejected: " + errstr);
	}

	consumer_.reset(RdKafka::KafkaConsumer::create(conf.get(), errstr));
	if (!consumer_) {
		throw ConnectionError("Failed to create Kafka consumer: " + errstr);
	}

	RdKafka::Metadata* raw_metadata = nullptr;
	RdKafka::ErrorCode err = consumer_->metadata(true, nullptr, &raw_metadata, kKafkaMetadataTimeoutMs);
	std::unique_ptr<RdKafka::Metadata> metadata(raw_metadata);
	if (err != RdKafka::ERR_NO_ERROR) {
		ReleaseConsumer();
		throw ConnectionError("No brokers available at " + options_.bootstrap_servers + ": " +
				RdKafka::err2str(err));
	}

	std::map<std::string, std::vector<int32_t>> partitions_by_topic;
	for (const RdKafka::TopicMetadata* topic : *metadata->topics()) {
		if (topic->err() != RdKafka::ERR_NO_ERROR) {
			continue;
		}
		auto& ids = partitions_by_topic[topic->topic()];
		for (const RdKafka::PartitionMetadata* partition : *topic->partitions()) {
			ids.push_back(partition->id());
		}
	}
	for (const auto& topic : options_.topics) {
		if (partitions_by_topic.find(topic) == partitions_by_topic.end()) {
			LOG(WARNING) << "[" << name() << "] Topic " << topic
				<< " not in broker metadata, assigning partition 0";
		}
	}

	assignment_ = BuildAssignment(options_.topics, partitions_by_topic, options_.assign_all_partitions);
	positions_.clear();

	std::vector<RdKafka::TopicPartition*> partitions;
	for (const auto& tp : assignment_) {
		partitions.push_back(RdKafka::TopicPartition::create(tp.topic, tp.partition,
					RdKafka::Topic::OFFSET_END));
	}
	err = consumer_->assign(partitions);
	RdKafka::TopicPartition::destroy(partitions);
	if (err != RdKafka::ERR_NO_ERROR) {
		ReleaseConsumer();
		throw ConnectionError("Partition assignment failed: " + RdKafka::err2str(err));
	}

	for (const auto& tp : assignment_) {
		LOG(INFO) << "[" << name() << "] Assigned " << tp.topic << "[" << tp.partition
			<< "] at live tail";
	}
	LOG(INFO) << "[" << name() << "] Connected, " << assignment_.size() << " partitions assigned";
}

void KafkaSource::ReleaseConsumer() {
	if (!consumer_) {
		return;
	}
	RdKafka::ErrorCode err = consumer_->unassign();
	if (err != RdKafka::ERR_NO_ERROR) {
		LOG(WARNING) << "[" << name() << "] Unassign failed: " << RdKafka::err2str(err);
	}
	err = consumer_->close();
	if (err != RdKafka::ERR_NO_ERROR) {
		LOG(WARNING) << "[" << name() << "] Close failed: " << RdKafka::err2str(err);
	}
	consumer_.reset();
}

void KafkaSource::Close() {
	ReleaseConsumer();
	assignment_.clear();
	positions_.clear();
	state_ = ConnectionState::kDisconnected;
	LOG(INFO) << "[" << name() << "] Closed";
}

bool KafkaSource::Probe() {
	if (!consumer_ || assignment_.empty()) {
		LOG(WARNING) << "[" << name() << "] Probe: no partition assignment";
		return false;
	}

	std::vector<RdKafka::TopicPartition*> current;
	RdKafka::ErrorCode err = consumer_->assignment(current);
	bool assigned = err == RdKafka::ERR_NO_ERROR && !current.empty();
	RdKafka::TopicPartition::destroy(current);
	if (!assigned) {
		LOG(WARNING) << "[" << name() << "] Probe: consumer lost its assignment";
		return false;
	}

	RdKafka::Metadata* raw_metadata = nullptr;
	err = consumer_->metadata(false, nullptr, &raw_metadata, kKafkaMetadataTimeoutMs);
	std::unique_ptr<RdKafka::Metadata> metadata(raw_metadata);
	if (err != RdKafka::ERR_NO_ERROR) {
		LOG(WARNING) << "[" << name() << "] Probe: metadata request failed: " << RdKafka::err2str(err);
		return false;
	}
	return true;
}

size_t KafkaSource::Poll(int timeout_ms, const MessageHandler& handler) {
	if (!consumer_) {
		throw ConnectionError(name() + " is not connected");
	}

	size_t delivered = 0;
	int wait_ms = timeout_ms;
	const size_t batch_limit = static_cast<size_t>(std::max(options_.max_poll_records, 1));
	while (delivered < batch_limit) {
		std::unique_ptr<RdKafka::Message> message(consumer_->consume(wait_ms));
		// Only the first read of a batch blocks.
		wait_ms = 0;
		if (!message) {
			break;
		}

		RdKafka::ErrorCode err = message->err();
		if (err == RdKafka::ERR__TIMED_OUT) {
			break;
		}
		if (err == RdKafka::ERR__PARTITION_EOF) {
			continue;
		}
		if (err != RdKafka::ERR_NO_ERROR) {
			if (err == RdKafka::ERR__FATAL) {
				LOG(ERROR) << "[" << name() << "] Fatal consumer error: " << message->errstr();
				state_ = ConnectionState::kFailed;
			} else {
				LOG(WARNING) << "[" << name() << "] Consume error: " << message->errstr();
			}
			break;
		}

		InFlightMessage in_flight = ToInFlightMessage(*message);
		positions_[TopicPartitionId{in_flight.origin.kafka.topic, in_flight.origin.kafka.partition}] =
			in_flight.origin.kafka.offset + 1;
		++delivered;
		handler(in_flight);
	}
	return delivered;
}

InFlightMessage KafkaSource::ToInFlightMessage(RdKafka::Message& message) const {
	InFlightMessage in_flight;
	in_flight.source = message.topic_name();
	if (message.payload() != nullptr) {
		in_flight.payload.assign(static_cast<const char*>(message.payload()), message.len());
	}
	if (message.key_pointer() != nullptr) {
		in_flight.key = std::string(static_cast<const char*>(message.key_pointer()), message.key_len());
	}

	RdKafka::Headers* headers = message.headers();
	if (headers != nullptr) {
		for (const auto& header : headers->get_all()) {
			if (header.value() == nullptr) {
				in_flight.headers.push_back({header.key(), HeaderValue::Null()});
			} else {
				in_flight.headers.push_back({header.key(), HeaderValue::Bytes(std::string(
							static_cast<const char*>(header.value()), header.value_size()))});
			}
		}
	}

	in_flight.origin.broker = BrokerKind::kKafka;
	in_flight.origin.kafka.topic = in_flight.source;
	in_flight.origin.kafka.partition = message.partition();
	in_flight.origin.kafka.offset = message.offset();
	return in_flight;
}

std::vector<PartitionLag> KafkaSource::Lag() {
	std::vector<PartitionLag> lags;
	if (!consumer_) {
		return lags;
	}
	for (const auto& tp : assignment_) {
		int64_t low = 0;
		int64_t high = 0;
		RdKafka::ErrorCode err = consumer_->query_watermark_offsets(tp.topic, tp.partition,
				&low, &high, kKafkaWatermarkTimeoutMs);
		if (err != RdKafka::ERR_NO_ERROR) {
			LOG(WARNING) << "[" << name() << "] Could not get watermarks for " << tp.topic << "["
				<< tp.partition << "]: " << RdKafka::err2str(err);
			continue;
		}
		// Nothing consumed yet means we are still at the tail we started from.
		auto it = positions_.find(tp);
		int64_t next = it == positions_.end() ? high : it->second;
		lags.push_back({tp.topic, tp.partition, EstimateLag(high, next)});
	}
	return lags;
}

} // namespace MqBridge
