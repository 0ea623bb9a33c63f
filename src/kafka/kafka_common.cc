#include "kafka_common.h"

#include <algorithm>

#include <glog/logging.h>

#include "common/errors.h"

namespace MqBridge {

std::vector<TopicPartitionId> BuildAssignment(const std::vector<std::string>& topics,
		const std::map<std::string, std::vector<int32_t>>& partitions_by_topic,
		bool all_partitions) {
	std::vector<TopicPartitionId> assignment;
	for (const auto& topic : topics) {
		auto it = partitions_by_topic.find(topic);
		if (it == partitions_by_topic.end() || it->second.empty()) {
			assignment.push_back({topic, 0});
			continue;
		}
		std::vector<int32_t> partitions = it->second;
		std::sort(partitions.begin(), partitions.end());
		if (!all_partitions) {
			partitions.resize(1);
		}
		for (int32_t p : partitions) {
			assignment.push_back({topic, p});
		}
	}
	return assignment;
}

int64_t EstimateLag(int64_t high_watermark, int64_t next_offset) {
	if (high_watermark < 0 || next_offset < 0) {
		return 0;
	}
	return std::max<int64_t>(0, high_watermark - next_offset);
}

std::unique_ptr<RdKafka::Conf> MakeKafkaConf(
		const std::vector<std::pair<std::string, std::string>>& settings) {
	std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
	std::string errstr;
	for (const auto& setting : settings) {
		if (conf->set(setting.first, setting.second, errstr) != RdKafka::Conf::CONF_OK) {
			throw ConfigurationError("Kafka setting " + setting.first + "=" + setting.second +
					" rejected: " + errstr);
		}
	}
	return conf;
}

void KafkaEventLogger::event_cb(RdKafka::Event& event) {
	switch (event.type()) {
		case RdKafka::Event::EVENT_ERROR:
			if (event.fatal()) {
				LOG(ERROR) << "[" << component_ << "] Fatal librdkafka error: "
					<< RdKafka::err2str(event.err()) << " " << event.str();
			} else {
				LOG(WARNING) << "[" << component_ << "] librdkafka error: "
					<< RdKafka::err2str(event.err()) << " " << event.str();
			}
			break;
		case RdKafka::Event::EVENT_LOG:
			VLOG(1) << "[" << component_ << "] " << event.fac() << ": " << event.str();
			break;
		default:
			VLOG(2) << "[" << component_ << "] librdkafka event " << event.type() << ": " << event.str();
			break;
	}
}

} // namespace MqBridge
