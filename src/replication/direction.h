#ifndef MQBRIDGE_SRC_REPLICATION_DIRECTION_H_
#define MQBRIDGE_SRC_REPLICATION_DIRECTION_H_

#include <optional>
#include <string>

namespace MqBridge {

enum class Direction {
	kKafkaToRabbit,   // K2R
	kRabbitToKafka,   // R2K
	kSourceToTarget,  // S2T, Kafka cluster to Kafka cluster
	kTargetToSource,  // T2S, the same bridge run the other way
};

inline std::optional<Direction> ParseDirection(const std::string& tag) {
	if (tag == "K2R") return Direction::kKafkaToRabbit;
	if (tag == "R2K") return Direction::kRabbitToKafka;
	if (tag == "S2T") return Direction::kSourceToTarget;
	if (tag == "T2S") return Direction::kTargetToSource;
	return std::nullopt;
}

inline const char* DirectionTag(Direction direction) {
	switch (direction) {
		case Direction::kKafkaToRabbit: return "K2R";
		case Direction::kRabbitToKafka: return "R2K";
		case Direction::kSourceToTarget: return "S2T";
		case Direction::kTargetToSource: return "T2S";
	}
	return "UNKNOWN";
}

// Prefix of the deduplication identifiers built for this direction.
inline const char* DedupPrefix(Direction direction) {
	switch (direction) {
		case Direction::kKafkaToRabbit: return "k2r";
		case Direction::kRabbitToKafka: return "r2k";
		case Direction::kSourceToTarget: return "s2t";
		case Direction::kTargetToSource: return "t2s";
	}
	return "unknown";
}

inline bool IsLogToLog(Direction direction) {
	return direction == Direction::kSourceToTarget || direction == Direction::kTargetToSource;
}

} // namespace MqBridge

#endif // MQBRIDGE_SRC_REPLICATION_DIRECTION_H_
