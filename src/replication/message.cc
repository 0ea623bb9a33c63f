#include "message.h"

namespace MqBridge {

std::string HeaderValue::ToBytes() const {
	switch (kind) {
		case Kind::kNull:
			return std::string();
		case Kind::kText:
		case Kind::kBytes:
			return bytes;
		case Kind::kInt32:
		case Kind::kInt64:
			return std::to_string(number);
	}
	return std::string();
}

std::optional<std::string> DecodeUtf8(const std::string& bytes) {
	const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
	size_t n = bytes.size();
	size_t i = 0;

	while (i < n) {
		unsigned char c = s[i];
		size_t len;
		uint32_t cp;
		if (c < 0x80) {
			++i;
			continue;
		} else if ((c & 0xE0) == 0xC0) {
			len = 2;
			cp = c & 0x1F;
		} else if ((c & 0xF0) == 0xE0) {
			len = 3;
			cp = c & 0x0F;
		} else if ((c & 0xF8) == 0xF0) {
			len = 4;
			cp = c & 0x07;
		} else {
			return std::nullopt;
		}
		if (i + len > n) return std::nullopt;
		for (size_t k = 1; k < len; ++k) {
			if ((s[i + k] & 0xC0) != 0x80) return std::nullopt;
			cp = (cp << 6) | (s[i + k] & 0x3F);
		}
		// Overlong forms, surrogates and values past U+10FFFF
		if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
			return std::nullopt;
		}
		if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
			return std::nullopt;
		}
		i += len;
	}
	return bytes;
}

std::string DescribeOrigin(const OriginCoordinates& origin) {
	if (origin.broker == BrokerKind::kKafka) {
		return origin.kafka.topic + ":" + std::to_string(origin.kafka.partition) + ":" +
			std::to_string(origin.kafka.offset);
	}
	return origin.rabbitmq.queue + ":" + std::to_string(origin.rabbitmq.delivery_tag);
}

std::string MakeDedupId(const std::string& prefix, const OriginCoordinates& origin) {
	return prefix + ":" + DescribeOrigin(origin);
}

std::string DescribeDestination(const Destination& destination) {
	if (!destination.topic.empty()) {
		return destination.topic;
	}
	if (destination.exchange.empty()) {
		return "(default)/" + destination.routing_key;
	}
	return destination.exchange + "/" + destination.routing_key;
}

} // namespace MqBridge
