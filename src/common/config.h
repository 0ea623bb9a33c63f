#ifndef MQBRIDGE_SRC_COMMON_CONFIG_H_
#define MQBRIDGE_SRC_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace MqBridge {

/// Broker connection configs
/// Number of attempts before a broker connection is considered unreachable.
const int kConnectMaxAttempts = 5;
/// Fixed delay between two connection attempts.
const int kConnectRetryBackoffMs = 5000;
/// Timeout for metadata requests used to verify a Kafka connection.
const int kKafkaMetadataTimeoutMs = 10000;
/// Timeout for watermark queries used by lag estimation.
const int kKafkaWatermarkTimeoutMs = 5000;
/// TCP connect timeout for the RabbitMQ socket.
const int kRabbitSocketTimeoutMs = 10000;

/// Consume configs
/// Blocking time of one Kafka poll.
const int kKafkaPollTimeoutMs = 5000;
/// Time slice spent processing RabbitMQ events per loop iteration.
const int kRabbitEventSliceMs = 1000;
/// Upper bound of records handed to the pipeline per Kafka poll.
const int kKafkaMaxPollRecords = 100;
/// Upper bound of deliveries handed to the pipeline per RabbitMQ slice.
const int kRabbitMaxDeliveriesPerPoll = 100;

/// Produce configs
/// How long a publish waits for the broker's confirmation.
const int kProduceConfirmTimeoutMs = 30000;
/// How long the producer is flushed during shutdown.
const int kProducerFlushTimeoutMs = 10000;

/// Supervisor configs
const int kHeartbeatIntervalSec = 60;
/// Consecutive empty polls before the consume side is probed.
const int kMaxEmptyPolls = 100;
/// Pause after an unexpected error inside one loop iteration.
const int kIterationErrorPauseMs = 1000;

/// Deduplication window configs
const size_t kDedupWindowCapacity = 10000;
const size_t kDedupWindowEvictBatch = 1000;

/// Health endpoint configs
const int kHealthPort = 8080;
const int kHealthPollTickMs = 1000;

} // namespace MqBridge

#endif // MQBRIDGE_SRC_COMMON_CONFIG_H_
