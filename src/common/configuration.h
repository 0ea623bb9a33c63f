#ifndef MQBRIDGE_SRC_COMMON_CONFIGURATION_H_
#define MQBRIDGE_SRC_COMMON_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace MqBridge {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure. Environment variable names match the
 * deployment manifests of the replicator pods.
 */
struct MqBridgeConfig {
    struct Kafka {
        // Cluster used by K2R / R2K
        ConfigValue<std::string> bootstrap_servers{"kafka:9092", "KAFKA_BOOTSTRAP_SERVERS"};
        // Clusters used by S2T / T2S
        ConfigValue<std::string> source_bootstrap_servers{"", "SOURCE_BOOTSTRAP_SERVERS"};
        ConfigValue<std::string> target_bootstrap_servers{"", "TARGET_BOOTSTRAP_SERVERS"};
        // group.id of the consumer; offsets are never committed to it.
        ConfigValue<std::string> consumer_group{"", "CONSUMER_GROUP"};
        // false limits the assignment to partition 0 of every topic.
        ConfigValue<bool> assign_all_partitions{true, "KAFKA_ASSIGN_ALL_PARTITIONS"};
        ConfigValue<int> max_poll_records{kKafkaMaxPollRecords, "KAFKA_MAX_POLL_RECORDS"};
    } kafka;

    struct RabbitMQ {
        ConfigValue<std::string> host{"rabbitmq", "RABBITMQ_HOST"};
        ConfigValue<int> port{5672, "RABBITMQ_PORT"};
        ConfigValue<std::string> username{"user", "RABBITMQ_USERNAME"};
        ConfigValue<std::string> password{"password", "RABBITMQ_PASSWORD"};
        ConfigValue<std::string> vhost{"/", "RABBITMQ_VHOST"};
        ConfigValue<int> heartbeat_sec{600, "RABBITMQ_HEARTBEAT"};
        ConfigValue<int> blocked_timeout_sec{300, "RABBITMQ_BLOCKED_TIMEOUT"};
        // 0 = no basic.qos limit
        ConfigValue<int> prefetch{0, "RABBITMQ_PREFETCH"};
    } rabbitmq;

    struct Replication {
        // K2R, R2K, S2T or T2S
        ConfigValue<std::string> direction{"K2R", "REPLICATOR_DIRECTION"};
        // JSON list of kafkaTopic/rabbitmq* objects (K2R, R2K)
        ConfigValue<std::string> mappings{"[]", "REPLICATION_MAPPINGS"};
        // JSON object source topic -> destination topic (S2T, T2S)
        ConfigValue<std::string> topic_mapping{"{}", "TOPIC_MAPPING"};
        ConfigValue<int> heartbeat_interval_sec{kHeartbeatIntervalSec, "HEARTBEAT_INTERVAL"};
        ConfigValue<int> max_empty_polls{kMaxEmptyPolls, "MAX_EMPTY_POLLS"};
        // leave, requeue or discard
        ConfigValue<std::string> delivery_failure_policy{"leave", "DELIVERY_FAILURE_POLICY"};
    } replication;

    struct Health {
        ConfigValue<bool> enabled{true, "HEALTH_ENABLED"};
        ConfigValue<int> port{kHealthPort, "HEALTH_PORT"};
    } health;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file. Only parse errors fail; call validate()
    // once every override has been applied.
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // The positional direction tag on the command line wins over the
    // environment and the file.
    void overrideDirection(const std::string& direction) { direction_override_ = direction; }
    // Same precedence for --health_port.
    void overrideHealthPort(int port) { health_port_override_ = port; }

    // Get the configuration
    const MqBridgeConfig& config() const { return config_; }
    MqBridgeConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getDirection() const {
        return direction_override_ ? *direction_override_ : config_.replication.direction.get();
    }
    int getHealthPort() const {
        return health_port_override_ ? *health_port_override_ : config_.health.port.get();
    }
    int getHeartbeatIntervalSec() const { return config_.replication.heartbeat_interval_sec.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Drops file values so tests start from the built-in defaults.
    void reset() {
        config_ = MqBridgeConfig();
        direction_override_.reset();
        health_port_override_.reset();
        validation_errors_.clear();
    }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    MqBridgeConfig config_;
    std::optional<std::string> direction_override_;
    std::optional<int> health_port_override_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace MqBridge

#endif // MQBRIDGE_SRC_COMMON_CONFIGURATION_H_
