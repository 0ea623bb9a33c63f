#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace MqBridge {

namespace {

const char* const kKnownDirections[] = {"K2R", "R2K", "S2T", "T2S"};

bool IsKnownDirection(const std::string& direction) {
    return std::find(std::begin(kKnownDirections), std::end(kKnownDirections), direction)
        != std::end(kKnownDirections);
}

bool IsBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string EmitJsonStyle(const YAML::Node& node) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << node;
    return out.c_str();
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            size_t pos = 0;
            int value = std::stoi(env_val, &pos);
            if (pos == std::strlen(env_val)) {
                return value;
            }
            LOG(WARNING) << "Ignoring env var " << env_var_ << "='" << env_val
                << "': trailing characters after the number";
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["mqbridge"]) {
        LOG(WARNING) << "Configuration has no top-level 'mqbridge' section, using defaults";
        return;
    }
    auto root = yaml["mqbridge"];

    // Kafka
    if (root["kafka"]) {
        auto kafka = root["kafka"];
        if (kafka["bootstrap_servers"]) config_.kafka.bootstrap_servers.set(kafka["bootstrap_servers"].as<std::string>());
        if (kafka["source_bootstrap_servers"]) config_.kafka.source_bootstrap_servers.set(kafka["source_bootstrap_servers"].as<std::string>());
        if (kafka["target_bootstrap_servers"]) config_.kafka.target_bootstrap_servers.set(kafka["target_bootstrap_servers"].as<std::string>());
        if (kafka["consumer_group"]) config_.kafka.consumer_group.set(kafka["consumer_group"].as<std::string>());
        if (kafka["assign_all_partitions"]) config_.kafka.assign_all_partitions.set(kafka["assign_all_partitions"].as<bool>());
        if (kafka["max_poll_records"]) config_.kafka.max_poll_records.set(kafka["max_poll_records"].as<int>());
    }

    // RabbitMQ
    if (root["rabbitmq"]) {
        auto rabbitmq = root["rabbitmq"];
        if (rabbitmq["host"]) config_.rabbitmq.host.set(rabbitmq["host"].as<std::string>());
        if (rabbitmq["port"]) config_.rabbitmq.port.set(rabbitmq["port"].as<int>());
        if (rabbitmq["username"]) config_.rabbitmq.username.set(rabbitmq["username"].as<std::string>());
        if (rabbitmq["password"]) config_.rabbitmq.password.set(rabbitmq["password"].as<std::string>());
        if (rabbitmq["vhost"]) config_.rabbitmq.vhost.set(rabbitmq["vhost"].as<std::string>());
        if (rabbitmq["heartbeat_sec"]) config_.rabbitmq.heartbeat_sec.set(rabbitmq["heartbeat_sec"].as<int>());
        if (rabbitmq["blocked_timeout_sec"]) config_.rabbitmq.blocked_timeout_sec.set(rabbitmq["blocked_timeout_sec"].as<int>());
        if (rabbitmq["prefetch"]) config_.rabbitmq.prefetch.set(rabbitmq["prefetch"].as<int>());
    }

    // Replication. Route tables may be written inline as YAML; they are
    // re-emitted in JSON style so the mapping parser sees one format.
    if (root["replication"]) {
        auto replication = root["replication"];
        if (replication["direction"]) config_.replication.direction.set(replication["direction"].as<std::string>());
        if (replication["mappings"]) {
            auto mappings = replication["mappings"];
            config_.replication.mappings.set(
                mappings.IsScalar() ? mappings.as<std::string>() : EmitJsonStyle(mappings));
        }
        if (replication["topic_mapping"]) {
            auto topic_mapping = replication["topic_mapping"];
            config_.replication.topic_mapping.set(
                topic_mapping.IsScalar() ? topic_mapping.as<std::string>() : EmitJsonStyle(topic_mapping));
        }
        if (replication["heartbeat_interval_sec"]) config_.replication.heartbeat_interval_sec.set(replication["heartbeat_interval_sec"].as<int>());
        if (replication["max_empty_polls"]) config_.replication.max_empty_polls.set(replication["max_empty_polls"].as<int>());
        if (replication["delivery_failure_policy"]) config_.replication.delivery_failure_policy.set(replication["delivery_failure_policy"].as<std::string>());
    }

    // Health
    if (root["health"]) {
        auto health = root["health"];
        if (health["enabled"]) config_.health.enabled.set(health["enabled"].as<bool>());
        if (health["port"]) config_.health.port.set(health["port"].as<int>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const std::string direction = getDirection();
    if (!IsKnownDirection(direction)) {
        validation_errors_.push_back("Direction must be one of K2R, R2K, S2T, T2S (got '" + direction + "')");
    }

    // Servers for the selected direction
    if (direction == "K2R" || direction == "R2K") {
        if (IsBlank(config_.kafka.bootstrap_servers.get())) {
            validation_errors_.push_back("KAFKA_BOOTSTRAP_SERVERS must not be empty");
        }
        if (IsBlank(config_.rabbitmq.host.get())) {
            validation_errors_.push_back("RABBITMQ_HOST must not be empty");
        }
        int port = config_.rabbitmq.port.get();
        if (port < 1 || port > 65535) {
            validation_errors_.push_back("RabbitMQ port must be between 1 and 65535");
        }
        if (config_.rabbitmq.prefetch.get() < 0 || config_.rabbitmq.prefetch.get() > 65535) {
            validation_errors_.push_back("RabbitMQ prefetch must be between 0 and 65535");
        }
        if (config_.rabbitmq.heartbeat_sec.get() < 0) {
            validation_errors_.push_back("RabbitMQ heartbeat cannot be negative");
        }
    } else if (direction == "S2T" || direction == "T2S") {
        if (IsBlank(config_.kafka.source_bootstrap_servers.get()) ||
            IsBlank(config_.kafka.target_bootstrap_servers.get())) {
            validation_errors_.push_back("SOURCE_BOOTSTRAP_SERVERS and TARGET_BOOTSTRAP_SERVERS are required");
        }
    }

    if (config_.kafka.max_poll_records.get() < 1) {
        validation_errors_.push_back("Max poll records must be at least 1");
    }

    // Supervisor settings
    if (config_.replication.heartbeat_interval_sec.get() < 1) {
        validation_errors_.push_back("Heartbeat interval must be at least 1 second");
    }
    if (config_.replication.max_empty_polls.get() < 1) {
        validation_errors_.push_back("Max empty polls must be at least 1");
    }
    const std::string policy = config_.replication.delivery_failure_policy.get();
    if (policy != "leave" && policy != "requeue" && policy != "discard") {
        validation_errors_.push_back("Delivery failure policy must be leave, requeue or discard");
    }

    if (config_.health.enabled.get()) {
        int port = getHealthPort();
        if (port < 1 || port > 65535) {
            validation_errors_.push_back("Health port must be between 1 and 65535");
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace MqBridge
