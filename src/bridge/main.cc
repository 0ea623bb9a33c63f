#include <signal.h>

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>

#include <glog/logging.h>

#include "bridge/adapter_factory.h"
#include "bridge/command_line.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "common/stats.h"
#include "health/health_server.h"
#include "replication/direction.h"
#include "replication/supervisor.h"

namespace {

std::atomic<bool> g_stop{false};

void HandleTermination(int) {
	g_stop.store(true);
}

void InstallTerminationHandlers() {
	struct sigaction action;
	memset(&action, 0, sizeof(action));
	action.sa_handler = HandleTermination;
	sigemptyset(&action.sa_mask);
	sigaction(SIGINT, &action, nullptr);
	sigaction(SIGTERM, &action, nullptr);
}

} // namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	auto command_line = MqBridge::ParseCommandLine(argc, argv);
	if (!command_line) {
		return EXIT_FAILURE;
	}
	if (command_line->help) {
		std::cout << command_line->usage << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = command_line->log_level;
	FLAGS_logtostderr = 1;

	MqBridge::Configuration& configuration = MqBridge::Configuration::getInstance();
	if (!command_line->config_path.empty() && !configuration.loadFromFile(command_line->config_path)) {
		LOG(ERROR) << "Failed to load configuration from " << command_line->config_path;
		return EXIT_FAILURE;
	}
	if (command_line->direction) {
		configuration.overrideDirection(*command_line->direction);
	}
	if (command_line->health_port) {
		configuration.overrideHealthPort(*command_line->health_port);
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}

	const MqBridge::MqBridgeConfig& config = configuration.config();
	auto direction = MqBridge::ParseDirection(configuration.getDirection());
	if (!direction) {
		LOG(ERROR) << "Unknown direction '" << configuration.getDirection()
			<< "'. Valid: K2R, R2K, S2T, T2S";
		return EXIT_FAILURE;
	}

	std::unique_ptr<MqBridge::MappingTable> mappings;
	MqBridge::SupervisorOptions supervisor_options;
	MqBridge::AdapterPair adapters;
	try {
		mappings = std::make_unique<MqBridge::MappingTable>(MqBridge::BuildMappingTable(*direction, config));
		supervisor_options = MqBridge::BuildSupervisorOptions(*direction, config);
		adapters = MqBridge::CreateAdapters(*direction, config, *mappings, &g_stop);
	} catch (const MqBridge::ConfigurationError& e) {
		LOG(ERROR) << "Configuration error: " << e.what();
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Starting replicator in " << MqBridge::DirectionTag(*direction) << " mode with "
		<< mappings->size() << " mapping(s)";

	InstallTerminationHandlers();

	MqBridge::Stats stats;
	std::unique_ptr<MqBridge::HealthServer> health;
	if (config.health.enabled.get()) {
		health = std::make_unique<MqBridge::HealthServer>(MqBridge::DirectionTag(*direction), stats,
				configuration.getHealthPort());
		if (!health->Start()) {
			health.reset();
		}
	}

	MqBridge::Supervisor supervisor(supervisor_options, *mappings, std::move(adapters.source),
			std::move(adapters.sink), stats, g_stop);
	int exit_code = supervisor.Run();

	if (health) {
		health->Stop();
	}
	LOG(INFO) << "Replicator exited with code " << exit_code;
	return exit_code == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
