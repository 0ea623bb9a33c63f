#include "command_line.h"

#include <exception>

#include <cxxopts.hpp>
#include <glog/logging.h>

namespace MqBridge {

std::optional<CommandLine> ParseCommandLine(int argc, const char* const argv[]) {
	cxxopts::Options options("mqbridge", "Kafka and RabbitMQ replication bridge");
	options.add_options()
		("direction", "Replication direction (K2R, R2K, S2T, T2S)", cxxopts::value<std::string>())
		("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value(""))
		("health_port", "Health endpoint port override", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");
	options.parse_positional({"direction"});
	options.positional_help("[DIRECTION]");

	CommandLine command_line;
	// cxxopts 2.x and 3.x name their exception base differently; both derive from std::exception.
	try {
		auto arguments = options.parse(argc, argv);
		if (arguments.count("help")) {
			command_line.help = true;
			command_line.usage = options.help();
			return command_line;
		}
		if (arguments.count("direction")) {
			command_line.direction = arguments["direction"].as<std::string>();
		}
		command_line.config_path = arguments["config"].as<std::string>();
		if (arguments.count("health_port")) {
			command_line.health_port = arguments["health_port"].as<int>();
		}
		command_line.log_level = arguments["log_level"].as<int>();
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid command line: " << e.what();
		return std::nullopt;
	}
	return command_line;
}

} // namespace MqBridge
