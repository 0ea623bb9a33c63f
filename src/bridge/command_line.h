#ifndef MQBRIDGE_SRC_BRIDGE_COMMAND_LINE_H_
#define MQBRIDGE_SRC_BRIDGE_COMMAND_LINE_H_

#include <optional>
#include <string>

namespace MqBridge {

struct CommandLine {
	bool help = false;
	std::string usage;
	std::optional<std::string> direction;
	std::string config_path;
	std::optional<int> health_port;
	int log_level = 1;
};

/**
 * Parses the process arguments. Returns nullopt (after logging an ERROR)
 * on an unknown option or a malformed value.
 */
std::optional<CommandLine> ParseCommandLine(int argc, const char* const argv[]);

} // namespace MqBridge

#endif // MQBRIDGE_SRC_BRIDGE_COMMAND_LINE_H_
