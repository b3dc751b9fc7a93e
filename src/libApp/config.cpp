#include "app/config.hpp"

#include "Logging.hpp"

#include <cstdlib>
#include <format>
#include <optional>
#include <sstream>

namespace fuseki::app {

static std::optional<std::string> readEnv(const char* name) {
	const char* value = std::getenv(name);
	if (value == nullptr || *value == '\0') {
		return {};
	}
	return std::string{value};
}

static std::vector<std::string> splitArgs(const std::string& value) {
	std::vector<std::string> args;
	std::istringstream stream(value);
	std::string arg;
	while (stream >> arg) {
		args.push_back(arg);
	}
	return args;
}

Config loadConfig() {
	Config config;

	if (auto value = readEnv("FUSEKI_ENGINE")) {
		config.engineBinary = *value;
	}
	if (auto value = readEnv("FUSEKI_ENGINE_ARGS")) {
		config.engineArgs = splitArgs(*value);
	}
	if (auto value = readEnv("FUSEKI_LOGIN_FILE")) {
		config.loginFile = *value;
	}
	if (auto value = readEnv("FUSEKI_SERVER_URL")) {
		config.serverUrl = *value;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Config] Engine '{}', server '{}'.", config.engineBinary, config.serverUrl));
	return config;
}

} // namespace fuseki::app
