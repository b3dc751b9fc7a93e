#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fuseki::app {

//! Application settings. Each value can be overridden by an environment variable.
//! \note Game sessions always use 9x9 (AtariGame::BOARD_SIZE, MachineGame::BOARD_SIZE). Remote records carry their own size.
struct Config {
	std::string engineBinary{"/home/root/gnugo"};                          //!< FUSEKI_ENGINE
	std::vector<std::string> engineArgs{"--mode", "gtp", "--level", "8"};  //!< FUSEKI_ENGINE_ARGS (space separated)
	std::filesystem::path loginFile{"/tmp/dragon-go-server-login"};        //!< FUSEKI_LOGIN_FILE
	std::string serverUrl{"https://www.dragongoserver.net"};               //!< FUSEKI_SERVER_URL
};

//! Defaults overridden by the non-empty environment variables.
Config loadConfig();

} // namespace fuseki::app
