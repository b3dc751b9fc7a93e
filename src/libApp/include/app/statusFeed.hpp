#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace fuseki::app {

//! Game waiting for a move, as listed by the Dragon Go Server quick status (version 2).
struct RemoteGame {
	std::string gameId;
	std::string opponentHandle;
	Player playerColor;
	std::chrono::sys_seconds lastMoveDate;
	std::optional<std::chrono::hours> timeRemaining; //!< Only set for Fischer time.
	unsigned gameAction;
	std::string gameStatus;
	unsigned moveId;
	unsigned tournamentId;
	unsigned shapeId;
	std::string gameType;
	int gamePriority;
	std::chrono::sys_seconds opponentLastAccess;
	unsigned handicap;
};

//! Split one status line into fields. Fields in single quotes may contain commas; quotes are removed.
std::vector<std::string> splitStatusLine(const std::string& line);

//! Parse "YYYY-MM-DD hh:mm:ss" (UTC).
std::optional<std::chrono::sys_seconds> parseServerDate(const std::string& text);

//! Parse a Fischer time remaining value like "F: 5d 3h (+ 1d)". Empty for other time systems.
std::optional<std::chrono::hours> parseTimeRemaining(const std::string& text);

//! Parse a game line ("G, ..."). Empty if the line is no game or malformed.
std::optional<RemoteGame> parseGameLine(const std::string& line);

//! Parse the whole status text. Lines of other record kinds are ignored, malformed game lines skipped.
std::vector<RemoteGame> parseStatusFeed(const std::string& text);

} // namespace fuseki::app
