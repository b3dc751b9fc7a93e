#pragma once

#include <optional>
#include <string>

namespace fuseki::app {

//! Source of remote game data. Transport and login are up to the implementation.
class IGameStore {
public:
	virtual ~IGameStore() = default;

	//! Raw quick status text of the logged in user. Empty on failure.
	virtual std::optional<std::string> fetchStatus() = 0;

	//! Raw SGF record of the given game. Empty on failure.
	virtual std::optional<std::string> fetchGameRecord(const std::string& gameId) = 0;
};

} // namespace fuseki::app
