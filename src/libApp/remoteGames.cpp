#include "app/remoteGames.hpp"

#include "Logging.hpp"

#include <format>

namespace fuseki::app {

RemoteGames::RemoteGames(IGameStore& store) : m_store(store) {
}

bool RemoteGames::refresh() {
	const auto status = m_store.fetchStatus();
	if (!status) {
		Logger().Log(Logging::LogLevel::Warning, "[RemoteGames] Could not fetch status. Keeping previous game list.");
		return false;
	}

	m_games = parseStatusFeed(*status);
	return true;
}

const std::vector<RemoteGame>& RemoteGames::games() const {
	return m_games;
}

std::optional<GameData> RemoteGames::load(const std::string& gameId) {
	const auto record = m_store.fetchGameRecord(gameId);
	if (!record) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[RemoteGames] Could not fetch record of game '{}'.", gameId));
		return {};
	}

	return loadGameData(*record);
}

} // namespace fuseki::app
