#pragma once

#include "app/IGameStore.hpp"
#include "app/statusFeed.hpp"
#include "core/gameRecord.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fuseki::app {

//! Games of the remote server that wait for a move of the local player.
class RemoteGames {
public:
	//! \note The store must outlive this object.
	RemoteGames(IGameStore& store);

	//! Reload the list of games. Keeps the previous list if the status could not be fetched.
	bool refresh();

	const std::vector<RemoteGame>& games() const;

	//! Fetch and interpret the record of a game.
	//! \returns Empty if the record could not be fetched. Throws SgfError for invalid records.
	std::optional<GameData> load(const std::string& gameId);

private:
	IGameStore& m_store;
	std::vector<RemoteGame> m_games;
};

} // namespace fuseki::app
