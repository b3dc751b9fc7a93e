#pragma once

#include "core/types.hpp"

#include <vector>

namespace fuseki::app {

//! Outcome of a move attempted by the local player.
enum class MoveResult {
	Accepted, //!< Move played, game continues.
	Rejected, //!< Not played. Off board, illegal or not this player's turn.
	Win,      //!< Move played and ended the game.
};

//! Stones on the engine board. 0-based coordinates.
struct StoneLists {
	std::vector<Coord> white;
	std::vector<Coord> black;
};

} // namespace fuseki::app
