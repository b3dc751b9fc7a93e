#pragma once

#include "app/types.hpp"
#include "engine/gtpEngine.hpp"

#include <optional>

namespace fuseki::app {

//! Atari Go: two local players, the first capture wins. Rules are checked by the engine.
class AtariGame {
public:
	static constexpr unsigned BOARD_SIZE = 9u;

	AtariGame(engine::GtpEngine& engine);

	bool start();             //!< Prepare the engine board and reset the session. Black starts.
	MoveResult play(Coord c); //!< Play for the current player.
	bool undo();              //!< Take back the last move. Resumes a finished game.

	StoneLists stones(); //!< Current stones as reported by the engine.

	Player currentPlayer() const;
	std::optional<Player> winner() const;
	bool isActive() const;

private:
	engine::GtpEngine& m_engine;
	Player m_currentPlayer{Player::Black};
	std::optional<Player> m_winner;
};

} // namespace fuseki::app
