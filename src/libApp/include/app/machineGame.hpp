#pragma once

#include "app/types.hpp"
#include "engine/gtpEngine.hpp"

#include <optional>

namespace fuseki::app {

//! Human (white) against the engine (black).
class MachineGame {
public:
	static constexpr unsigned BOARD_SIZE  = 9u;
	static constexpr Player HUMAN_PLAYER  = Player::White;
	static constexpr Player ENGINE_PLAYER = Player::Black;

	//! Answer of the engine to a human move.
	struct Reply {
		MoveResult result;
		std::optional<Coord> engineMove; //!< Empty if rejected or the engine passed.
	};

	MachineGame(engine::GtpEngine& engine);

	//! Prepare the engine board and let the engine open.
	//! \returns The opening move of the engine. Empty if it passed or the board could not be prepared.
	std::optional<Coord> start();

	Reply play(Coord c); //!< Play the human move and wait for the engine answer.

	StoneLists stones();
	bool isHumanTurn() const;

private:
	std::optional<Coord> engineMove();

private:
	engine::GtpEngine& m_engine;
	bool m_humanTurn{false};
};

} // namespace fuseki::app
