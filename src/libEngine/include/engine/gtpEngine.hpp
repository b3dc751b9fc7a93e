#pragma once

#include "engine/IEngineChannel.hpp"
#include "engine/gtpProtocol.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fuseki::engine {

//! Engine connection lost or the engine answered with something that is not GTP.
class EngineError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Synchronous GTP client. Each call sends one command and blocks for its response.
class GtpEngine {
public:
	//! \note The channel must outlive the engine.
	GtpEngine(IEngineChannel& channel);

	bool setBoardSize(unsigned size);
	bool clearBoard();
	bool play(Player player, Coord c);            //!< False if the engine rejected the move.
	std::optional<Coord> genmove(Player player);  //!< Engine move for player. Empty on pass or resign.
	std::vector<Coord> listStones(Player player); //!< Stones of player currently on the engine board.
	std::size_t captures(Player player);          //!< Number of stones captured by player so far.
	bool undo();                                  //!< Take back the last move. False if there is nothing to undo.

private:
	//! Send the command and wait for the response.
	//! \note Throws EngineError if the channel closed or the answer is not a GTP response.
	GtpResponse execute(const GtpCommand& command);

private:
	IEngineChannel& m_channel;
};

} // namespace fuseki::engine
