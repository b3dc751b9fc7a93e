#pragma once

#include "core/board.hpp"
#include "core/propertyEvent.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace fuseki {

//! Final stone layout of a game record.
//! \note Coordinates are 1-based. Each list is sorted by x * size + y.
struct GameData {
	std::size_t size{0u};
	std::vector<Coord> whiteStones;
	std::vector<Coord> blackStones;

	bool operator==(const GameData&) const = default;
};

std::ostream& operator<<(std::ostream& os, const GameData& data);

//! Replays property events onto a board and keeps the stone list of each color in sync with it.
class BoardProjector {
public:
	//! Apply a single event. Moves trigger dead stone removal for the mover first, then the opponent.
	//! \note Throws SgfError (MissingBoardSize, OutOfRange) for stones that cannot be placed.
	void apply(const PropertyEvent& event);

	std::size_t size() const;
	const Board& board() const;
	const std::vector<Coord>& stones(Player player) const; //!< Alive stones in placement order. 0-based.

private:
	void handleEvent(const BoardSizeEvent& event);
	void handleEvent(const MoveEvent& event);
	void handleEvent(const AddStonesEvent& event);
	void handleEvent(const OtherEvent& event);

	void putStone(Player player, Coord c); //!< Place on board and list. Replaces a stone of the other color.
	void checkPlacement(Coord c) const;    //!< Throws if the coordinate cannot be used.
	std::vector<Coord>& stoneList(Player player);

private:
	std::optional<Board> m_board; //!< Unset until the board size is declared.
	std::vector<Coord> m_whiteStones;
	std::vector<Coord> m_blackStones;
};

//! Sort by x * size + y and shift to 1-based coordinates.
std::vector<Coord> normalizeStones(std::vector<Coord> stones, std::size_t size);

//! Package the current projector state as normalized game data.
GameData toGameData(const BoardProjector& projector);

//! Parse an SGF record and compute the surviving stones after the last move.
//! \note Throws SgfError. No partial data is returned.
GameData loadGameData(const std::string& sgf);

} // namespace fuseki
