#pragma once

#include <string_view>

namespace fuseki {

using Id = unsigned; //!< Board ID used by the core library.

//! Coordinate pair for the board.
//! \note x is the column, y the row. Origin at the top left, starting at 0 (SGF convention).
struct Coord {
	Id x, y;

	bool operator==(const Coord&) const = default;
};

enum class Player { Black = 1, White = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::White ? Player::Black : Player::White;
}

//! Lower case colour name. Used in log messages and as GTP colour argument.
inline constexpr std::string_view colorName(Player player) {
	return player == Player::White ? "white" : "black";
}

} // namespace fuseki
