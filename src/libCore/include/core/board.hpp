#pragma once

#include "core/types.hpp"

#include <cassert>
#include <cstddef>
#include <vector>

namespace fuseki {

//! Go board of arbitrary size. Stored row-major in a single buffer.
class Board {
public:
	enum class Stone { Empty, Black, White };

	Board(std::size_t size);

	bool place(Coord c, Stone value); //!< Try to place a stone at the given coordinate. False if not free.
	void set(Coord c, Stone value);   //!< Overwrite the given coordinate, occupied or not.
	bool remove(Coord c);             //!< Remove the stone at the given coordinate. False if already free.

	Stone get(Coord c) const;      //!< Get the stone at the given position.
	bool isEmpty(Coord c) const;   //!< True if the given coordinate is empty.
	bool contains(Coord c) const;  //!< True if the coordinate lies on the board.
	std::size_t size() const;      //!< Size of the board.

private:
	std::size_t m_size{0u};       //!< Board size (typically 9, 13, 19)
	std::vector<Stone> m_board{}; //!< Board data.
};

//! Maps a player color to a stone color.
inline constexpr Board::Stone toStone(const Player player) {
	return player == Player::White ? Board::Stone::White : Board::Stone::Black;
}

} // namespace fuseki
