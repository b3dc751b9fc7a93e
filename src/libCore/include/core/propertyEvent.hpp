#pragma once

#include "core/sgfTree.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fuseki {

struct BoardSizeEvent {
	std::size_t size;
};
//! Single move. No coordinate for a pass.
struct MoveEvent {
	Player player;
	std::optional<Coord> c;
};
//! Setup stones (AB, AW). Not treated as moves.
struct AddStonesEvent {
	Player player;
	std::vector<Coord> stones;
};
//! Any property without meaning for the board state.
struct OtherEvent {
	std::string identifier;
};

using PropertyEvent = std::variant<BoardSizeEvent, MoveEvent, AddStonesEvent, OtherEvent>;

//! Largest board size SGF coordinates can express.
inline constexpr std::size_t MAX_BOARD_SIZE = 52u;

//! Map a raw property to its board event.
//! \param boardSize Currently declared board size. Needed to tell "tt" passes from moves.
//! \note Throws SgfError (Malformed) for invalid size or point values.
PropertyEvent toPropertyEvent(const SgfProperty& property, std::size_t boardSize);

} // namespace fuseki
