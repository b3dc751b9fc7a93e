#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <vector>

namespace fuseki {

//! Returns the stones of the list that have no path to a liberty through stones of the same list.
//! \note Fixpoint iteration over the whole list. A stone is safe once an orthogonal neighbour is empty or already safe.
//! Result keeps the order of the input list.
std::vector<Coord> findDeadStones(const Board& board, const std::vector<Coord>& stones);

//! Remove all dead stones of the list from the list and from the board.
//! \returns Removed coordinates in their previous list order.
std::vector<Coord> removeDeadStones(Board& board, std::vector<Coord>& stones);

} // namespace fuseki
