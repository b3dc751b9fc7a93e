#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fuseki {

//! Convert sgf code to core game coordinate.
//! \note Throws SgfError if the value is not a two letter point.
Coord fromSGF(const std::string& s);

//! Convert core game coordinate to sgf code.
std::string toSGF(Coord c);

//! True if the move value denotes a pass ("" or "tt" on boards up to 19x19).
bool isPassSGF(const std::string& s, std::size_t boardSize);

//! Expand a point or a compressed point rectangle ("aa:cc") into all covered coordinates.
std::vector<Coord> expandPointList(const std::string& s);

} // namespace fuseki
