#include "core/deadStones.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace fuseki {

static constexpr std::array<int, 4> kDx{1, -1, 0, 0};
static constexpr std::array<int, 4> kDy{0, 0, 1, -1};

//! True if a neighbour of c is empty or a stone already marked safe.
static bool touchesSafety(const Board& board, const Coord c, const std::vector<std::vector<bool>>& safe) {
	const auto boardSize = board.size();

	for (std::size_t i = 0; i < kDx.size(); ++i) {
		const int nx = static_cast<int>(c.x) + kDx[i];
		const int ny = static_cast<int>(c.y) + kDy[i];
		if (nx < 0 || ny < 0 || nx >= static_cast<int>(boardSize) || ny >= static_cast<int>(boardSize))
			continue;

		const Coord neighbor{static_cast<Id>(nx), static_cast<Id>(ny)};
		if (board.isEmpty(neighbor) || safe[neighbor.x][neighbor.y]) {
			return true;
		}
	}
	return false;
}

std::vector<Coord> findDeadStones(const Board& board, const std::vector<Coord>& stones) {
	const auto boardSize = board.size();
	std::vector<std::vector<bool>> safe(boardSize, std::vector<bool>(boardSize, false));

	bool newSafeStone = true;
	while (newSafeStone) {
		newSafeStone = false;
		for (const auto stone: stones) {
			if (safe[stone.x][stone.y])
				continue;

			if (touchesSafety(board, stone, safe)) {
				safe[stone.x][stone.y] = true;
				newSafeStone           = true;
			}
		}
	}

	std::vector<Coord> dead;
	std::copy_if(stones.begin(), stones.end(), std::back_inserter(dead), [&](const Coord c) { return !safe[c.x][c.y]; });
	return dead;
}

std::vector<Coord> removeDeadStones(Board& board, std::vector<Coord>& stones) {
	auto dead = findDeadStones(board, stones);
	if (dead.empty()) {
		return dead;
	}

	for (const auto stone: dead) {
		board.remove(stone);
	}
	std::erase_if(stones, [&](const Coord c) { return std::find(dead.begin(), dead.end(), c) != dead.end(); });
	return dead;
}

} // namespace fuseki
