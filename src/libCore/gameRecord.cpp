#include "core/gameRecord.hpp"

#include "Logging.hpp"
#include "core/deadStones.hpp"
#include "core/sgfError.hpp"
#include "core/sgfHandler.hpp"
#include "core/sgfTree.hpp"

#include <algorithm>
#include <cassert>
#include <format>
#include <initializer_list>
#include <ostream>

namespace fuseki {

void BoardProjector::apply(const PropertyEvent& event) {
	std::visit([&](const auto& ev) { handleEvent(ev); }, event);
}

std::size_t BoardProjector::size() const {
	return m_board ? m_board->size() : 0u;
}

const Board& BoardProjector::board() const {
	assert(m_board);
	return *m_board;
}

const std::vector<Coord>& BoardProjector::stones(const Player player) const {
	return player == Player::White ? m_whiteStones : m_blackStones;
}

std::vector<Coord>& BoardProjector::stoneList(const Player player) {
	return player == Player::White ? m_whiteStones : m_blackStones;
}

void BoardProjector::handleEvent(const BoardSizeEvent& event) {
	m_board.emplace(event.size);
	m_whiteStones.clear();
	m_blackStones.clear();
}

void BoardProjector::handleEvent(const MoveEvent& event) {
	if (!event.c) {
		return; // Pass
	}

	checkPlacement(*event.c);
	putStone(event.player, *event.c);

	// Mover first. A move without liberties removes its own group before the opponent is checked.
	for (const auto player: {event.player, opponent(event.player)}) {
		const auto removed = removeDeadStones(*m_board, stoneList(player));
		if (!removed.empty()) {
			core::Logger().Log(Logging::LogLevel::Debug, std::format("[GameRecord] Move {} removed {} {} stone(s).", toSGF(*event.c), removed.size(), colorName(player)));
		}
	}
}

void BoardProjector::handleEvent(const AddStonesEvent& event) {
	for (const auto c: event.stones) {
		checkPlacement(c);
		putStone(event.player, c);
	}
}

void BoardProjector::handleEvent(const OtherEvent& event) {
	core::Logger().Log(Logging::LogLevel::Debug, std::format("[GameRecord] Ignoring property '{}'.", event.identifier));
}

void BoardProjector::putStone(const Player player, const Coord c) {
	const auto current = m_board->get(c);
	if (current == toStone(player)) {
		return;
	}
	if (current != Board::Stone::Empty) {
		std::erase(stoneList(opponent(player)), c);
	}

	m_board->set(c, toStone(player));
	stoneList(player).push_back(c);
}

void BoardProjector::checkPlacement(const Coord c) const {
	if (!m_board) {
		throw SgfError(SgfError::Kind::MissingBoardSize, std::format("Stone at '{}' placed before the board size was declared.", toSGF(c)));
	}
	if (!m_board->contains(c)) {
		throw SgfError(SgfError::Kind::OutOfRange, std::format("Coordinate ({}, {}) outside of {}x{} board.", c.x, c.y, m_board->size(), m_board->size()));
	}
}

std::vector<Coord> normalizeStones(std::vector<Coord> stones, const std::size_t size) {
	std::stable_sort(stones.begin(), stones.end(), [size](const Coord a, const Coord b) { return a.x * size + a.y < b.x * size + b.y; });
	for (auto& stone: stones) {
		++stone.x;
		++stone.y;
	}
	return stones;
}

GameData toGameData(const BoardProjector& projector) {
	const auto size = projector.size();
	return GameData{
	        .size        = size,
	        .whiteStones = normalizeStones(projector.stones(Player::White), size),
	        .blackStones = normalizeStones(projector.stones(Player::Black), size),
	};
}

GameData loadGameData(const std::string& sgf) {
	try {
		const auto properties = flattenProperties(parseSgf(sgf));

		BoardProjector projector;
		for (const auto& property: properties) {
			projector.apply(toPropertyEvent(property, projector.size()));
		}
		if (projector.size() == 0u) {
			throw SgfError(SgfError::Kind::MissingBoardSize, "Record does not declare a board size.");
		}

		auto data = toGameData(projector);
		core::Logger().Log(Logging::LogLevel::Info, std::format("[GameRecord] Loaded {}x{} record: {} white, {} black stones.", data.size, data.size,
		                                                        data.whiteStones.size(), data.blackStones.size()));
		return data;
	} catch (const SgfError& e) {
		core::Logger().Log(Logging::LogLevel::Warning, std::format("[GameRecord] Rejected record: {}", e.what()));
		throw;
	}
}

std::ostream& operator<<(std::ostream& os, const GameData& data) {
	auto printStones = [&](const std::vector<Coord>& stones) {
		for (std::size_t i = 0; i < stones.size(); ++i) {
			os << (i ? " " : "") << '(' << stones[i].x << ',' << stones[i].y << ')';
		}
	};

	os << "size " << data.size << "\nwhite: ";
	printStones(data.whiteStones);
	os << "\nblack: ";
	printStones(data.blackStones);
	return os;
}

} // namespace fuseki
