#include "app/machineGame.hpp"

#include "Logging.hpp"

#include <chrono>
#include <format>

namespace fuseki::app {

MachineGame::MachineGame(engine::GtpEngine& engine) : m_engine(engine) {
}

std::optional<Coord> MachineGame::start() {
	m_humanTurn = false;
	if (!m_engine.setBoardSize(BOARD_SIZE) || !m_engine.clearBoard()) {
		Logger().Log(Logging::LogLevel::Error, "[MachineGame] Engine could not prepare the board.");
		return {};
	}
	return engineMove();
}

MachineGame::Reply MachineGame::play(const Coord c) {
	if (!m_humanTurn) {
		Logger().Log(Logging::LogLevel::Info, "[MachineGame] Ignoring move, engine to play.");
		return {MoveResult::Rejected, std::nullopt};
	}
	if (c.x >= BOARD_SIZE || c.y >= BOARD_SIZE || !m_engine.play(HUMAN_PLAYER, c)) {
		return {MoveResult::Rejected, std::nullopt};
	}

	m_humanTurn = false;
	return {MoveResult::Accepted, engineMove()};
}

std::optional<Coord> MachineGame::engineMove() {
	const auto start = std::chrono::steady_clock::now();
	const auto move  = m_engine.genmove(ENGINE_PLAYER);
	m_humanTurn      = true;

	const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	Logger().Log(Logging::LogLevel::Info, std::format("[MachineGame] Engine {} after {}ms.", move ? engine::toVertex(*move) : "passed", elapsed.count()));
	return move;
}

StoneLists MachineGame::stones() {
	return {m_engine.listStones(Player::White), m_engine.listStones(Player::Black)};
}

bool MachineGame::isHumanTurn() const {
	return m_humanTurn;
}

} // namespace fuseki::app
