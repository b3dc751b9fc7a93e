#include "app/atariGame.hpp"

#include "Logging.hpp"

#include <format>

namespace fuseki::app {

AtariGame::AtariGame(engine::GtpEngine& engine) : m_engine(engine) {
}

bool AtariGame::start() {
	if (!m_engine.setBoardSize(BOARD_SIZE) || !m_engine.clearBoard()) {
		Logger().Log(Logging::LogLevel::Error, "[AtariGame] Engine could not prepare the board.");
		return false;
	}

	m_currentPlayer = Player::Black;
	m_winner.reset();
	Logger().Log(Logging::LogLevel::Info, "[AtariGame] New game started.");
	return true;
}

MoveResult AtariGame::play(const Coord c) {
	if (!isActive()) {
		return MoveResult::Rejected;
	}
	if (c.x >= BOARD_SIZE || c.y >= BOARD_SIZE) {
		Logger().Log(Logging::LogLevel::Info, std::format("[AtariGame] Point ({}, {}) is off the board.", c.x, c.y));
		return MoveResult::Rejected;
	}
	if (!m_engine.play(m_currentPlayer, c)) {
		return MoveResult::Rejected;
	}

	if (m_engine.captures(m_currentPlayer) > 0u) {
		m_winner = m_currentPlayer;
		Logger().Log(Logging::LogLevel::Info, std::format("[AtariGame] {} wins.", colorName(m_currentPlayer)));
		return MoveResult::Win;
	}

	m_currentPlayer = opponent(m_currentPlayer);
	return MoveResult::Accepted;
}

bool AtariGame::undo() {
	if (!m_engine.undo()) {
		return false;
	}

	// The winning move was taken back. The winner is to move again.
	if (m_winner) {
		m_winner.reset();
	} else {
		m_currentPlayer = opponent(m_currentPlayer);
	}
	return true;
}

StoneLists AtariGame::stones() {
	return {m_engine.listStones(Player::White), m_engine.listStones(Player::Black)};
}

Player AtariGame::currentPlayer() const {
	return m_currentPlayer;
}

std::optional<Player> AtariGame::winner() const {
	return m_winner;
}

bool AtariGame::isActive() const {
	return !m_winner.has_value();
}

} // namespace fuseki::app
