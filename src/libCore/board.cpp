#include "core/board.hpp"

namespace fuseki {

Board::Board(std::size_t size) : m_size(size), m_board(size * size, Stone::Empty) {
}

std::size_t Board::size() const {
	return m_size;
}

bool Board::place(Coord c, Stone value) {
	assert(contains(c));           // Caller should verify valid coordinate.
	assert(value != Stone::Empty); // Use remove

	if (isEmpty(c)) {
		m_board[c.y * m_size + c.x] = value;
		return true;
	}
	return false;
}

void Board::set(Coord c, Stone value) {
	assert(contains(c));
	m_board[c.y * m_size + c.x] = value;
}

bool Board::remove(Coord c) {
	assert(contains(c));

	if (!isEmpty(c)) {
		m_board[c.y * m_size + c.x] = Stone::Empty;
		return true;
	}
	return false;
}

Board::Stone Board::get(Coord c) const {
	assert(contains(c));
	return m_board[c.y * m_size + c.x];
}

bool Board::isEmpty(Coord c) const {
	return get(c) == Stone::Empty;
}

bool Board::contains(Coord c) const {
	return c.x < m_size && c.y < m_size;
}

} // namespace fuseki
