#include "core/propertyEvent.hpp"

#include "core/sgfError.hpp"
#include "core/sgfHandler.hpp"

#include <charconv>
#include <format>
#include <string_view>

namespace fuseki {

static constexpr std::string_view PROP_SIZE      = "SZ";
static constexpr std::string_view PROP_BLACK     = "B";
static constexpr std::string_view PROP_WHITE     = "W";
static constexpr std::string_view PROP_ADD_BLACK = "AB";
static constexpr std::string_view PROP_ADD_WHITE = "AW";

static bool parseUnsigned(std::string_view value, std::size_t& out) {
	if (value.empty()) {
		return false;
	}
	const auto* end      = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, out);
	return ec == std::errc() && ptr == end;
}

//! Accepts "N" and the rectangular form "N:N" as long as the board is square.
static BoardSizeEvent toSizeEvent(const SgfProperty& property) {
	const std::string_view value = property.values.front();

	std::size_t columns = 0u;
	std::size_t rows    = 0u;
	bool valid          = false;
	if (const auto colon = value.find(':'); colon != std::string_view::npos) {
		valid = parseUnsigned(value.substr(0u, colon), columns) && parseUnsigned(value.substr(colon + 1u), rows) && columns == rows;
	} else {
		valid = parseUnsigned(value, columns);
	}

	if (!valid || columns == 0u || columns > MAX_BOARD_SIZE) {
		throw SgfError(SgfError::Kind::Malformed, std::format("Invalid board size '{}'.", value));
	}
	return {columns};
}

static MoveEvent toMoveEvent(const SgfProperty& property, const Player player, const std::size_t boardSize) {
	const auto& value = property.values.front();
	if (isPassSGF(value, boardSize)) {
		return {player, std::nullopt};
	}
	return {player, fromSGF(value)};
}

static AddStonesEvent toAddStonesEvent(const SgfProperty& property, const Player player) {
	AddStonesEvent event{player, {}};
	for (const auto& value: property.values) {
		const auto points = expandPointList(value);
		event.stones.insert(event.stones.end(), points.begin(), points.end());
	}
	return event;
}

PropertyEvent toPropertyEvent(const SgfProperty& property, const std::size_t boardSize) {
	if (property.values.empty()) {
		throw SgfError(SgfError::Kind::Malformed, std::format("Property '{}' without value.", property.identifier));
	}

	if (property.identifier == PROP_SIZE) {
		return toSizeEvent(property);
	}
	if (property.identifier == PROP_BLACK) {
		return toMoveEvent(property, Player::Black, boardSize);
	}
	if (property.identifier == PROP_WHITE) {
		return toMoveEvent(property, Player::White, boardSize);
	}
	if (property.identifier == PROP_ADD_BLACK) {
		return toAddStonesEvent(property, Player::Black);
	}
	if (property.identifier == PROP_ADD_WHITE) {
		return toAddStonesEvent(property, Player::White);
	}

	return OtherEvent{property.identifier};
}

} // namespace fuseki
