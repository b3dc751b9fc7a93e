#include "core/sgfHandler.hpp"

#include "core/sgfError.hpp"

#include <algorithm>
#include <format>

namespace fuseki {

static Id decodeCoord(const char c, const std::string& s) {
	if ('a' <= c && c <= 'z')
		return static_cast<Id>(c - 'a');
	if ('A' <= c && c <= 'Z')
		return static_cast<Id>(c - 'A' + 26);

	throw SgfError(SgfError::Kind::Malformed, std::format("Invalid SGF point '{}'.", s));
}

static char encodeCoord(const Id value) {
	return value < 26u ? static_cast<char>('a' + value) : static_cast<char>('A' + (value - 26u));
}

Coord fromSGF(const std::string& s) {
	if (s.size() != 2u) {
		throw SgfError(SgfError::Kind::Malformed, std::format("Invalid SGF point '{}'.", s));
	}
	return {decodeCoord(s[0u], s), decodeCoord(s[1u], s)};
}

std::string toSGF(const Coord c) {
	return {encodeCoord(c.x), encodeCoord(c.y)};
}

bool isPassSGF(const std::string& s, const std::size_t boardSize) {
	return s.empty() || (s == "tt" && boardSize <= 19u);
}

std::vector<Coord> expandPointList(const std::string& s) {
	const auto colon = s.find(':');
	if (colon == std::string::npos) {
		return {fromSGF(s)};
	}

	const auto first  = fromSGF(s.substr(0u, colon));
	const auto second = fromSGF(s.substr(colon + 1u));

	const auto [minX, maxX] = std::minmax(first.x, second.x);
	const auto [minY, maxY] = std::minmax(first.y, second.y);

	std::vector<Coord> points;
	points.reserve((maxX - minX + 1u) * (maxY - minY + 1u));
	for (Id x = minX; x <= maxX; ++x) {
		for (Id y = minY; y <= maxY; ++y) {
			points.push_back({x, y});
		}
	}
	return points;
}

} // namespace fuseki
