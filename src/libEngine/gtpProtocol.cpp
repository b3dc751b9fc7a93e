#include "engine/gtpProtocol.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <string_view>

namespace fuseki::engine {

static constexpr std::string_view GTP_SUCCESS = "=";
static constexpr std::string_view GTP_FAILURE = "?";
static constexpr std::string_view GTP_PASS    = "pass";

static constexpr unsigned MAX_VERTEX_SIZE = 25u; //!< GTP vertices cover boards up to 25x25.

std::string GtpCommand::toLine() const {
	std::string line = name;
	for (const auto& arg: args) {
		line.push_back(' ');
		line += arg;
	}
	line.push_back('\n');
	return line;
}

std::string toColorName(const Player player) {
	return std::string{colorName(player)};
}

GtpCommand boardSizeCommand(const unsigned size) {
	return {"boardsize", {std::to_string(size)}};
}
GtpCommand clearBoardCommand() {
	return {"clear_board", {}};
}
GtpCommand playCommand(const Player player, const Coord c) {
	return {"play", {toColorName(player), toVertex(c)}};
}
GtpCommand genmoveCommand(const Player player) {
	return {"genmove", {toColorName(player)}};
}
GtpCommand listStonesCommand(const Player player) {
	return {"list_stones", {toColorName(player)}};
}
GtpCommand capturesCommand(const Player player) {
	return {"captures", {toColorName(player)}};
}
GtpCommand undoCommand() {
	return {"undo", {}};
}

std::string toVertex(const Coord c) {
	// Column letters skip 'I'.
	const char column = static_cast<char>(c.x < 8u ? 'A' + c.x : 'A' + c.x + 1u);
	return column + std::to_string(c.y + 1u);
}

std::optional<Coord> fromVertex(const std::string& vertex) {
	if (vertex.size() < 2u) {
		return {};
	}

	const char column = static_cast<char>(std::toupper(static_cast<unsigned char>(vertex[0u])));
	if (column < 'A' || column > 'Z' || column == 'I') {
		return {};
	}
	const Id x = column < 'I' ? static_cast<Id>(column - 'A') : static_cast<Id>(column - 'A' - 1);

	unsigned row         = 0u;
	const auto* begin    = vertex.data() + 1;
	const auto* end      = vertex.data() + vertex.size();
	const auto [ptr, ec] = std::from_chars(begin, end, row);
	if (ec != std::errc() || ptr != end || row == 0u || row > MAX_VERTEX_SIZE) {
		return {};
	}

	return Coord{x, row - 1u};
}

static std::string_view trim(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1u);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1u);
	}
	return text;
}

std::optional<GtpResponse> parseResponse(const std::string& text) {
	auto body = trim(text);
	if (body.empty()) {
		return {};
	}

	GtpResponse response{};
	if (body.starts_with(GTP_SUCCESS)) {
		response.success = true;
	} else if (body.starts_with(GTP_FAILURE)) {
		response.success = false;
	} else {
		return {};
	}
	body.remove_prefix(1u);

	// Optional command id directly after the status character.
	while (!body.empty() && std::isdigit(static_cast<unsigned char>(body.front()))) {
		body.remove_prefix(1u);
	}
	if (!body.empty() && !std::isspace(static_cast<unsigned char>(body.front()))) {
		return {};
	}

	// Normalise line endings and strip the indentation of continuation lines.
	std::istringstream lines{std::string{trim(body)}};
	std::string line;
	while (std::getline(lines, line)) {
		const auto trimmed = trim(line);
		if (trimmed.empty()) {
			continue;
		}
		if (!response.payload.empty()) {
			response.payload.push_back('\n');
		}
		response.payload += trimmed;
	}
	return response;
}

std::optional<std::vector<Coord>> parseVertexList(const std::string& payload) {
	std::vector<Coord> coords;

	std::istringstream stream(payload);
	std::string entry;
	while (stream >> entry) {
		std::string lower;
		for (const char c: entry) {
			lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
		}
		if (lower == GTP_PASS) {
			continue;
		}

		const auto coord = fromVertex(entry);
		if (!coord) {
			return {};
		}
		coords.push_back(*coord);
	}
	return coords;
}

} // namespace fuseki::engine
