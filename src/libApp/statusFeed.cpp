#include "app/statusFeed.hpp"

#include "Logging.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <sstream>
#include <string_view>

namespace fuseki::app {

static constexpr std::string_view RECORD_GAME = "G";
static constexpr std::size_t GAME_FIELDS      = 15u;

static std::string trim(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1u);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1u);
	}
	return std::string{text};
}

template <typename T>
static bool parseNumber(std::string_view value, T& out) {
	if (value.empty()) {
		return false;
	}
	const auto* end      = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, out);
	return ec == std::errc() && ptr == end;
}

std::vector<std::string> splitStatusLine(const std::string& line) {
	std::vector<std::string> fields;
	std::string field;
	bool quoted = false;

	for (std::size_t i = 0; i < line.size(); ++i) {
		const char c = line[i];
		if (quoted) {
			if (c == '\\' && i + 1u < line.size()) {
				field.push_back(line[++i]);
			} else if (c == '\'') {
				quoted = false;
			} else {
				field.push_back(c);
			}
			continue;
		}

		if (c == '\'') {
			quoted = true;
		} else if (c == ',') {
			fields.push_back(trim(field));
			field.clear();
		} else {
			field.push_back(c);
		}
	}
	fields.push_back(trim(field));
	return fields;
}

std::optional<std::chrono::sys_seconds> parseServerDate(const std::string& text) {
	const auto value = trim(text);
	const std::string_view view{value};

	// YYYY-MM-DD hh:mm:ss
	if (view.size() != 19u || view[4u] != '-' || view[7u] != '-' || (view[10u] != ' ' && view[10u] != 'T') || view[13u] != ':' || view[16u] != ':') {
		return {};
	}

	int year         = 0;
	unsigned month   = 0u;
	unsigned day     = 0u;
	unsigned hour    = 0u;
	unsigned minute  = 0u;
	unsigned second  = 0u;
	const bool valid = parseNumber(view.substr(0u, 4u), year) && parseNumber(view.substr(5u, 2u), month) && parseNumber(view.substr(8u, 2u), day) &&
	                   parseNumber(view.substr(11u, 2u), hour) && parseNumber(view.substr(14u, 2u), minute) && parseNumber(view.substr(17u, 2u), second);
	if (!valid || hour > 23u || minute > 59u || second > 59u) {
		return {};
	}

	const std::chrono::year_month_day date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
	if (!date.ok()) {
		return {};
	}
	return std::chrono::sys_days{date} + std::chrono::hours{hour} + std::chrono::minutes{minute} + std::chrono::seconds{second};
}

std::optional<std::chrono::hours> parseTimeRemaining(const std::string& text) {
	const auto value = trim(text);
	if (!value.starts_with("F:")) {
		return {}; // Only Fischer time is supported.
	}

	auto remaining = std::string_view{value}.substr(2u);
	if (const auto extra = remaining.find('('); extra != std::string_view::npos) {
		remaining = remaining.substr(0u, extra);
	}

	std::chrono::hours total{0};
	std::istringstream pieces{std::string{remaining}};
	std::string piece;
	while (pieces >> piece) {
		long amount = 0;
		if (piece.size() < 2u || !parseNumber(std::string_view{piece.data(), piece.size() - 1u}, amount)) {
			return {};
		}

		switch (piece.back()) {
		case 'd':
			total += std::chrono::days{amount};
			break;
		case 'h':
			total += std::chrono::hours{amount};
			break;
		default:
			return {};
		}
	}
	return total;
}

static std::optional<Player> parsePlayerColor(const std::string& text) {
	std::string lower;
	for (const char c: text) {
		lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}
	if (lower == "b" || lower == "black") {
		return Player::Black;
	}
	if (lower == "w" || lower == "white") {
		return Player::White;
	}
	return {};
}

std::optional<RemoteGame> parseGameLine(const std::string& line) {
	const auto fields = splitStatusLine(line);
	if (fields.size() < GAME_FIELDS || !fields[0u].starts_with(RECORD_GAME)) {
		return {};
	}

	const auto color          = parsePlayerColor(fields[3u]);
	const auto lastMove       = parseServerDate(fields[4u]);
	const auto opponentAccess = parseServerDate(fields[13u]);
	if (fields[1u].empty() || !color || !lastMove || !opponentAccess) {
		return {};
	}

	RemoteGame game{
	        .gameId             = fields[1u],
	        .opponentHandle     = fields[2u],
	        .playerColor        = *color,
	        .lastMoveDate       = *lastMove,
	        .timeRemaining      = parseTimeRemaining(fields[5u]),
	        .gameAction         = 0u,
	        .gameStatus         = fields[7u],
	        .moveId             = 0u,
	        .tournamentId       = 0u,
	        .shapeId            = 0u,
	        .gameType           = fields[11u],
	        .gamePriority       = 0,
	        .opponentLastAccess = *opponentAccess,
	        .handicap           = 0u,
	};
	const bool numbersValid = parseNumber(fields[6u], game.gameAction) && parseNumber(fields[8u], game.moveId) && parseNumber(fields[9u], game.tournamentId) &&
	                          parseNumber(fields[10u], game.shapeId) && parseNumber(fields[12u], game.gamePriority) && parseNumber(fields[14u], game.handicap);
	if (!numbersValid) {
		return {};
	}
	return game;
}

std::vector<RemoteGame> parseStatusFeed(const std::string& text) {
	std::vector<RemoteGame> games;

	std::istringstream lines(text);
	std::string line;
	while (std::getline(lines, line)) {
		line = trim(line);
		if (!line.starts_with(RECORD_GAME)) {
			continue; // Other record kinds (messages, multi player games) and headers.
		}

		if (auto game = parseGameLine(line)) {
			games.push_back(std::move(*game));
		} else {
			Logger().Log(Logging::LogLevel::Warning, std::format("[StatusFeed] Skipping malformed game line '{}'.", line));
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[StatusFeed] {} game(s) waiting.", games.size()));
	return games;
}

} // namespace fuseki::app
