#include "engine/gtpEngine.hpp"

#include "Logging.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <format>

namespace fuseki::engine {

GtpEngine::GtpEngine(IEngineChannel& channel) : m_channel(channel) {
}

GtpResponse GtpEngine::execute(const GtpCommand& command) {
	const auto start = std::chrono::steady_clock::now();
	auto line        = command.toLine();
	m_channel.send(line);

	const auto raw = m_channel.receive();
	if (!raw) {
		throw EngineError(std::format("Engine channel closed while waiting for '{}'.", command.name));
	}
	const auto response = parseResponse(*raw);
	if (!response) {
		throw EngineError(std::format("Invalid response to '{}': '{}'.", command.name, *raw));
	}

	const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	line.pop_back();
	Logger().Log(Logging::LogLevel::Debug,
	             std::format("[GtpEngine] '{}' -> {}'{}' ({}ms)", line, response->success ? "" : "error ", response->payload, elapsed.count()));
	return *response;
}

bool GtpEngine::setBoardSize(const unsigned size) {
	const auto response = execute(boardSizeCommand(size));
	if (!response.success) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Board size {} rejected: {}", size, response.payload));
	}
	return response.success;
}

bool GtpEngine::clearBoard() {
	return execute(clearBoardCommand()).success;
}

bool GtpEngine::play(const Player player, const Coord c) {
	const auto response = execute(playCommand(player, c));
	if (!response.success) {
		Logger().Log(Logging::LogLevel::Info, std::format("[GtpEngine] Move {} {} rejected: {}", toColorName(player), toVertex(c), response.payload));
	}
	return response.success;
}

std::optional<Coord> GtpEngine::genmove(const Player player) {
	const auto response = execute(genmoveCommand(player));
	if (!response.success) {
		throw EngineError(std::format("genmove failed: {}", response.payload));
	}

	std::string move;
	for (const char c: response.payload) {
		move.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}
	if (move == "pass" || move == "resign") {
		Logger().Log(Logging::LogLevel::Info, std::format("[GtpEngine] Engine plays '{}'.", move));
		return {};
	}

	const auto coord = fromVertex(response.payload);
	if (!coord) {
		throw EngineError(std::format("genmove returned invalid vertex '{}'.", response.payload));
	}
	return coord;
}

std::vector<Coord> GtpEngine::listStones(const Player player) {
	const auto response = execute(listStonesCommand(player));
	if (!response.success) {
		throw EngineError(std::format("list_stones failed: {}", response.payload));
	}

	auto stones = parseVertexList(response.payload);
	if (!stones) {
		throw EngineError(std::format("list_stones returned invalid vertices '{}'.", response.payload));
	}
	return *stones;
}

std::size_t GtpEngine::captures(const Player player) {
	const auto response = execute(capturesCommand(player));
	if (!response.success) {
		throw EngineError(std::format("captures failed: {}", response.payload));
	}

	std::size_t count    = 0u;
	const auto* begin    = response.payload.data();
	const auto* end      = begin + response.payload.size();
	const auto [ptr, ec] = std::from_chars(begin, end, count);
	if (ec != std::errc() || ptr != end) {
		throw EngineError(std::format("captures returned '{}'.", response.payload));
	}
	return count;
}

bool GtpEngine::undo() {
	return execute(undoCommand()).success;
}

} // namespace fuseki::engine
