#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fuseki::engine {

//! Single Go Text Protocol command.
struct GtpCommand {
	std::string name;
	std::vector<std::string> args;

	std::string toLine() const; //!< Command text terminated by a newline.
};

//! Parsed engine answer.
struct GtpResponse {
	bool success;        //!< '=' reply. False for '?'.
	std::string payload; //!< Text after the status character, trimmed. Lines joined with '\n'.
};

// Command builders for the commands the application sends.
GtpCommand boardSizeCommand(unsigned size);
GtpCommand clearBoardCommand();
GtpCommand playCommand(Player player, Coord c);
GtpCommand genmoveCommand(Player player);
GtpCommand listStonesCommand(Player player);
GtpCommand capturesCommand(Player player);
GtpCommand undoCommand();

//! GTP color name ("black", "white").
std::string toColorName(Player player);

//! Convert to GTP vertex. Columns A-Z skip I, rows start at 1. {0, 0} -> "A1".
std::string toVertex(Coord c);

//! Parse a GTP vertex. Case insensitive. Empty for invalid text or "pass".
std::optional<Coord> fromVertex(const std::string& vertex);

//! Parse the raw answer block of the engine. Empty if the text is not a GTP response.
std::optional<GtpResponse> parseResponse(const std::string& text);

//! Parse a whitespace separated vertex list. "pass" entries are skipped, any other invalid entry fails the list.
std::optional<std::vector<Coord>> parseVertexList(const std::string& payload);

} // namespace fuseki::engine
