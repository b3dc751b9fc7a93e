#include "core/sgfError.hpp"
#include "core/sgfTree.hpp"

#include <cctype>
#include <format>
#include <string_view>
#include <utility>

namespace fuseki {

//! Read position inside the SGF text.
struct SgfCursor {
	std::string_view text;
	std::size_t pos{0u};
};

[[noreturn]] static void sgfFail(const SgfCursor& cursor, std::string_view message) {
	throw SgfError(SgfError::Kind::Malformed, std::format("SGF parse error at offset {}: {}", cursor.pos, message));
}

static void skipWhitespace(SgfCursor& cursor) {
	while (cursor.pos < cursor.text.size() && std::isspace(static_cast<unsigned char>(cursor.text[cursor.pos]))) {
		++cursor.pos;
	}
}

//! Next non whitespace character without consuming it. 0 at the end of the text.
static char peek(SgfCursor& cursor) {
	skipWhitespace(cursor);
	return cursor.pos < cursor.text.size() ? cursor.text[cursor.pos] : '\0';
}

static void expect(SgfCursor& cursor, const char c) {
	if (peek(cursor) != c) {
		sgfFail(cursor, std::format("expected '{}'", c));
	}
	++cursor.pos;
}

//! Value between '[' and ']'. The opening bracket is already consumed.
static std::string parseValue(SgfCursor& cursor) {
	std::string value;
	while (true) {
		if (cursor.pos >= cursor.text.size()) {
			sgfFail(cursor, "unterminated property value");
		}

		const char c = cursor.text[cursor.pos++];
		if (c == ']') {
			return value;
		}
		if (c != '\\') {
			value.push_back(c);
			continue;
		}

		if (cursor.pos >= cursor.text.size()) {
			sgfFail(cursor, "unterminated escape sequence");
		}
		const char escaped = cursor.text[cursor.pos++];
		if (escaped == '\n' || escaped == '\r') {
			// Soft line break. Swallow a "\r\n" or "\n\r" pair as a whole.
			if (cursor.pos < cursor.text.size()) {
				const char next = cursor.text[cursor.pos];
				if ((next == '\n' || next == '\r') && next != escaped) {
					++cursor.pos;
				}
			}
			continue;
		}
		value.push_back(escaped);
	}
}

static bool parseProperty(SgfCursor& cursor, SgfNode& node) {
	const char first = peek(cursor);
	if (!std::isalpha(static_cast<unsigned char>(first))) {
		return false;
	}

	SgfProperty property;
	while (cursor.pos < cursor.text.size() && std::isalpha(static_cast<unsigned char>(cursor.text[cursor.pos]))) {
		const char c = cursor.text[cursor.pos++];
		if (std::isupper(static_cast<unsigned char>(c))) {
			property.identifier.push_back(c); // Lower case letters of old FF[1-3] identifiers are dropped.
		}
	}
	if (property.identifier.empty()) {
		sgfFail(cursor, "property identifier without upper case letter");
	}

	while (peek(cursor) == '[') {
		++cursor.pos;
		property.values.push_back(parseValue(cursor));
	}
	if (property.values.empty()) {
		sgfFail(cursor, std::format("no value for property '{}'", property.identifier));
	}

	node.properties.push_back(std::move(property));
	return true;
}

static SgfNode parseNode(SgfCursor& cursor) {
	expect(cursor, ';');

	SgfNode node;
	while (parseProperty(cursor, node)) {
	}
	return node;
}

static SgfTree parseGameTree(SgfCursor& cursor) {
	expect(cursor, '(');

	SgfTree tree;
	while (peek(cursor) == ';') {
		tree.sequence.push_back(parseNode(cursor));
	}
	if (tree.sequence.empty()) {
		sgfFail(cursor, "game tree without nodes");
	}

	while (peek(cursor) == '(') {
		tree.variations.push_back(parseGameTree(cursor));
	}
	expect(cursor, ')');
	return tree;
}

std::vector<SgfTree> parseSgf(const std::string& text) {
	SgfCursor cursor{text, 0u};

	// Skip UTF-8 byte order mark.
	if (cursor.text.starts_with("\xEF\xBB\xBF")) {
		cursor.pos = 3u;
	}

	std::vector<SgfTree> forest;
	while (peek(cursor) == '(') {
		forest.push_back(parseGameTree(cursor));
	}

	if (forest.empty()) {
		sgfFail(cursor, "no game tree found");
	}
	if (peek(cursor) != '\0') {
		sgfFail(cursor, "unexpected text after last game tree");
	}
	return forest;
}

} // namespace fuseki
