#pragma once

#include <stdexcept>
#include <string>

namespace fuseki {

//! Raised when a game record cannot be turned into board data. Aborts the whole record.
class SgfError : public std::runtime_error {
public:
	enum class Kind {
		Malformed,        //!< Text is not valid SGF or holds invalid property values.
		MissingBoardSize, //!< Stones placed before the board size was declared.
		OutOfRange,       //!< Coordinate outside of the declared board.
	};

	SgfError(Kind kind, const std::string& message) : std::runtime_error(message), m_kind(kind) {
	}

	Kind kind() const {
		return m_kind;
	}

private:
	Kind m_kind;
};

} // namespace fuseki
