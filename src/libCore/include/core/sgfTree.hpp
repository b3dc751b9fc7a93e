#pragma once

#include <string>
#include <vector>

namespace fuseki {

//! Single SGF property with all of its values in document order.
struct SgfProperty {
	std::string identifier;          //!< Upper case property identifier, e.g. "B", "AB", "SZ".
	std::vector<std::string> values; //!< Unescaped values. At least one entry.
};

//! Node of an SGF game tree.
struct SgfNode {
	std::vector<SgfProperty> properties;
};

//! Game tree "(;A;B(...)(...))".
//! \note The node sequence is stored flat, so long main lines do not nest. Only variations do.
struct SgfTree {
	std::vector<SgfNode> sequence;   //!< Nodes of the main line in order. At least one node.
	std::vector<SgfTree> variations; //!< Variations following the last node of the sequence.
};

//! Parse an SGF collection into a forest of game trees.
//! \note Throws SgfError (Malformed) on any syntax error. No partial result is returned.
std::vector<SgfTree> parseSgf(const std::string& text);

//! Flatten the forest into one property list.
//! Depth first pre-order: sequence properties in order, then variations in order, trees in document order.
std::vector<SgfProperty> flattenProperties(const std::vector<SgfTree>& forest);

} // namespace fuseki
