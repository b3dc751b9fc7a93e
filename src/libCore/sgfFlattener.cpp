#include "core/sgfTree.hpp"

namespace fuseki {

std::vector<SgfProperty> flattenProperties(const std::vector<SgfTree>& forest) {
	std::vector<SgfProperty> properties;

	// Pushed in reverse so the first variation is visited first.
	std::vector<const SgfTree*> stack;
	for (auto it = forest.rbegin(); it != forest.rend(); ++it) {
		stack.push_back(&*it);
	}

	while (!stack.empty()) {
		const auto* tree = stack.back();
		stack.pop_back();

		for (const auto& node: tree->sequence) {
			properties.insert(properties.end(), node.properties.begin(), node.properties.end());
		}
		for (auto it = tree->variations.rbegin(); it != tree->variations.rend(); ++it) {
			stack.push_back(&*it);
		}
	}

	return properties;
}

} // namespace fuseki
