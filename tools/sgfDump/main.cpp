#include "core/gameRecord.hpp"
#include "core/sgfError.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

// Prints the stones left on the board at the end of an SGF record.
// Usage: fusekiSgfDump <file.sgf>
int main(int argc, char** argv) {
	if (argc != 2) {
		std::cerr << "Usage: " << argv[0] << " <file.sgf>\n";
		return 2;
	}

	std::ifstream file(argv[1], std::ios::binary);
	if (!file) {
		std::cerr << "Could not open '" << argv[1] << "'.\n";
		return 1;
	}
	std::ostringstream content;
	content << file.rdbuf();

	try {
		std::cout << fuseki::loadGameData(content.str()) << '\n';
	} catch (const fuseki::SgfError& e) {
		std::cerr << "Invalid record: " << e.what() << '\n';
		return 1;
	}
	return 0;
}
