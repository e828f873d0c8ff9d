#include "../input/GraphFile.hpp"
#include "../TopologyAnalyzer.hpp"
#include <iostream>
#include <string>

int main(int argc, char* argv[])
{
	if (argc < 2) {
		std::cout << "Usage: graph_stats INPUT_FILE... [--verbose]" << std::endl;
		return 1;
	}

	bool verbose = std::string(argv[argc - 1]) == "--verbose";
	int files = verbose ? argc - 1 : argc;

	if (!verbose) {
		std::cout << "file\t";
		TopologyAnalyzer::printGraphStatsHeader(std::cout);
	}

	RandomSource random(0);
	for (int i = 1; i < files; i++) {
		Graph graph = GraphFile::read(std::string(argv[i]), random);
		TopologyAnalyzer analyzer(graph);

		if (verbose) {
			std::cout << argv[i] << std::endl;
			analyzer.printGraphStats(std::cout, true);
			std::cout << "Components:\t\t\t\t" << analyzer.componentCount() << std::endl;
		} else {
			std::cout << argv[i] << "\t";
			analyzer.printGraphStats(std::cout, false);
		}
	}

	return 0;
}
