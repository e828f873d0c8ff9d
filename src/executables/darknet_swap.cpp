#include "../input/GraphFile.hpp"
#include "../DarknetSimulator.hpp"
#include "../TopologyAnalyzer.hpp"
#include <cstdint>
#include <iostream>
#include <string>

int main(int argc, char* argv[])
{
	if (argc != 8) {
		std::cout << "Usage: darknet_swap INPUT_FILE OUTPUT_FILE ROUNDS ATTEMPTS_PER_ROUND WALK_HOPS uniform|walk|corrected-walk SEED" << std::endl;
		return 1;
	}

	unsigned rounds = { (unsigned) std::stoul(argv[3]) };
	unsigned attempts = { (unsigned) std::stoul(argv[4]) };
	unsigned hops = { (unsigned) std::stoul(argv[5]) };
	std::string selection = argv[6];
	uint32_t seed = { (uint32_t) std::stoul(argv[7]) };

	if (selection != "uniform" && selection != "walk" && selection != "corrected-walk") {
		std::cout << "Unknown selection " << selection << std::endl;
		return 1;
	}

	RandomSource random(seed);
	Graph graph = GraphFile::read(std::string(argv[1]), random);
	DarknetSimulator simulator(graph, random);
	TopologyAnalyzer analyzer(graph);

	std::cout << "round,accepted,attempts,meanEdgeLength" << std::endl;
	for (unsigned round { 0 }; round < rounds; round++) {
		unsigned accepted = simulator.swapRound(attempts, selection == "uniform", hops, selection == "walk");

		double length_sum = { 0.0 };
		std::vector<double> lengths = analyzer.edgeLengths();
		for (double length : lengths)
			length_sum += length;

		std::cout << round << ","
				  << accepted << ","
				  << attempts << ","
				  << (lengths.empty() ? 0.0 : length_sum / lengths.size()) << std::endl;
	}

	GraphFile::write(graph, std::string(argv[2]));
	return 0;
}
