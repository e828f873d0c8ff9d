#include "../Graph.hpp"
#include "../DegreeSource.hpp"
#include "../TopologyAnalyzer.hpp"
#include "../WeightedDistribution.hpp"
#include "../linklength/LinkLengthSource.hpp"
#include "../linklength/KleinbergLinkSource.hpp"
#include "../input/GraphFile.hpp"
#include "../utils.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

static int usage()
{
	std::cout << "Usage: sw_generator sandberg|kleinberg|lengths|peers N DEGREE SEED OUTPUT_FILE [--slow] [--poisson | --conform DISTRIBUTION_FILE]" << std::endl;
	return 1;
}

int main(int argc, char* argv[])
{
	if (argc < 6)
		return usage();

	std::string mode = argv[1];
	int n = std::stoi(argv[2]);
	int degree = std::stoi(argv[3]);
	uint32_t seed = { (uint32_t) std::stoul(argv[4]) };
	std::string output = argv[5];

	bool fast = true;
	bool poisson = false;
	std::string conform_file;
	for (int i = 6; i < argc; i++) {
		std::string flag = argv[i];
		if (flag == "--slow") {
			fast = false;
		} else if (flag == "--poisson") {
			poisson = true;
		} else if (flag == "--conform" && i + 1 < argc) {
			conform_file = argv[++i];
		} else {
			return usage();
		}
	}

	RandomSource random(seed);
	GraphParam param(n, fast);

	std::unique_ptr<WeightedDistribution> distribution;
	std::unique_ptr<DegreeSource> degrees;
	if (!conform_file.empty()) {
		distribution.reset(new WeightedDistribution(WeightedDistribution::fromFile(conform_file)));
		degrees.reset(new ConformingDegreeSource(*distribution, random));
	} else if (poisson) {
		degrees.reset(new PoissonDegreeSource(degree, random));
	} else {
		degrees.reset(new FixedDegreeSource(degree));
	}

	double time;
	std::unique_ptr<Graph> graph;
	TimeUtils::measure<void>([&]() {
		if (mode == "sandberg") {
			graph.reset(new Graph(Graph::generateSandberg(param, random)));
		} else if (mode == "kleinberg") {
			graph.reset(new Graph(Graph::generate1dKleinbergGraph(param, random, *degrees)));
		} else if (mode == "lengths") {
			InverseLinkLengthSource lengths(static_cast<unsigned>(n));
			graph.reset(new Graph(Graph::generateGraph(param, random, *degrees, lengths)));
		} else if (mode == "peers") {
			graph.reset(new Graph(Graph::placeNodes(param, random, *degrees)));
			KleinbergLinkSource peers(*graph);
			graph->connectPeers(peers, random);
		}
	}, time);

	if (!graph)
		return usage();

	TopologyAnalyzer analyzer(*graph);
	analyzer.printGraphStats(std::cout, true);
	DebugUtils::print([&](std::ostream & out) {
		out << "Degrees: " << analyzer.degrees();
	});

	std::cout << "Generated in " << time << "s" << std::endl;
	GraphFile::write(*graph, output);

	return 0;
}
