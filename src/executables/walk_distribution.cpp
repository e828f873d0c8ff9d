#include "../Graph.hpp"
#include "../DegreeSource.hpp"
#include "../DarknetSimulator.hpp"
#include "../TopologyAnalyzer.hpp"
#include "../utils.hpp"
#include <iostream>
#include <vector>

/*
 * Compares where uniform and degree corrected random walks end against a flat reference
 * distribution, on a few fast Kleinberg graphs with Poisson degrees.
 */
int main(int argc, char* argv[])
{
	if (argc != 1 && argc != 6) {
		std::cout << "Usage: walk_distribution [NODES WALKS BUCKETS TRIALS MEAN_DEGREE]" << std::endl;
		return 1;
	}

	unsigned nodes = 4000;
	unsigned walks = 10 * 1000 * 1000;
	unsigned buckets = 400;
	unsigned trials = 4;
	double mean_degree = 12;
	if (argc == 6) {
		nodes = (unsigned) std::stoul(argv[1]);
		walks = (unsigned) std::stoul(argv[2]);
		buckets = (unsigned) std::stoul(argv[3]);
		trials = (unsigned) std::stoul(argv[4]);
		mean_degree = std::stod(argv[5]);
	}

	const unsigned hops_uniform = 20;
	const unsigned hops_corrected = 40;

	// [trial][reference, uniform, corrected]
	std::vector<std::vector<std::vector<unsigned long>>> pdfs;

	for (unsigned trial { 0 }; trial < trials; trial++) {
		std::cout << "Creating test graph..." << std::endl;
		RandomSource random(trial);
		PoissonDegreeSource degrees(mean_degree, random);
		Graph g = Graph::generate1dKleinbergGraph(GraphParam(int(nodes), true), random, degrees);
		TopologyAnalyzer(g).printGraphStats(std::cout, true);

		DarknetSimulator simulator(g, random);
		std::cout << "Computing reference distribution..." << std::endl;
		std::vector<unsigned> reference = simulator.referenceDistribution(walks);
		std::cout << "Computing uniform walks..." << std::endl;
		DarknetSimulator::WalkDistribution uniform = simulator.randomWalkDistributionTest(walks, hops_uniform, true);
		std::cout << "Computing weighted walks..." << std::endl;
		DarknetSimulator::WalkDistribution corrected = simulator.randomWalkDistributionTest(walks, hops_corrected, false);

		pdfs.push_back({
				DistributionUtils::sortedBuckets(reference, buckets),
				DistributionUtils::sortedBuckets(uniform.frequency, buckets),
				DistributionUtils::sortedBuckets(corrected.frequency, buckets)
		});
	}

	std::cout << "Distribution PDFs:" << std::endl;
	for (unsigned trial { 0 }; trial < trials; trial++)
		std::cout << "Reference\tUniform\tWeighted\t";
	std::cout << std::endl;

	for (unsigned i { 0 }; i < buckets; i++) {
		for (unsigned trial { 0 }; trial < trials; trial++)
			std::cout << pdfs[trial][0][i] << "\t" << pdfs[trial][1][i] << "\t" << pdfs[trial][2][i] << "\t";
		std::cout << std::endl;
	}

	return 0;
}
