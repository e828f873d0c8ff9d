#ifndef SMALL_WORLD_DARKNET_SIMULATOR_HPP
#define SMALL_WORLD_DARKNET_SIMULATOR_HPP

#include <vector>
#include "Graph.hpp"
#include "RandomSource.hpp"

/**
 * Darknet location swapping on an existing graph, and the random walk sampling it relies on.
 */
class DarknetSimulator {
	Graph & graph_;
	RandomSource & random_;

public:
	struct WalkDistribution {
		// How often each node index ended a walk
		std::vector<unsigned> frequency;
		// Walks that ended on their origin
		unsigned originReturns;
	};

	DarknetSimulator(Graph & graph, RandomSource & random) : graph_(graph), random_(random)
	{}

	/**
	 * Performs the darknet location swapping algorithm repeatedly.
	 *
	 * @param attempts Number of swaps to attempt
	 * @param uniform_selection Pick swap targets from a flat distribution (centralized) instead of walking
	 * @param walk_hops Hops to walk for decentralized selection
	 * @param uniform_walk Walk uniformly instead of correcting for the high degree bias; corrected
	 * walks are twice as long since some of their hops get rejected
	 * @return Number of swaps accepted
	 */
	unsigned swapRound(unsigned attempts, bool uniform_selection, unsigned walk_hops, bool uniform_walk);

	/**
	 * Tallies where walks from uniformly chosen origins end, to compare the walk's stationary
	 * distribution with the intended one
	 */
	WalkDistribution randomWalkDistributionTest(unsigned walks, unsigned hops_per_walk, bool uniform);

	/**
	 * Flat reference tally of `samples` uniform node choices
	 */
	std::vector<unsigned> referenceDistribution(unsigned samples);
};

#endif //SMALL_WORLD_DARKNET_SIMULATOR_HPP
