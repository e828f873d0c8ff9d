#include "DarknetSimulator.hpp"
#include <iostream>

unsigned DarknetSimulator::swapRound(unsigned attempts, bool uniform_selection, unsigned walk_hops, bool uniform_walk)
{
	unsigned accepted = { 0 };
	for (unsigned i { 0 }; i < attempts; i++) {
		SimpleNode & origin = graph_.node(random_.uniformInt(graph_.size()));
		SimpleNode * target;

		if (uniform_selection) {
			target = &graph_.node(random_.uniformInt(graph_.size()));
		} else {
			unsigned hops = uniform_walk ? walk_hops : walk_hops * 2;
			target = &origin.randomWalk(hops, uniform_walk, random_);
		}

		if (origin.attemptSwap(*target))
			accepted++;
	}
	return accepted;
}

DarknetSimulator::WalkDistribution DarknetSimulator::randomWalkDistributionTest(unsigned walks, unsigned hops_per_walk, bool uniform)
{
	WalkDistribution result { std::vector<unsigned>(graph_.size(), 0), 0 };

	for (unsigned i { 0 }; i < walks; i++) {
		SimpleNode & origin = graph_.node(random_.uniformInt(graph_.size()));
		SimpleNode & dest = origin.randomWalk(hops_per_walk, uniform, random_);
		result.frequency.at(dest.index())++;
		if (&origin == &dest)
			result.originReturns++;
	}

	std::cout << "Origin selected as dest on " << result.originReturns << " walks out of " << walks << std::endl;
	return result;
}

std::vector<unsigned> DarknetSimulator::referenceDistribution(unsigned samples)
{
	std::vector<unsigned> frequency(graph_.size(), 0);
	for (unsigned i { 0 }; i < samples; i++)
		frequency[random_.uniformInt(graph_.size())]++;
	return frequency;
}
