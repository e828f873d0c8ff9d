#ifndef SMALL_WORLD_GRAPH_PARAM_HPP
#define SMALL_WORLD_GRAPH_PARAM_HPP

/**
 * Graph generation parameters
 */
struct GraphParam {
	// Number of nodes
	int n;
	// Place nodes evenly (and use the continuous Kleinberg approximation) instead of at random locations
	bool fastGeneration;

	GraphParam(int n, bool fast_generation) : n(n), fastGeneration(fast_generation)
	{}
};

#endif //SMALL_WORLD_GRAPH_PARAM_HPP
