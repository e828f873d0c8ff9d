#ifndef SMALL_WORLD_TOPOLOGY_ANALYZER_HPP
#define SMALL_WORLD_TOPOLOGY_ANALYZER_HPP

#include <vector>
#include <ostream>
#include "Graph.hpp"
#include "ArrayStats.hpp"

/**
 * Read-only topology statistics of a graph.
 */
class TopologyAnalyzer {
	Graph const & graph_;

public:
	struct GraphStats {
		unsigned size, edges;
		int minDegree, maxDegree;
		double globalClusterCoeff;
		ArrayStats clustering, degree;
	};

	explicit TopologyAnalyzer(Graph const & graph) : graph_(graph)
	{}

	int degree(unsigned node) const
	{
		return graph_.node(node).degree();
	}

	std::vector<int> degrees() const;

	int minDegree() const;

	int maxDegree() const;

	/**
	 * Mean peer list length
	 */
	double meanDegree() const;

	/**
	 * Population variance E[d^2] - E[d]^2
	 */
	double degreeVariance() const;

	/**
	 * Edge length distribution: the ring distance of every edge counted by Graph::nEdges(), taken
	 * from its lower index end, or from the only end holding a one-sided reference
	 */
	std::vector<double> edgeLengths() const;

	std::vector<double> localClusterCoeffs() const;

	/**
	 * Unweighted mean of the local clustering coefficients. This is *not* the global
	 * clustering coefficient: low degree nodes weigh as much as high degree ones.
	 * See http://en.wikipedia.org/wiki/Clustering_coefficient
	 */
	double meanLocalClusterCoeff() const;

	/**
	 * Closed triplets over all possible triplets (transitivity). 0 if no node has two peers.
	 */
	double globalClusterCoeff() const;

	unsigned componentCount() const;

	bool connected() const
	{
		return componentCount() == 1;
	}

	GraphStats graphStats() const;

	/**
	 * Verbose prints a readable report, otherwise one tab separated row (see printGraphStatsHeader)
	 */
	void printGraphStats(std::ostream & out, bool verbose) const;

	static void printGraphStatsHeader(std::ostream & out);
};

#endif //SMALL_WORLD_TOPOLOGY_ANALYZER_HPP
