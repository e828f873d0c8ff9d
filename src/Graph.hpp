#ifndef SMALL_WORLD_GRAPH_HPP
#define SMALL_WORLD_GRAPH_HPP

#include <vector>
#include <memory>
#include "GraphParam.hpp"
#include "SimpleNode.hpp"
#include "RandomSource.hpp"
#include "DegreeSource.hpp"
#include "linklength/LinkLengthSource.hpp"

/**
 * Small world graph of nodes on a location ring, together with its generators.
 *
 * Nodes are numbered in ascending location order at placement time. The graph owns its nodes;
 * connections are raw pointers between them, so a graph can be moved but not copied.
 * Nodes keep a pointer to the RandomSource passed at generation, which has to outlive the graph.
 */
class Graph {
	std::vector<std::unique_ptr<SimpleNode>> nodes_;
	// Sorted placement locations
	std::vector<double> locations_;

public:
	/**
	 * Probability of not making a connection with a peer which has its desired degree.
	 * Anything below 1 lets generation finish when the remaining capacity is out of reach.
	 */
	static constexpr double RejectProbability = 0.98;

	/**
	 * Connection attempts per node allowed for one source node, times the number of nodes,
	 * before generation gives up with std::runtime_error
	 */
	static constexpr unsigned long AttemptsPerNode = 10000;

	Graph(Graph && that) = default;
	Graph & operator=(Graph && that) = default;
	Graph(const Graph& that) = delete;

	/**
	 * Ring with one shortcut per node (Sandberg's base topology). Each node links to its ring
	 * predecessor and successor and has one outgoing shortcut, so every degree is exactly 3.
	 * The shortcut is one-sided: the shortcut target does not list the source.
	 */
	static Graph generateSandberg(GraphParam const & param, RandomSource & random);

	/**
	 * Generates a graph with link length distribution and peer count distribution as given by
	 * the sources. Each drawn length is mapped to the node at the closest distance.
	 */
	static Graph generateGraph(GraphParam const & param, RandomSource & random, DegreeSource & degrees, LinkLengthSource & lengths);

	/**
	 * One-dimensional Kleinberg graph, with edges chosen with probability proportional to
	 * 1 / distance. See "The Small-World Phenomenon: An Algorithmic Perspective", Kleinberg 1999;
	 * here edges are undirected.
	 *
	 * Fast generation treats nodes as evenly spaced and sorted, and draws index offsets from a
	 * continuous approximation of the distribution in O(1). Slow generation works on the exact
	 * locations with a cumulative weight table per source node.
	 */
	static Graph generate1dKleinbergGraph(GraphParam const & param, RandomSource & random, DegreeSource & degrees);

	/**
	 * Nodes only, no connections. Use connectPeers() to wire the graph with a PeerSource bound to it.
	 */
	static Graph placeNodes(GraphParam const & param, RandomSource & random, DegreeSource & degrees);

	/**
	 * Brings every node up to its target degree with peers drawn from `peers`
	 */
	void connectPeers(PeerSource & peers, RandomSource & random);

	/**
	 * Graph made of nodes at the given locations, without connections. Used when loading.
	 */
	static Graph fromNodes(std::vector<double> const & locations, std::vector<int> const & target_degrees, RandomSource & random);

	unsigned size() const
	{
		return unsigned(nodes_.size());
	}

	SimpleNode & node(unsigned i)
	{
		return *nodes_.at(i);
	}

	SimpleNode const & node(unsigned i) const
	{
		return *nodes_.at(i);
	}

	/**
	 * Locations as placed, in ascending order
	 */
	std::vector<double> const & locations() const
	{
		return locations_;
	}

	/**
	 * Locations by node index as they are now (darknet swaps move them)
	 */
	std::vector<double> currentLocations() const;

	/**
	 * @return Number of distinct unordered node pairs joined by at least one reference.
	 * This is the sum of degrees halved except in Sandberg graphs, where a one-sided shortcut
	 * counts once and a shortcut that doubles a reverse shortcut is not counted again.
	 */
	unsigned nEdges() const;

private:
	explicit Graph(int n);

	unsigned degreeSum() const;

	void generateNodes(GraphParam const & param, RandomSource & random, DegreeSource & degrees);

	/**
	 * Connects src and dest unless dest is src, already a peer, or saturated (the latter with
	 * probability RejectProbability).
	 * @return Whether an edge was added
	 */
	static bool tryConnect(SimpleNode & src, SimpleNode & dest, RandomSource & random);

	/**
	 * Calls `draw` until `src` is at its target degree, guarding against stalls
	 */
	template<class Draw>
	void fillDegree(SimpleNode & src, RandomSource & random, Draw draw);
};

#endif //SMALL_WORLD_GRAPH_HPP
