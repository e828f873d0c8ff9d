#ifndef SMALL_WORLD_SIMPLE_NODE_HPP
#define SMALL_WORLD_SIMPLE_NODE_HPP

#include <vector>
#include "RandomSource.hpp"

/**
 * A peer on the location ring.
 *
 * Connections are kept as an ordered list of non-owning pointers into the owning Graph, so
 * iteration order is the order connections were made. Undirected edges are two reciprocal
 * references and are always added through connect(); connectOutgoing() is the one-sided
 * exception used to seed the ring and the directed shortcuts of the Sandberg topology.
 */
class SimpleNode {
	unsigned index_;
	double location_;
	int target_degree_;
	RandomSource * random_;
	std::vector<SimpleNode *> connections_;

public:
	SimpleNode(unsigned index, double location, int target_degree, RandomSource * random) :
			index_(index), location_(location), target_degree_(target_degree), random_(random)
	{}

	SimpleNode(const SimpleNode& that) = delete;

	unsigned index() const
	{
		return index_;
	}

	double location() const
	{
		return location_;
	}

	int targetDegree() const
	{
		return target_degree_;
	}

	int degree() const
	{
		return int(connections_.size());
	}

	bool atDegree() const
	{
		return degree() >= target_degree_;
	}

	std::vector<SimpleNode *> const & connections() const
	{
		return connections_;
	}

	bool isConnected(SimpleNode const & other) const;

	/**
	 * Adds an undirected edge. Throws std::logic_error on a self or duplicate connection.
	 */
	void connect(SimpleNode & other);

	/**
	 * Adds `other` to this node's connections only; the caller takes care of the way back
	 */
	void connectOutgoing(SimpleNode & other);

	double distanceTo(SimpleNode const & other) const;

	double distanceToLoc(double location) const;

	/**
	 * @return Number of pairs of peers which are connected to each other
	 */
	int closedTriplets() const;

	/**
	 * Fraction of peer pairs that are themselves connected; 0 below degree 2.
	 */
	double localClusterCoeff() const;

	/**
	 * Walks `hops` steps over connections.
	 *
	 * A uniform walk moves to a uniformly chosen peer each hop and is biased toward high degree
	 * nodes. Otherwise a move from degree a to degree b is only accepted with probability
	 * min(1, a / b), which makes the stationary distribution uniform; a rejected move still uses
	 * up the hop.
	 */
	SimpleNode & randomWalk(unsigned hops, bool uniform, RandomSource & random);

	/**
	 * Offers to exchange locations with `target`. The swap is taken if it lowers the product of
	 * peer distances of both nodes, or otherwise with probability old product / new product.
	 * @return Whether the locations were exchanged
	 */
	bool attemptSwap(SimpleNode & target);

private:
	/**
	 * Sum of the log distances from `location` to each peer, with `swapped` assumed to sit at
	 * `swapped_location`
	 */
	double logDistanceProduct(double location, SimpleNode const & swapped, double swapped_location) const;
};

#endif //SMALL_WORLD_SIMPLE_NODE_HPP
