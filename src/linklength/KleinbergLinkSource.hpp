#ifndef SMALL_WORLD_KLEINBERG_LINK_SOURCE_HPP
#define SMALL_WORLD_KLEINBERG_LINK_SOURCE_HPP

#include <vector>
#include <unordered_map>
#include "LinkLengthSource.hpp"

class Graph;

/**
 * Picks peers following the 1/d Kleinberg distribution over the exact node locations.
 *
 * The cumulative weight table of a node is built on its first draw (O(n)) and memoized, so
 * later draws for the same node are a binary search. Tables are keyed by node index and are
 * never invalidated: the node set of a graph does not change once placed. The graph must
 * outlive the source.
 */
class KleinbergLinkSource : public PeerSource {
	Graph & graph_;
	std::unordered_map<unsigned, std::vector<double>> tables_;

public:
	explicit KleinbergLinkSource(Graph & graph) : graph_(graph)
	{}

	SimpleNode & samplePeer(SimpleNode const & from, RandomSource & random) override;

	size_t cachedTables() const
	{
		return tables_.size();
	}

	/**
	 * @return Memoized table of `from`, building it if needed
	 */
	std::vector<double> const & table(SimpleNode const & from);
};

#endif //SMALL_WORLD_KLEINBERG_LINK_SOURCE_HPP
