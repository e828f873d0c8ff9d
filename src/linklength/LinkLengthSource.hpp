#ifndef SMALL_WORLD_LINK_LENGTH_SOURCE_HPP
#define SMALL_WORLD_LINK_LENGTH_SOURCE_HPP

#include "../RandomSource.hpp"
#include "../SimpleNode.hpp"

/**
 * Continuous link length strategy: the builder matches each drawn length against the sorted
 * distances from the source node.
 */
class LinkLengthSource {
public:
	virtual ~LinkLengthSource() {}

	/**
	 * @return Ring distance in [0, 0.5]
	 */
	virtual double sampleLength(RandomSource & random) = 0;
};

/**
 * Discrete strategy: picks the destination node directly.
 */
class PeerSource {
public:
	virtual ~PeerSource() {}

	virtual SimpleNode & samplePeer(SimpleNode const & from, RandomSource & random) = 0;
};

/**
 * Lengths with density proportional to 1/length between the closest possible neighbour of an
 * evenly spaced ring of `n` nodes and the far side of the ring.
 */
class InverseLinkLengthSource : public LinkLengthSource {
	double min_length_, max_length_;

public:
	explicit InverseLinkLengthSource(unsigned n);

	double sampleLength(RandomSource & random) override;
};

class UniformLinkLengthSource : public LinkLengthSource {
public:
	double sampleLength(RandomSource & random) override
	{
		return 0.5 * random.uniformDouble();
	}
};

#endif //SMALL_WORLD_LINK_LENGTH_SOURCE_HPP
