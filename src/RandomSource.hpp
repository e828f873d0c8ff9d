#ifndef SMALL_WORLD_RANDOM_SOURCE_HPP
#define SMALL_WORLD_RANDOM_SOURCE_HPP

#include <cstdint>
#include <boost/random/mersenne_twister.hpp>

/**
 * Seeded randomness (64 bit Mersenne twister) shared by generation, nodes and the darknet simulation.
 * Runs are reproducible for a given seed as long as calls happen in the same order.
 */
class RandomSource {
public:
	typedef boost::random::mt19937_64 Engine;

private:
	Engine engine_;

public:
	explicit RandomSource(uint32_t seed) : engine_(seed)
	{}

	RandomSource(const RandomSource& that) = delete;

	/**
	 * @return uniform double in [0, 1), from one 64 bit draw
	 */
	double uniformDouble();

	/**
	 * @return uniform integer in [0, bound). bound must be positive
	 */
	unsigned uniformInt(unsigned bound);

	bool uniformBool();

	Engine & engine()
	{
		return engine_;
	}
};

#endif //SMALL_WORLD_RANDOM_SOURCE_HPP
