#ifndef SMALL_WORLD_DEGREE_SOURCE_HPP
#define SMALL_WORLD_DEGREE_SOURCE_HPP

#include "RandomSource.hpp"
#include "WeightedDistribution.hpp"

/**
 * Supplies the target degree of each node, once per node at placement time.
 */
class DegreeSource {
public:
	virtual ~DegreeSource() {}

	virtual int nextDegree() = 0;
};

class FixedDegreeSource : public DegreeSource {
	int degree_;

public:
	explicit FixedDegreeSource(int degree);

	int nextDegree() override
	{
		return degree_;
	}
};

class PoissonDegreeSource : public DegreeSource {
	double mean_;
	RandomSource & random_;

public:
	PoissonDegreeSource(double mean, RandomSource & random);

	int nextDegree() override;
};

/**
 * Follows a recorded degree distribution, e.g. one measured on a live network.
 */
class ConformingDegreeSource : public DegreeSource {
	WeightedDistribution const & distribution_;
	RandomSource & random_;

public:
	ConformingDegreeSource(WeightedDistribution const & distribution, RandomSource & random) :
			distribution_(distribution), random_(random)
	{}

	int nextDegree() override
	{
		return distribution_.randomValue(random_);
	}
};

#endif //SMALL_WORLD_DEGREE_SOURCE_HPP
