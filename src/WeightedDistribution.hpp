#ifndef SMALL_WORLD_WEIGHTED_DISTRIBUTION_HPP
#define SMALL_WORLD_WEIGHTED_DISTRIBUTION_HPP

#include <string>
#include <vector>
#include <istream>
#include "RandomSource.hpp"

/**
 * Replicates a recorded distribution of integer values: each value is drawn with probability
 * proportional to its number of occurrences.
 */
class WeightedDistribution {
public:
	struct Event {
		int value;
		unsigned long occurrences;
	};

private:
	std::vector<Event> events_;
	// Running occurrence sums, parallel to events_
	std::vector<unsigned long> cumulative_;

public:
	explicit WeightedDistribution(std::vector<Event> const & events);

	/**
	 * Reads "[value] [occurrences]" pairs, one per line
	 */
	static WeightedDistribution fromStream(std::istream & in);

	static WeightedDistribution fromFile(std::string const & filename);

	int randomValue(RandomSource & random) const;

	unsigned long totalOccurrences() const
	{
		return cumulative_.back();
	}

	std::vector<Event> const & events() const
	{
		return events_;
	}
};

#endif //SMALL_WORLD_WEIGHTED_DISTRIBUTION_HPP
