#ifndef SMALL_WORLD_ARRAY_STATS_HPP
#define SMALL_WORLD_ARRAY_STATS_HPP

#include <vector>

/**
 * Descriptive moments of a sample. Standard deviation is the population one, kurtosis is excess
 * kurtosis (0 for a normal distribution). Empty samples and zero spread give 0 for the
 * higher moments.
 */
struct ArrayStats {
	double mean, stdDev, skewness, kurtosis;

	ArrayStats() : mean(0.0), stdDev(0.0), skewness(0.0), kurtosis(0.0)
	{}

	template<class T>
	static ArrayStats of(std::vector<T> const & values)
	{
		std::vector<double> converted(values.begin(), values.end());
		return compute(converted);
	}

private:
	static ArrayStats compute(std::vector<double> const & values);
};

#endif //SMALL_WORLD_ARRAY_STATS_HPP
