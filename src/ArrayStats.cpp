#include "ArrayStats.hpp"
#include <cmath>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/skewness.hpp>
#include <boost/accumulators/statistics/kurtosis.hpp>

namespace acc = boost::accumulators;

ArrayStats ArrayStats::compute(std::vector<double> const & values)
{
	ArrayStats stats;
	if (values.empty())
		return stats;

	acc::accumulator_set<double, acc::stats<acc::tag::mean, acc::tag::variance, acc::tag::skewness, acc::tag::kurtosis>> moments;
	for (double value : values)
		moments(value);

	stats.mean = acc::mean(moments);
	double variance = acc::variance(moments);
	stats.stdDev = std::sqrt(variance);

	// Skewness and kurtosis divide by powers of the variance
	if (variance > 0.0) {
		stats.skewness = acc::skewness(moments);
		stats.kurtosis = acc::kurtosis(moments);
	}

	return stats;
}
