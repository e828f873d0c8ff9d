#include "WeightedIndexSampler.hpp"
#include "Location.hpp"

std::vector<double> WeightedIndexSampler::inverseDistanceCdf(std::vector<double> const & locations, unsigned source)
{
	assert(source < locations.size());

	std::vector<double> cdf(locations.size());
	double norm = 0.0;
	for (unsigned j { 0 }; j < locations.size(); j++) {
		double distance = Location::distance(locations[source], locations[j]);
		// The source and anything sharing its location get no weight
		if (j != source && distance > 0.0)
			norm += 1.0 / distance;
		cdf[j] = norm;
		// CDF must be non-decreasing
		assert(j == 0 || cdf[j] >= cdf[j - 1]);
	}

	return cdf; // NRVO
}
