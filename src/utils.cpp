#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

std::vector<unsigned long> DistributionUtils::sortedBuckets(std::vector<unsigned> frequency, unsigned buckets) {
	if (buckets == 0 || frequency.size() % buckets != 0)
		throw std::invalid_argument("tally of " + std::to_string(frequency.size()) + " does not split into " + std::to_string(buckets) + " buckets");

	std::sort(frequency.begin(), frequency.end());

	size_t per_bucket = frequency.size() / buckets;
	std::vector<unsigned long> pdf(buckets, 0);
	for (size_t i { 0 }; i < frequency.size(); i++)
		pdf.at(i / per_bucket) += frequency[i];

	return pdf; // NRVO
}
