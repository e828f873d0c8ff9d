#include "LinkLengthSource.hpp"
#include <cmath>
#include <stdexcept>

InverseLinkLengthSource::InverseLinkLengthSource(unsigned n) : min_length_(0.0), max_length_(0.5)
{
	if (n < 2)
		throw std::invalid_argument("inverse link lengths need at least two nodes");
	min_length_ = 1.0 / n;
}

double InverseLinkLengthSource::sampleLength(RandomSource & random)
{
	// Inverse CDF of p(l) ~ 1/l on [min, max]
	return min_length_ * std::pow(max_length_ / min_length_, random.uniformDouble());
}
