#include "RandomSource.hpp"
#include <stdexcept>
#include <boost/random/uniform_01.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/bernoulli_distribution.hpp>

double RandomSource::uniformDouble()
{
	boost::random::uniform_01<double> dist;
	return dist(engine_);
}

unsigned RandomSource::uniformInt(unsigned bound)
{
	if (bound == 0)
		throw std::invalid_argument("uniformInt bound must be positive");

	boost::random::uniform_int_distribution<unsigned> dist(0, bound - 1);
	return dist(engine_);
}

bool RandomSource::uniformBool()
{
	boost::random::bernoulli_distribution<> dist(0.5);
	return dist(engine_);
}
