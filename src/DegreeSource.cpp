#include "DegreeSource.hpp"
#include <stdexcept>
#include <boost/random/poisson_distribution.hpp>

FixedDegreeSource::FixedDegreeSource(int degree) : degree_(degree)
{
	if (degree_ < 0)
		throw std::invalid_argument("degree must not be negative");
}

PoissonDegreeSource::PoissonDegreeSource(double mean, RandomSource & random) : mean_(mean), random_(random)
{
	if (!(mean_ > 0.0))
		throw std::invalid_argument("Poisson mean degree must be positive");
}

int PoissonDegreeSource::nextDegree()
{
	boost::random::poisson_distribution<int, double> dist(mean_);
	return dist(random_.engine());
}
