#ifndef SMALL_WORLD_LOCATION_HPP
#define SMALL_WORLD_LOCATION_HPP

#include <cmath>
#include <algorithm>

/**
 * Locations are points on the unit ring [0, 1).
 */
namespace Location {
	/**
	 * @return Ring distance between a and b, in [0, 0.5]
	 */
	inline double distance(double a, double b)
	{
		double direct = std::fabs(a - b);
		return std::min(direct, 1.0 - direct);
	}
}

#endif //SMALL_WORLD_LOCATION_HPP
