#ifndef SMALL_WORLD_UTILS_HPP
#define SMALL_WORLD_UTILS_HPP

#include <vector>
#include <iostream>
#include <chrono>
#include <string>
#include <functional>

template<typename OutStream, typename T>
OutStream& operator<< (OutStream& out, const std::vector<T>& v)
{
	for (auto const& tmp : v)
		out << tmp << ", ";
	return out;
}

namespace TimeUtils {
	template<class T>
	inline T measure(std::function<T()> timeable, double &timer) {
		auto start = std::chrono::high_resolution_clock::now();

		T res = timeable();

		std::chrono::duration<double> diff = std::chrono::high_resolution_clock::now() - start;
		timer = diff.count();

		return res;
	}

	template<>
	inline void measure(std::function<void()> timeable, double &timer) {
		auto start = std::chrono::high_resolution_clock::now();

		timeable();

		std::chrono::duration<double> diff = std::chrono::high_resolution_clock::now() - start;
		timer = diff.count();
	}
}

namespace DebugUtils {
	/**
	 * Diagnostics that only show up in SMALL_WORLD_DEBUG builds
	 */
	inline void print(std::function<void(std::ostream &)> lambda) {
#ifdef SMALL_WORLD_DEBUG
		lambda(std::cout);
		std::cout << std::endl;
#else
		(void) lambda;
#endif
	}
}

namespace DistributionUtils {
	/**
	 * Sort a frequency tally and sum it into `buckets` equally sized buckets, giving a
	 * comparable shape regardless of which nodes got which counts.
	 * The tally size has to be a multiple of `buckets`.
	 */
	std::vector<unsigned long> sortedBuckets(std::vector<unsigned> frequency, unsigned buckets);
}

#endif //SMALL_WORLD_UTILS_HPP
