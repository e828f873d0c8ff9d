#ifndef SMALL_WORLD_WEIGHTED_INDEX_SAMPLER_HPP
#define SMALL_WORLD_WEIGHTED_INDEX_SAMPLER_HPP

#include <vector>
#include <cmath>
#include <cassert>
#include <stdexcept>
#include <algorithm>
#include "RandomSource.hpp"

/**
 * Weighted discrete sampling by nearest lookup in a non-decreasing array.
 *
 * A cumulative weight table S is searched for a draw x in [0, S[n-1]]; the index whose
 * cumulative value is closest to x is chosen. Steep parts of S (heavy weights) cover
 * more of the draw range, so their indices come up proportionally more often.
 */
namespace WeightedIndexSampler {

	/**
	 * @param sorted Non-decreasing under key
	 * @param x Value to look up
	 * @param key Projection from element to the searched value
	 * @return Index i minimizing |key(sorted[i]) - x|. Exact hits return the first equal element,
	 * ties between two neighbours keep the greater one.
	 */
	template<class T, class Key>
	unsigned closestIndex(std::vector<T> const & sorted, double x, Key key)
	{
		if (sorted.empty())
			throw std::invalid_argument("closestIndex on an empty array");

		auto found = std::lower_bound(sorted.begin(), sorted.end(), x,
				[&key](T const & element, double value) { return key(element) < value; });
		unsigned n = unsigned(sorted.size());
		unsigned idx = unsigned(found - sorted.begin());

		if (idx < n && key(sorted[idx]) == x)
			return idx;

		// Insertion point past the end: everything is smaller
		if (idx >= n)
			idx = n - 1;

		// idx is the first greater element, but the lesser one might be closer
		if (idx > 0 && std::fabs(x - key(sorted[idx - 1])) < std::fabs(x - key(sorted[idx])))
			idx--;

		assert(idx == 0 || std::fabs(x - key(sorted[idx])) <= std::fabs(x - key(sorted[idx - 1])));
		assert(idx == n - 1 || std::fabs(x - key(sorted[idx])) <= std::fabs(x - key(sorted[idx + 1])));
		return idx;
	}

	inline unsigned closestIndex(std::vector<double> const & sorted, double x)
	{
		return closestIndex(sorted, x, [](double value) { return value; });
	}

	/**
	 * Draw x = U(0, 1) * total and pick the closest index of the table
	 */
	inline unsigned sampleIndex(std::vector<double> const & cdf, RandomSource & random)
	{
		if (cdf.empty())
			throw std::invalid_argument("sampleIndex on an empty table");

		double norm = cdf.back();
		double x = random.uniformDouble() * norm;
		assert(x <= norm);
		return closestIndex(cdf, x);
	}

	/**
	 * Non-normalized CDF of 1/distance probabilities by node index, seen from `source`.
	 * The source keeps its slot with zero weight so indices line up with the node array.
	 */
	std::vector<double> inverseDistanceCdf(std::vector<double> const & locations, unsigned source);
}

#endif //SMALL_WORLD_WEIGHTED_INDEX_SAMPLER_HPP
