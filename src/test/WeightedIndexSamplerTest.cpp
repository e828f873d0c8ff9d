#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "../WeightedIndexSampler.hpp"
#include "../Location.hpp"

namespace {
	std::vector<double> cumulative(std::vector<double> const & weights)
	{
		std::vector<double> sums;
		double total = 0.0;
		for (double weight : weights) {
			total += weight;
			sums.push_back(total);
		}
		return sums;
	}
}

TEST(WeightedIndexSamplerTest, ExactHitsReturnTheirIndex) {
	std::vector<double> cdf = cumulative({ 1, 2, 3, 4 });

	EXPECT_EQ(0u, WeightedIndexSampler::closestIndex(cdf, 1.0));
	EXPECT_EQ(1u, WeightedIndexSampler::closestIndex(cdf, 3.0));
	EXPECT_EQ(2u, WeightedIndexSampler::closestIndex(cdf, 6.0));
	EXPECT_EQ(3u, WeightedIndexSampler::closestIndex(cdf, 10.0));
}

TEST(WeightedIndexSamplerTest, PicksTheCloserNeighbour) {
	std::vector<double> cdf = cumulative({ 1, 2, 3, 4 });

	EXPECT_EQ(0u, WeightedIndexSampler::closestIndex(cdf, 0.0));
	EXPECT_EQ(0u, WeightedIndexSampler::closestIndex(cdf, 1.9));
	EXPECT_EQ(1u, WeightedIndexSampler::closestIndex(cdf, 4.4));
	EXPECT_EQ(2u, WeightedIndexSampler::closestIndex(cdf, 4.6));
	// Halfway keeps the greater element
	EXPECT_EQ(1u, WeightedIndexSampler::closestIndex(cdf, 2.0));
	// Past the end clamps
	EXPECT_EQ(3u, WeightedIndexSampler::closestIndex(cdf, 11.0));
}

TEST(WeightedIndexSamplerTest, ResultIsAlwaysANearestMatch) {
	RandomSource random(7);
	std::vector<double> weights;
	for (int i = 0; i < 50; i++)
		weights.push_back(0.01 + random.uniformDouble());
	std::vector<double> cdf = cumulative(weights);

	for (int draw = 0; draw < 5000; draw++) {
		double x = random.uniformDouble() * cdf.back();
		unsigned chosen = WeightedIndexSampler::closestIndex(cdf, x);
		ASSERT_LT(chosen, cdf.size());

		for (unsigned j = 0; j < cdf.size(); j++)
			ASSERT_LE(std::fabs(cdf[chosen] - x), std::fabs(cdf[j] - x)) << "x = " << x << ", j = " << j;
	}
}

TEST(WeightedIndexSamplerTest, WorksThroughAKey) {
	struct Entry {
		double distance;
		unsigned index;
	};
	std::vector<Entry> entries = { { 0.0, 7 }, { 0.1, 3 }, { 0.3, 9 }, { 0.45, 1 } };

	unsigned idx = WeightedIndexSampler::closestIndex(entries, 0.28, [](Entry const & e) { return e.distance; });
	EXPECT_EQ(9u, entries[idx].index);
	idx = WeightedIndexSampler::closestIndex(entries, 0.5, [](Entry const & e) { return e.distance; });
	EXPECT_EQ(1u, entries[idx].index);
}

TEST(WeightedIndexSamplerTest, EmptyArrayIsRejected) {
	std::vector<double> empty;
	RandomSource random(1);
	EXPECT_THROW(WeightedIndexSampler::closestIndex(empty, 0.5), std::invalid_argument);
	EXPECT_THROW(WeightedIndexSampler::sampleIndex(empty, random), std::invalid_argument);
}

TEST(WeightedIndexSamplerTest, InverseDistanceCdfSkipsTheSource) {
	std::vector<double> locations = { 0.0, 0.25, 0.5, 0.75 };

	std::vector<double> from_first = WeightedIndexSampler::inverseDistanceCdf(locations, 0);
	ASSERT_EQ(4u, from_first.size());
	EXPECT_DOUBLE_EQ(0.0, from_first[0]);
	EXPECT_DOUBLE_EQ(4.0, from_first[1]);
	EXPECT_DOUBLE_EQ(6.0, from_first[2]);
	EXPECT_DOUBLE_EQ(10.0, from_first[3]);

	std::vector<double> from_middle = WeightedIndexSampler::inverseDistanceCdf(locations, 2);
	EXPECT_DOUBLE_EQ(2.0, from_middle[0]);
	EXPECT_DOUBLE_EQ(6.0, from_middle[1]);
	EXPECT_DOUBLE_EQ(6.0, from_middle[2]);
	EXPECT_DOUBLE_EQ(10.0, from_middle[3]);
}

TEST(WeightedIndexSamplerTest, InverseDistanceCdfGivesSharedLocationsNoWeight) {
	std::vector<double> locations = { 0.0, 0.25, 0.25, 0.5 };

	std::vector<double> cdf = WeightedIndexSampler::inverseDistanceCdf(locations, 1);
	EXPECT_DOUBLE_EQ(4.0, cdf[0]);
	EXPECT_DOUBLE_EQ(4.0, cdf[1]);
	EXPECT_DOUBLE_EQ(4.0, cdf[2]);
	EXPECT_DOUBLE_EQ(8.0, cdf[3]);

	RandomSource random(6);
	for (int i = 0; i < 1000; i++) {
		unsigned idx = WeightedIndexSampler::sampleIndex(cdf, random);
		EXPECT_LT(idx, 4u);
		EXPECT_NE(1u, idx);
	}
}

TEST(RandomSourceTest, DoublesHaveMoreThan32BitsOfResolution) {
	RandomSource random(1);
	int finer = 0;
	for (int i = 0; i < 1000; i++) {
		double scaled = std::ldexp(random.uniformDouble(), 32);
		if (scaled != std::floor(scaled))
			finer++;
	}
	EXPECT_GT(finer, 990);
}

TEST(WeightedIndexSamplerTest, InverseDistanceCdfIsNonDecreasing) {
	RandomSource random(3);
	std::vector<double> locations;
	for (int i = 0; i < 200; i++)
		locations.push_back(random.uniformDouble());

	std::vector<double> cdf = WeightedIndexSampler::inverseDistanceCdf(locations, 17);
	double total = 0.0;
	for (unsigned j = 0; j < locations.size(); j++) {
		if (j != 17)
			total += 1.0 / Location::distance(locations[17], locations[j]);
		if (j > 0)
			EXPECT_GE(cdf[j], cdf[j - 1]);
	}
	EXPECT_NEAR(total, cdf.back(), 1e-9 * total);
}

TEST(WeightedIndexSamplerTest, DrawsFollowTheNearestValueIntervals) {
	RandomSource random(11);
	std::vector<double> cdf = cumulative({ 1, 1, 100, 1, 1 });
	std::vector<unsigned> counts(cdf.size(), 0);
	const int draws = 20000;

	for (int draw = 0; draw < draws; draw++) {
		unsigned idx = WeightedIndexSampler::sampleIndex(cdf, random);
		ASSERT_LT(idx, cdf.size());
		counts[idx]++;
	}

	// Each index owns the draws between the midpoints to its neighbours
	std::vector<double> owned = { 1.5, 50.5, 50.5, 1.0, 0.5 };
	for (unsigned j = 0; j < counts.size(); j++)
		EXPECT_NEAR(owned[j] / cdf.back(), double(counts[j]) / draws, 0.015) << "index " << j;
}
