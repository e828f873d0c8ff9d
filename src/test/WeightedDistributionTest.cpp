#include <gtest/gtest.h>
#include <sstream>
#include <map>
#include "../WeightedDistribution.hpp"
#include "../DegreeSource.hpp"

TEST(WeightedDistributionTest, FrequenciesFollowOccurrences) {
	std::istringstream table("10 1\n20 3\n30 1\n");
	WeightedDistribution distribution = WeightedDistribution::fromStream(table);
	ASSERT_EQ(5u, distribution.totalOccurrences());

	RandomSource random(2013);
	std::map<int, unsigned> counts;
	const unsigned draws = 100000;
	for (unsigned i = 0; i < draws; i++)
		counts[distribution.randomValue(random)]++;

	ASSERT_EQ(3u, counts.size());
	EXPECT_NEAR(0.2, double(counts[10]) / draws, 0.01);
	EXPECT_NEAR(0.6, double(counts[20]) / draws, 0.01);
	EXPECT_NEAR(0.2, double(counts[30]) / draws, 0.01);
}

TEST(WeightedDistributionTest, ZeroOccurrencesAreNeverDrawn) {
	std::vector<WeightedDistribution::Event> events = { { 1, 0 }, { 2, 5 }, { 3, 0 } };
	WeightedDistribution distribution(events);
	RandomSource random(5);
	for (int i = 0; i < 1000; i++)
		ASSERT_EQ(2, distribution.randomValue(random));
}

TEST(WeightedDistributionTest, SkipsBlankLines) {
	std::istringstream table("4 2\n\n  \n8 6\n");
	WeightedDistribution distribution = WeightedDistribution::fromStream(table);
	ASSERT_EQ(2u, distribution.events().size());
	EXPECT_EQ(8, distribution.events()[1].value);
	EXPECT_EQ(8u, distribution.totalOccurrences());
}

TEST(WeightedDistributionTest, RejectsBadTables) {
	std::istringstream malformed("10 1\n20\n");
	EXPECT_THROW(WeightedDistribution::fromStream(malformed), std::runtime_error);

	std::istringstream extra("10 1 5\n");
	EXPECT_THROW(WeightedDistribution::fromStream(extra), std::runtime_error);

	std::istringstream too_large("4294967296 1\n");
	EXPECT_THROW(WeightedDistribution::fromStream(too_large), std::runtime_error);

	std::istringstream too_small("-2147483649 1\n");
	EXPECT_THROW(WeightedDistribution::fromStream(too_small), std::runtime_error);

	std::istringstream negative("10 -1\n");
	EXPECT_THROW(WeightedDistribution::fromStream(negative), std::invalid_argument);

	std::istringstream empty("");
	EXPECT_THROW(WeightedDistribution::fromStream(empty), std::invalid_argument);

	std::vector<WeightedDistribution::Event> nothing = { { 1, 0 } };
	EXPECT_THROW(WeightedDistribution distribution(nothing), std::invalid_argument);
	EXPECT_THROW(WeightedDistribution::fromFile("/nonexistent/degree-distribution.txt"), std::runtime_error);
}

TEST(DegreeSourceTest, FixedAlwaysGivesTheSameDegree) {
	FixedDegreeSource degrees(6);
	for (int i = 0; i < 10; i++)
		EXPECT_EQ(6, degrees.nextDegree());

	EXPECT_THROW(FixedDegreeSource negative(-1), std::invalid_argument);
}

TEST(DegreeSourceTest, PoissonMeanMatches) {
	RandomSource random(99);
	PoissonDegreeSource degrees(12.0, random);

	double sum = 0.0;
	const int draws = 20000;
	for (int i = 0; i < draws; i++) {
		int d = degrees.nextDegree();
		ASSERT_GE(d, 0);
		sum += d;
	}
	EXPECT_NEAR(12.0, sum / draws, 0.15);

	EXPECT_THROW(PoissonDegreeSource flat(0.0, random), std::invalid_argument);
}

TEST(DegreeSourceTest, ConformingFollowsTheDistribution) {
	std::vector<WeightedDistribution::Event> events = { { 3, 1 }, { 7, 1 } };
	WeightedDistribution distribution(events);
	RandomSource random(4);
	ConformingDegreeSource degrees(distribution, random);

	unsigned threes = 0;
	for (int i = 0; i < 10000; i++) {
		int d = degrees.nextDegree();
		ASSERT_TRUE(d == 3 || d == 7);
		if (d == 3)
			threes++;
	}
	EXPECT_NEAR(0.5, threes / 10000.0, 0.03);
}
