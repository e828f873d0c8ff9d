#include <gtest/gtest.h>
#include <stdexcept>
#include "../SimpleNode.hpp"
#include "../Location.hpp"

TEST(LocationTest, DistanceWrapsAroundTheRing) {
	EXPECT_NEAR(0.2, Location::distance(0.1, 0.3), 1e-12);
	EXPECT_NEAR(0.2, Location::distance(0.1, 0.9), 1e-12);
	EXPECT_DOUBLE_EQ(0.5, Location::distance(0.0, 0.5));
	EXPECT_DOUBLE_EQ(0.0, Location::distance(0.42, 0.42));
}

TEST(SimpleNodeTest, ConnectIsReciprocal) {
	RandomSource random(1);
	SimpleNode a(0, 0.1, 1, &random), b(1, 0.2, 2, &random);

	a.connect(b);
	EXPECT_TRUE(a.isConnected(b));
	EXPECT_TRUE(b.isConnected(a));
	EXPECT_EQ(1, a.degree());
	EXPECT_EQ(1, b.degree());
	EXPECT_TRUE(a.atDegree());
	EXPECT_FALSE(b.atDegree());
}

TEST(SimpleNodeTest, ConnectRejectsSelfAndDuplicates) {
	RandomSource random(1);
	SimpleNode a(0, 0.1, 1, &random), b(1, 0.2, 1, &random);

	EXPECT_THROW(a.connect(a), std::logic_error);
	a.connect(b);
	EXPECT_THROW(a.connect(b), std::logic_error);
	EXPECT_THROW(b.connect(a), std::logic_error);
	EXPECT_EQ(1, a.degree());
}

TEST(SimpleNodeTest, ConnectOutgoingIsOneSided) {
	RandomSource random(1);
	SimpleNode a(0, 0.1, 1, &random), b(1, 0.2, 1, &random);

	a.connectOutgoing(b);
	EXPECT_TRUE(a.isConnected(b));
	EXPECT_FALSE(b.isConnected(a));
	EXPECT_EQ(0, b.degree());
}

TEST(SimpleNodeTest, ConnectionsKeepInsertionOrder) {
	RandomSource random(1);
	SimpleNode hub(0, 0.0, 3, &random), x(1, 0.3, 1, &random), y(2, 0.1, 1, &random), z(3, 0.2, 1, &random);

	hub.connect(x);
	hub.connect(y);
	hub.connect(z);
	ASSERT_EQ(3u, hub.connections().size());
	EXPECT_EQ(&x, hub.connections()[0]);
	EXPECT_EQ(&y, hub.connections()[1]);
	EXPECT_EQ(&z, hub.connections()[2]);
}

TEST(SimpleNodeTest, Distances) {
	RandomSource random(1);
	SimpleNode a(0, 0.05, 1, &random), b(1, 0.95, 1, &random);

	EXPECT_NEAR(0.1, a.distanceTo(b), 1e-12);
	EXPECT_NEAR(0.1, b.distanceTo(a), 1e-12);
	EXPECT_NEAR(0.45, a.distanceToLoc(0.5), 1e-12);
}

TEST(SimpleNodeTest, ClusteringOfATriangleWithATail) {
	RandomSource random(1);
	SimpleNode a(0, 0.0, 3, &random), b(1, 0.1, 2, &random), c(2, 0.2, 2, &random), tail(3, 0.3, 1, &random);

	a.connect(b);
	b.connect(c);
	c.connect(a);
	a.connect(tail);

	EXPECT_EQ(1, a.closedTriplets());
	EXPECT_NEAR(1.0 / 3.0, a.localClusterCoeff(), 1e-12);
	EXPECT_EQ(1, b.closedTriplets());
	EXPECT_DOUBLE_EQ(1.0, b.localClusterCoeff());
	// Below degree 2 there is nothing to close
	EXPECT_EQ(0, tail.closedTriplets());
	EXPECT_DOUBLE_EQ(0.0, tail.localClusterCoeff());
}

TEST(SimpleNodeTest, RandomWalkStaysWithoutPeersOrHops) {
	RandomSource random(1);
	SimpleNode lonely(0, 0.5, 1, &random), a(1, 0.1, 1, &random), b(2, 0.2, 1, &random);
	a.connect(b);

	EXPECT_EQ(&lonely, &lonely.randomWalk(10, true, random));
	EXPECT_EQ(&a, &a.randomWalk(0, true, random));
	EXPECT_EQ(&b, &a.randomWalk(1, true, random));
	EXPECT_EQ(&a, &a.randomWalk(2, true, random));
	// Equal degrees, so corrected hops are never rejected
	EXPECT_EQ(&b, &a.randomWalk(3, false, random));
}

TEST(SimpleNodeTest, CorrectedWalkHoldsBackFromHubs) {
	RandomSource random(21);
	SimpleNode hub(0, 0.0, 4, &random);
	SimpleNode l1(1, 0.2, 1, &random), l2(2, 0.4, 1, &random), l3(3, 0.6, 1, &random), l4(4, 0.8, 1, &random);
	hub.connect(l1);
	hub.connect(l2);
	hub.connect(l3);
	hub.connect(l4);

	// A leaf moves to the hub with probability 1/4 per hop
	unsigned moved = 0;
	const unsigned walks = 8000;
	for (unsigned i = 0; i < walks; i++) {
		if (&l1.randomWalk(1, false, random) == &hub)
			moved++;
	}
	EXPECT_NEAR(0.25, double(moved) / walks, 0.03);

	// Uniform walks always move
	for (unsigned i = 0; i < 100; i++)
		ASSERT_EQ(&hub, &l1.randomWalk(1, true, random));
}

TEST(SimpleNodeTest, SwapWithItselfIsRefused) {
	RandomSource random(1);
	SimpleNode a(0, 0.3, 1, &random);
	EXPECT_FALSE(a.attemptSwap(a));
	EXPECT_DOUBLE_EQ(0.3, a.location());
}

TEST(SimpleNodeTest, SwapThatShortensLinksIsAccepted) {
	RandomSource random(1);
	SimpleNode a(0, 0.1, 1, &random), c(1, 0.8, 1, &random);
	SimpleNode b(2, 0.7, 1, &random), d(3, 0.2, 1, &random);
	a.connect(c);
	b.connect(d);

	// 0.3 * 0.5 before, 0.1 * 0.1 after
	EXPECT_TRUE(a.attemptSwap(b));
	EXPECT_DOUBLE_EQ(0.7, a.location());
	EXPECT_DOUBLE_EQ(0.1, b.location());
}

TEST(SimpleNodeTest, SwapThatStretchesLinksIsMostlyRefused) {
	RandomSource random(77);
	unsigned accepted = 0;
	const unsigned trials = 4000;

	for (unsigned i = 0; i < trials; i++) {
		SimpleNode a(0, 0.7, 1, &random), c(1, 0.8, 1, &random);
		SimpleNode b(2, 0.1, 1, &random), d(3, 0.2, 1, &random);
		a.connect(c);
		b.connect(d);

		// Accepted with probability (0.1 * 0.1) / (0.3 * 0.5)
		if (a.attemptSwap(b))
			accepted++;
	}
	EXPECT_NEAR(0.01 / 0.15, double(accepted) / trials, 0.02);
}

TEST(SimpleNodeTest, SwapBetweenPeersKeepsTheirMutualDistance) {
	RandomSource random(1);
	SimpleNode a(0, 0.1, 2, &random), b(1, 0.2, 2, &random);
	SimpleNode x(2, 0.25, 1, &random), y(3, 0.05, 1, &random);
	a.connect(b);
	a.connect(x);
	b.connect(y);

	// a-x and b-y both get shorter, a-b stays the same
	EXPECT_TRUE(a.attemptSwap(b));
	EXPECT_DOUBLE_EQ(0.2, a.location());
	EXPECT_DOUBLE_EQ(0.1, b.location());
}
