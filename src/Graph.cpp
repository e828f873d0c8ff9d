#include "Graph.hpp"
#include "WeightedIndexSampler.hpp"
#include <algorithm>
#include <stdexcept>
#include <cassert>
#include <cmath>
#include <string>

constexpr double Graph::RejectProbability;
constexpr unsigned long Graph::AttemptsPerNode;

namespace {
	struct DistanceEntry {
		double distance;
		unsigned index;

		inline bool operator<(DistanceEntry const & other) const {
			return distance < other.distance;
		}
	};
}

Graph::Graph(int n)
{
	if (n <= 0)
		throw std::invalid_argument("Must have positive nodes.");
	nodes_.reserve(unsigned(n));
}

void Graph::generateNodes(GraphParam const & param, RandomSource & random, DegreeSource & degrees)
{
	locations_.resize(unsigned(param.n));
	for (unsigned i { 0 }; i < locations_.size(); i++)
		locations_[i] = param.fastGeneration ? double(i) / param.n : random.uniformDouble();

	std::sort(locations_.begin(), locations_.end());

	// Redraw collisions so every pair of nodes is a positive distance apart
	while (std::adjacent_find(locations_.begin(), locations_.end()) != locations_.end()) {
		auto duplicate = std::adjacent_find(locations_.begin(), locations_.end());
		*duplicate = random.uniformDouble();
		std::sort(locations_.begin(), locations_.end());
	}

	for (unsigned i { 0 }; i < locations_.size(); i++)
		nodes_.emplace_back(new SimpleNode(i, locations_[i], degrees.nextDegree(), &random));
}

Graph Graph::fromNodes(std::vector<double> const & locations, std::vector<int> const & target_degrees, RandomSource & random)
{
	if (locations.size() != target_degrees.size())
		throw std::invalid_argument("every node needs a location and a target degree");

	Graph g(int(locations.size()));
	g.locations_ = locations;
	for (unsigned i { 0 }; i < locations.size(); i++)
		g.nodes_.emplace_back(new SimpleNode(i, locations[i], target_degrees[i], &random));

	// Files written after darknet swaps are no longer in location order
	std::sort(g.locations_.begin(), g.locations_.end());
	return g;
}

bool Graph::tryConnect(SimpleNode & src, SimpleNode & dest, RandomSource & random)
{
	if (&src == &dest || src.isConnected(dest))
		return false;
	if (dest.atDegree() && random.uniformDouble() < RejectProbability)
		return false;

	src.connect(dest);
	return true;
}

template<class Draw>
void Graph::fillDegree(SimpleNode & src, RandomSource & random, Draw draw)
{
	unsigned long limit = AttemptsPerNode * nodes_.size();
	unsigned long attempts = { 0 };

	while (!src.atDegree()) {
		// Already connected to everybody else
		if (src.degree() >= int(nodes_.size()) - 1)
			break;

		if (++attempts > limit)
			throw std::runtime_error("generation stalled: node " + std::to_string(src.index())
					+ " still has degree " + std::to_string(src.degree())
					+ " of " + std::to_string(src.targetDegree()) + " after " + std::to_string(limit) + " attempts");

		tryConnect(src, draw(), random);
	}
}

Graph Graph::generateSandberg(GraphParam const & param, RandomSource & random)
{
	if (param.n < 4)
		throw std::invalid_argument("ring with shortcuts needs at least 4 nodes");

	Graph g(param.n);
	FixedDegreeSource degrees(3);
	g.generateNodes(param, random, degrees);
	unsigned n = g.size();

	// Base graph: X -- X - 1 mod N, made reciprocal by hand
	for (unsigned i { 0 }; i < n; i++) {
		unsigned wrapped = (i == 0) ? n - 1 : i - 1;
		g.node(i).connectOutgoing(g.node(wrapped));
		g.node(wrapped).connectOutgoing(g.node(i));
	}

	// One outgoing shortcut per node
	for (unsigned i { 0 }; i < n; i++) {
		unsigned other;
		do {
			other = random.uniformInt(n);
		} while (other == i || g.node(i).isConnected(g.node(other)));
		g.node(i).connectOutgoing(g.node(other));
	}

	return g;
}

Graph Graph::generateGraph(GraphParam const & param, RandomSource & random, DegreeSource & degrees, LinkLengthSource & lengths)
{
	Graph g(param.n);
	g.generateNodes(param, random, degrees);
	unsigned n = g.size();

	std::vector<DistanceEntry> distances(n);
	for (unsigned i { 0 }; i < n; i++) {
		SimpleNode & src = g.node(i);
		if (src.atDegree())
			continue;

		for (unsigned j { 0 }; j < n; j++)
			distances[j] = { src.distanceTo(g.node(j)), j };
		std::stable_sort(distances.begin(), distances.end());

		g.fillDegree(src, random, [&]() -> SimpleNode & {
			double length = lengths.sampleLength(random);
			unsigned idx = WeightedIndexSampler::closestIndex(distances, length,
					[](DistanceEntry const & entry) { return entry.distance; });
			return g.node(distances[idx].index);
		});
	}

	assert(g.degreeSum() % 2 == 0);
	return g;
}

Graph Graph::generate1dKleinbergGraph(GraphParam const & param, RandomSource & random, DegreeSource & degrees)
{
	Graph g(param.n);
	g.generateNodes(param, random, degrees);
	long n = long(g.size());

	for (long i { 0 }; i < n; i++) {
		SimpleNode & src = g.node(unsigned(i));
		if (src.atDegree())
			continue;

		if (param.fastGeneration) {
			// Evenly spaced and sorted by location, so an index offset is a consistent distance
			double max_steps = n / 2.0;
			g.fillDegree(src, random, [&]() -> SimpleNode & {
				long steps = std::lround(std::pow(max_steps, random.uniformDouble()));
				assert(steps >= 0 && steps <= n / 2 + 1);
				long idx = random.uniformBool() ? i + steps : i - steps;
				idx %= n;
				if (idx < 0)
					idx += n;
				return g.node(unsigned(idx));
			});
		} else {
			// Exact locations, reused for every attempt of this source
			std::vector<double> cdf = WeightedIndexSampler::inverseDistanceCdf(g.locations_, unsigned(i));
			g.fillDegree(src, random, [&]() -> SimpleNode & {
				return g.node(WeightedIndexSampler::sampleIndex(cdf, random));
			});
		}
	}

	assert(g.degreeSum() % 2 == 0);
	return g;
}

Graph Graph::placeNodes(GraphParam const & param, RandomSource & random, DegreeSource & degrees)
{
	Graph g(param.n);
	g.generateNodes(param, random, degrees);
	return g;
}

void Graph::connectPeers(PeerSource & peers, RandomSource & random)
{
	for (auto & src : nodes_) {
		if (src->atDegree())
			continue;

		fillDegree(*src, random, [&]() -> SimpleNode & {
			return peers.samplePeer(*src, random);
		});
	}

	assert(degreeSum() % 2 == 0);
}

std::vector<double> Graph::currentLocations() const
{
	std::vector<double> current;
	current.reserve(nodes_.size());
	for (auto const & node : nodes_)
		current.push_back(node->location());
	return current; // NRVO
}

unsigned Graph::degreeSum() const
{
	unsigned degree_sum = { 0 };
	for (auto const & node : nodes_)
		degree_sum += unsigned(node->degree());
	return degree_sum;
}

unsigned Graph::nEdges() const
{
	// Each reciprocal pair once from its lower end, each one-sided reference on its own
	unsigned edges = { 0 };
	for (auto const & node : nodes_) {
		for (auto peer : node->connections()) {
			if (peer->index() > node->index() || !peer->isConnected(*node))
				edges++;
		}
	}
	return edges;
}
