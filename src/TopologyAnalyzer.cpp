#include "TopologyAnalyzer.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/connected_components.hpp>

std::vector<int> TopologyAnalyzer::degrees() const
{
	std::vector<int> d(graph_.size());
	for (unsigned i { 0 }; i < graph_.size(); i++)
		d[i] = graph_.node(i).degree();
	return d;
}

int TopologyAnalyzer::minDegree() const
{
	if (graph_.size() == 0)
		return 0;

	std::vector<int> d = degrees();
	return *std::min_element(d.begin(), d.end());
}

int TopologyAnalyzer::maxDegree() const
{
	if (graph_.size() == 0)
		return 0;

	std::vector<int> d = degrees();
	return *std::max_element(d.begin(), d.end());
}

double TopologyAnalyzer::meanDegree() const
{
	if (graph_.size() == 0)
		return 0.0;

	long degree_sum = { 0 };
	for (unsigned i { 0 }; i < graph_.size(); i++)
		degree_sum += graph_.node(i).degree();
	return double(degree_sum) / graph_.size();
}

double TopologyAnalyzer::degreeVariance() const
{
	long sum_degrees = { 0 };
	long sum_square_degrees = { 0 };
	long n = long(graph_.size());
	if (n == 0)
		return 0.0;

	for (unsigned i { 0 }; i < graph_.size(); i++) {
		long d = graph_.node(i).degree();
		sum_degrees += d;
		sum_square_degrees += d * d;
	}

	return double(sum_square_degrees) / double(n) - double(sum_degrees * sum_degrees) / double(n * n);
}

std::vector<double> TopologyAnalyzer::edgeLengths() const
{
	std::vector<double> lengths;
	lengths.reserve(graph_.nEdges());

	for (unsigned i { 0 }; i < graph_.size(); i++) {
		SimpleNode const & node = graph_.node(i);
		assert(node.index() == i);
		for (auto peer : node.connections()) {
			assert(peer->index() != i);
			// A one-sided reference to a lower index has no lower end to be emitted from
			if (peer->index() < i && peer->isConnected(node))
				continue;
			lengths.push_back(node.distanceToLoc(peer->location()));
		}
	}

	assert(lengths.size() == graph_.nEdges());
	return lengths;
}

std::vector<double> TopologyAnalyzer::localClusterCoeffs() const
{
	std::vector<double> cc(graph_.size());
	for (unsigned i { 0 }; i < graph_.size(); i++)
		cc[i] = graph_.node(i).localClusterCoeff();
	return cc;
}

double TopologyAnalyzer::meanLocalClusterCoeff() const
{
	unsigned n = graph_.size();
	if (n == 0)
		return 0.0;

	double sum_coeff = { 0.0 };
	for (unsigned i { 0 }; i < n; i++)
		sum_coeff += graph_.node(i).localClusterCoeff();

	double mean = sum_coeff / n;
	assert(mean >= 0.0 && mean <= 1.0);
	return mean;
}

double TopologyAnalyzer::globalClusterCoeff() const
{
	long closed = { 0 };
	long total = { 0 };

	for (unsigned i { 0 }; i < graph_.size(); i++) {
		SimpleNode const & node = graph_.node(i);
		long d = node.degree();
		closed += node.closedTriplets();
		total += (d * (d - 1)) / 2;
	}

	if (total == 0)
		return 0.0;
	return double(closed) / double(total);
}

unsigned TopologyAnalyzer::componentCount() const
{
	typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS> BGLGraph;

	BGLGraph g(graph_.size());
	// Every reference counts, so one-sided shortcuts connect as well
	for (unsigned i { 0 }; i < graph_.size(); i++) {
		for (auto peer : graph_.node(i).connections())
			boost::add_edge(boost::vertex(i, g), boost::vertex(peer->index(), g), g);
	}

	std::vector<int> component(boost::num_vertices(g));
	if (component.empty())
		return 0;
	return unsigned(boost::connected_components(g, &component[0]));
}

TopologyAnalyzer::GraphStats TopologyAnalyzer::graphStats() const
{
	GraphStats stats;
	stats.size = graph_.size();
	stats.edges = graph_.nEdges();
	stats.minDegree = minDegree();
	stats.maxDegree = maxDegree();
	stats.globalClusterCoeff = globalClusterCoeff();
	stats.clustering = ArrayStats::of(localClusterCoeffs());
	stats.degree = ArrayStats::of(degrees());
	return stats;
}

void TopologyAnalyzer::printGraphStats(std::ostream & out, bool verbose) const
{
	if (verbose) {
		out << "Graph stats:" << std::endl;
		out << "Size:\t\t\t\t\t" << graph_.size() << std::endl;
		out << "Edges:\t\t\t\t\t" << graph_.nEdges() << std::endl;
		out << "Min degree:\t\t\t\t" << minDegree() << std::endl;
		out << "Max degree:\t\t\t\t" << maxDegree() << std::endl;
		out << "Mean degree:\t\t\t\t" << meanDegree() << std::endl;
		out << "Degree stddev:\t\t\t\t" << std::sqrt(degreeVariance()) << std::endl;
		out << "Mean local clustering coefficient:\t" << meanLocalClusterCoeff() << std::endl;
		out << "Global clustering coefficient:\t\t" << globalClusterCoeff() << std::endl;
		out << std::endl;
	} else {
		GraphStats stats = graphStats();
		out << stats.size << "\t" << stats.edges << "\t" << stats.minDegree << "\t" << stats.maxDegree << "\t" << stats.globalClusterCoeff << "\t"
			<< stats.clustering.mean << "\t" << stats.clustering.stdDev << "\t" << stats.clustering.skewness << "\t" << stats.clustering.kurtosis << "\t"
			<< stats.degree.mean << "\t" << stats.degree.stdDev << "\t" << stats.degree.skewness << "\t" << stats.degree.kurtosis << std::endl;
	}
}

void TopologyAnalyzer::printGraphStatsHeader(std::ostream & out)
{
	out << "nNodes\tnEdges\tminDegree\tmaxDegree\tglobalClusterCoeff\tlocalCCMean\tlocalCCStdDev\tlocalCCSkew\tlocalCCKurtosis\t"
		<< "degreeMean\tdegreeStdDev\tdegreeSkew\tdegreeKurtosis" << std::endl;
}
