#include "GraphFile.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>
#include <cassert>

namespace {
	template<class T>
	T readValue(std::istream & in, char const * what)
	{
		T value;
		if (!(in >> value))
			throw std::runtime_error(std::string("truncated or malformed graph: expected ") + what);
		return value;
	}
}

void GraphFile::write(Graph const & graph, std::ostream & out)
{
	out << "# small world graph" << std::endl;
	out << graph.size() << std::endl;

	out << std::setprecision(std::numeric_limits<double>::max_digits10);
	for (unsigned i { 0 }; i < graph.size(); i++)
		out << graph.node(i).location() << " " << graph.node(i).targetDegree() << "\n";

	/*
	 * Each connection is written once, from its lower index end. A one-sided reference from a
	 * higher index (a ring shortcut) is written as the same unordered pair.
	 */
	std::vector<std::pair<unsigned, unsigned>> connections;
	for (unsigned i { 0 }; i < graph.size(); i++) {
		SimpleNode const & node = graph.node(i);
		for (auto peer : node.connections()) {
			if (peer->index() > i)
				connections.emplace_back(i, peer->index());
			else if (!peer->isConnected(node))
				connections.emplace_back(peer->index(), i);
		}
	}

	assert(connections.size() == graph.nEdges());
	std::cerr << "Writing " << connections.size() << " connections." << std::endl;
	out << connections.size() << "\n";
	for (auto const & connection : connections) {
		assert(connection.first < connection.second);
		out << connection.first << " " << connection.second << "\n";
	}
	out.flush();
}

void GraphFile::write(Graph const & graph, std::string const & path)
{
	std::ofstream file;
	file.exceptions(std::ofstream::failbit | std::ofstream::badbit);
	try {
		file.open(path, std::ios::out | std::ios::trunc);
		write(graph, file);
		file.close();
	} catch (std::ios_base::failure const & e) {
		throw std::runtime_error("Could not write to " + path + ": " + e.what());
	}
}

Graph GraphFile::read(std::istream & in, RandomSource & random)
{
	// Leading comment lines
	while (in >> std::ws && in.peek() == '#')
		in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

	long node_count = readValue<long>(in, "node count");
	if (node_count <= 0)
		throw std::runtime_error("graph must have positive nodes, got " + std::to_string(node_count));

	std::vector<double> locations(static_cast<size_t>(node_count));
	std::vector<int> targets(static_cast<size_t>(node_count));
	for (long i { 0 }; i < node_count; i++) {
		locations[i] = readValue<double>(in, "node location");
		targets[i] = readValue<int>(in, "node target degree");
		if (!(locations[i] >= 0.0 && locations[i] < 1.0))
			throw std::runtime_error("node " + std::to_string(i) + " has location outside [0, 1)");
	}

	std::vector<double> sorted(locations);
	std::sort(sorted.begin(), sorted.end());
	auto shared = std::adjacent_find(sorted.begin(), sorted.end());
	if (shared != sorted.end())
		throw std::runtime_error("two nodes share location " + std::to_string(*shared));

	Graph graph = Graph::fromNodes(locations, targets, random);

	long written_connections = readValue<long>(in, "edge count");
	if (written_connections < 0)
		throw std::runtime_error("negative edge count");
	std::cerr << "Reading " << written_connections << " connections." << std::endl;

	for (long i { 0 }; i < written_connections; i++) {
		long from = readValue<long>(in, "edge endpoint");
		long to = readValue<long>(in, "edge endpoint");
		if (from < 0 || to >= node_count || from >= to)
			throw std::runtime_error("invalid edge " + std::to_string(from) + " " + std::to_string(to));

		SimpleNode & a = graph.node(unsigned(from));
		SimpleNode & b = graph.node(unsigned(to));
		if (a.isConnected(b))
			throw std::runtime_error("duplicate edge " + std::to_string(from) + " " + std::to_string(to));
		a.connect(b);
	}

	return graph;
}

Graph GraphFile::read(std::string const & path, RandomSource & random)
{
	std::ifstream file(path, std::ios::in);
	if (!file.is_open())
		throw std::runtime_error("Could not read from " + path);

	try {
		return read(file, random);
	} catch (std::runtime_error const & e) {
		throw std::runtime_error(path + ": " + e.what());
	}
}
