#ifndef SMALL_WORLD_GRAPH_FILE_HPP
#define SMALL_WORLD_GRAPH_FILE_HPP

#include <string>
#include <istream>
#include <ostream>
#include "../Graph.hpp"
#include "../RandomSource.hpp"

/**
 * Persisted graphs. Format:
 *
 *   # comment line
 *   <node count>
 *   <location> <target degree>    one line per node, by index
 *   <edge count>
 *   <low> <high>                  one line per edge, low < high, each edge once
 *
 * Malformed or truncated input throws std::runtime_error.
 */
namespace GraphFile {
	void write(Graph const & graph, std::ostream & out);

	void write(Graph const & graph, std::string const & path);

	/**
	 * @param random Randomness handed to the loaded nodes; has to outlive the graph
	 */
	Graph read(std::istream & in, RandomSource & random);

	Graph read(std::string const & path, RandomSource & random);
}

#endif //SMALL_WORLD_GRAPH_FILE_HPP
