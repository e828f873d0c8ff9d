#include "WeightedDistribution.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <limits>

WeightedDistribution::WeightedDistribution(std::vector<Event> const & events) : events_(events)
{
	if (events_.empty())
		throw std::invalid_argument("weighted distribution needs at least one event");

	unsigned long total = { 0 };
	for (auto const & event : events_) {
		total += event.occurrences;
		cumulative_.push_back(total);
	}

	if (total == 0)
		throw std::invalid_argument("weighted distribution has no occurrences");
	if (total > std::numeric_limits<unsigned>::max())
		throw std::invalid_argument("weighted distribution has too many occurrences");
}

WeightedDistribution WeightedDistribution::fromStream(std::istream & in)
{
	std::vector<Event> events;
	std::string line;
	unsigned line_number = { 0 };

	while (std::getline(in, line)) {
		line_number++;
		if (line.find_first_not_of(" \t\r") == std::string::npos)
			continue;

		std::istringstream tokens(line);
		long long value, occurrences;
		std::string rest;
		if (!(tokens >> value >> occurrences) || (tokens >> rest))
			throw std::runtime_error("malformed distribution line " + std::to_string(line_number) + ": \"" + line + "\"");
		if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
			throw std::runtime_error("value out of range on distribution line " + std::to_string(line_number) + ": \"" + line + "\"");
		if (occurrences < 0)
			throw std::invalid_argument("negative occurrence count on line " + std::to_string(line_number));

		events.push_back({ int(value), (unsigned long) occurrences });
	}

	if (in.bad())
		throw std::runtime_error("error while reading distribution");

	return WeightedDistribution(events);
}

WeightedDistribution WeightedDistribution::fromFile(std::string const & filename)
{
	std::ifstream file(filename);
	if (!file.is_open())
		throw std::runtime_error("Unable to open file \"" + filename + "\".");

	return fromStream(file);
}

int WeightedDistribution::randomValue(RandomSource & random) const
{
	unsigned long total = totalOccurrences();
	// r in [0, total): the first running sum strictly above r owns it
	unsigned long r = random.uniformInt(unsigned(total));

	auto owner = std::upper_bound(cumulative_.begin(), cumulative_.end(), r);
	if (owner == cumulative_.end())
		--owner;

	return events_.at(owner - cumulative_.begin()).value;
}
