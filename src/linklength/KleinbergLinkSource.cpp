#include "KleinbergLinkSource.hpp"
#include "../Graph.hpp"
#include "../WeightedIndexSampler.hpp"

std::vector<double> const & KleinbergLinkSource::table(SimpleNode const & from)
{
	auto cached = tables_.find(from.index());
	if (cached == tables_.end()) {
		cached = tables_.emplace(from.index(), WeightedIndexSampler::inverseDistanceCdf(graph_.currentLocations(), from.index())).first;
	}
	return cached->second;
}

SimpleNode & KleinbergLinkSource::samplePeer(SimpleNode const & from, RandomSource & random)
{
	return graph_.node(WeightedIndexSampler::sampleIndex(table(from), random));
}
