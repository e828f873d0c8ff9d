#include "SimpleNode.hpp"
#include "Location.hpp"
#include <algorithm>
#include <stdexcept>
#include <cassert>
#include <cmath>
#include <string>

bool SimpleNode::isConnected(SimpleNode const & other) const
{
	return std::find(connections_.begin(), connections_.end(), &other) != connections_.end();
}

void SimpleNode::connect(SimpleNode & other)
{
	if (&other == this)
		throw std::logic_error("node " + std::to_string(index_) + " cannot connect to itself");
	if (isConnected(other) || other.isConnected(*this))
		throw std::logic_error("nodes " + std::to_string(index_) + " and " + std::to_string(other.index_) + " are already connected");

	connections_.push_back(&other);
	other.connections_.push_back(this);
}

void SimpleNode::connectOutgoing(SimpleNode & other)
{
	assert(&other != this);
	assert(!isConnected(other));
	connections_.push_back(&other);
}

double SimpleNode::distanceTo(SimpleNode const & other) const
{
	return Location::distance(location_, other.location_);
}

double SimpleNode::distanceToLoc(double location) const
{
	return Location::distance(location_, location);
}

int SimpleNode::closedTriplets() const
{
	int closed = { 0 };
	for (size_t i { 0 }; i < connections_.size(); i++) {
		for (size_t j { i + 1 }; j < connections_.size(); j++) {
			if (connections_[i]->isConnected(*connections_[j]))
				closed++;
		}
	}
	return closed;
}

double SimpleNode::localClusterCoeff() const
{
	int d = degree();
	if (d < 2)
		return 0.0;

	double coeff = double(closedTriplets()) / (double(d) * (d - 1) / 2.0);
	assert(coeff >= 0.0 && coeff <= 1.0);
	return coeff;
}

SimpleNode & SimpleNode::randomWalk(unsigned hops, bool uniform, RandomSource & random)
{
	SimpleNode * current = this;
	for (unsigned hop { 0 }; hop < hops; hop++) {
		if (current->connections_.empty())
			break;

		SimpleNode * next = current->connections_[random.uniformInt(unsigned(current->connections_.size()))];
		if (!uniform) {
			// Metropolis-Hastings correction for the degree bias
			double accept = double(current->degree()) / double(next->degree());
			if (accept < 1.0 && random.uniformDouble() >= accept)
				continue;
		}
		current = next;
	}
	return *current;
}

double SimpleNode::logDistanceProduct(double location, SimpleNode const & swapped, double swapped_location) const
{
	double sum = { 0.0 };
	for (auto peer : connections_) {
		double peer_location = (peer == &swapped) ? swapped_location : peer->location_;
		sum += std::log(Location::distance(location, peer_location));
	}
	return sum;
}

bool SimpleNode::attemptSwap(SimpleNode & target)
{
	if (&target == this)
		return false;
	assert(random_ != nullptr);

	double before = logDistanceProduct(location_, target, target.location_)
			+ target.logDistanceProduct(target.location_, *this, location_);
	double after = logDistanceProduct(target.location_, target, location_)
			+ target.logDistanceProduct(location_, *this, target.location_);

	if (after > before && random_->uniformDouble() >= std::exp(before - after))
		return false;

	std::swap(location_, target.location_);
	return true;
}
