#pragma once

#include "Agent.h"

#include <vector>

namespace EcoSim {

/**
 * Radius-bounded neighbor lookup over the agent arena.
 *
 * Linear scan, O(N) per query. Results are in ascending agent id, which is the
 * tie-break order for every "first qualifying neighbor" rule in the social phase.
 * A spatial index may replace the scan as long as it returns the same id sets.
 */
namespace SpatialQuery {

/**
 * Ids of all other agents whose Euclidean distance to agents[self] is <= radius.
 * The querying agent is never included.
 */
std::vector<int> neighborsWithin(const std::vector<Agent>& agents, int self, int radius);

bool withinRadius(Vector2i a, Vector2i b, int radius);

} // namespace SpatialQuery

} // namespace EcoSim
