#include "SpatialQuery.h"

namespace EcoSim::SpatialQuery {

bool withinRadius(Vector2i a, Vector2i b, int radius)
{
    return (a - b).lengthSquared() <= radius * radius;
}

std::vector<int> neighborsWithin(const std::vector<Agent>& agents, int self, int radius)
{
    std::vector<int> neighbors;
    const Vector2i origin = agents[self].position;

    for (const Agent& other : agents) {
        if (other.id == self) {
            continue;
        }
        if (withinRadius(origin, other.position, radius)) {
            neighbors.push_back(other.id);
        }
    }

    return neighbors;
}

} // namespace EcoSim::SpatialQuery
