#pragma once

#include "Agent.h"
#include "AllianceManager.h"
#include "Vector2i.h"

#include <algorithm>
#include <cstdint>
#include <random>
#include <set>
#include <vector>

namespace EcoSim {

/**
 * Cumulative interaction counters for the current episode. Never decrease.
 */
struct EpisodeCounters {
    int cooperationEvents = 0;
    int theftEvents = 0;
    int allianceFormations = 0;
};

/**
 * Mutable world state shared by the step phases.
 *
 * food may hold several entries for one cell; a visit consumes only the first
 * matching entry. obstacles collapse duplicates and stay fixed for the episode.
 */
struct WorldData {
    int gridSize = 0;
    std::vector<Agent> agents; // agents[i].id == i.
    std::vector<Vector2i> food;
    std::set<Vector2i> obstacles;
    AllianceManager alliances;
    int32_t step = 0;
    EpisodeCounters counters;

    bool inBounds(Vector2i pos) const
    {
        return pos.x >= 0 && pos.x < gridSize && pos.y >= 0 && pos.y < gridSize;
    }

    bool isObstacle(Vector2i pos) const { return obstacles.count(pos) > 0; }

    Vector2i clampToGrid(Vector2i pos) const
    {
        return Vector2i{ std::clamp(pos.x, 0, gridSize - 1), std::clamp(pos.y, 0, gridSize - 1) };
    }
};

// Uniform in-bounds cell; draws x then y from the engine.
inline Vector2i randomGridCell(std::mt19937& rng, int gridSize)
{
    std::uniform_int_distribution<int> coord(0, gridSize - 1);
    const int x = coord(rng);
    const int y = coord(rng);
    return Vector2i{ x, y };
}

} // namespace EcoSim
