#pragma once

#include "Vector2i.h"
#include <cstdint>
#include <optional>
#include <string>

namespace EcoSim {

/**
 * Per-agent action codes accepted by World::step(). Codes 0-4 are resolved in
 * the movement phase, 5-8 in the social phase; each code is a no-op in the other.
 */
enum class Action : uint8_t {
    Stay = 0,
    Up = 1,
    Down = 2,
    Left = 3,
    Right = 4,
    Share = 5,
    Steal = 6,
    FormAlliance = 7,
    SignalHelp = 8,
};

constexpr int kActionCount = 9;

constexpr bool isMovement(Action action)
{
    return static_cast<uint8_t>(action) <= static_cast<uint8_t>(Action::Right);
}

// Grid delta for a movement action; {0, 0} for Stay and for social actions.
constexpr Vector2i movementDelta(Action action)
{
    switch (action) {
        case Action::Up:
            return Vector2i{ 0, -1 };
        case Action::Down:
            return Vector2i{ 0, 1 };
        case Action::Left:
            return Vector2i{ -1, 0 };
        case Action::Right:
            return Vector2i{ 1, 0 };
        default:
            return Vector2i{ 0, 0 };
    }
}

// Returns nullopt for codes outside [0, kActionCount).
std::optional<Action> actionFromCode(int code);

std::string toString(Action action);

} // namespace EcoSim
