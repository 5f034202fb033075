#pragma once

/**
 * \file
 * Behavioral tags assigned to each agent at reset. The tag gates which social
 * actions have an effect and never changes during an episode.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace EcoSim::Personality {

enum class EnumType : uint8_t {
    Cooperative = 0, // Shares food, forms alliances.
    Aggressive,      // Steals food.
    Neutral,         // Solo forager.
};

constexpr int kCount = 3;

// Categorical weights used at reset, indexed by EnumType value.
constexpr std::array<double, kCount> kSpawnWeights = { 0.4, 0.3, 0.3 };

std::string toString(EnumType type);

std::optional<EnumType> fromString(const std::string& str);

const std::array<EnumType, kCount>& getAllTypes();

} // namespace EcoSim::Personality
