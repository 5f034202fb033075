#pragma once

namespace EcoSim::Rules {

// Episode.
constexpr int kDefaultMaxSteps = 500;

// Health.
constexpr double kMaxHealth = 100.0;
constexpr double kObstacleDamage = 2.0;
constexpr double kFoodHeal = 10.0;
constexpr double kAllianceHealthBonus = 0.1;
constexpr double kHealthDecay = 0.2;

// Movement phase rewards. Food reward replaces the step cost, it is not added to it.
constexpr double kStepCost = -1.0;
constexpr double kObstaclePenalty = -5.0;
constexpr double kFoodReward = 15.0;

// Social phase rewards.
constexpr double kShareReward = 5.0;
constexpr double kStealReward = 10.0;
constexpr double kAllianceReward = 3.0;
constexpr double kSignalAllyReward = 2.0;

// Neighborhoods (inclusive Euclidean radius).
constexpr int kObservationRadius = 3;
constexpr int kInteractionRadius = 2;

} // namespace EcoSim::Rules
