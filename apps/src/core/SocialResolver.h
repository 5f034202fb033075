#pragma once

#include "Action.h"
#include "WorldData.h"

#include <vector>

namespace EcoSim {

/**
 * Phase 2 of a step: sharing, theft, alliance formation and help signals.
 *
 * Agents act in ascending id order. Each agent captures its radius-2 neighbor list
 * at the start of its own turn, so mutations made by lower ids earlier in this
 * phase (inventories, alliances) are visible to higher ids. Every rule acts on the
 * lowest qualifying neighbor id and stops.
 */
class SocialResolver {
public:
    struct Stats {
        int shares = 0;
        int thefts = 0;
        int alliancesCreated = 0;
        int alliancesJoined = 0;
        int signals = 0;
    };

    Stats resolve(
        WorldData& data, const std::vector<Action>& actions, std::vector<double>& rewards) const;

    // End-of-step upkeep: alliance health bonus once per alliance, then health decay
    // for every agent.
    void applyUpkeep(WorldData& data) const;

private:
    bool share(
        WorldData& data, Agent& actor, const std::vector<int>& nearby, std::vector<double>& rewards)
        const;
    bool steal(
        WorldData& data, Agent& actor, const std::vector<int>& nearby, std::vector<double>& rewards)
        const;

    enum class AllianceOutcome { None, Created, Joined };
    AllianceOutcome formAlliance(
        WorldData& data, Agent& actor, const std::vector<int>& nearby, std::vector<double>& rewards)
        const;

    void signalHelp(
        WorldData& data, Agent& actor, const std::vector<int>& nearby, std::vector<double>& rewards)
        const;
};

} // namespace EcoSim
