#include "SocialResolver.h"

#include "LoggingChannels.h"
#include "SimulationRules.h"
#include "SpatialQuery.h"

#include <algorithm>

namespace EcoSim {

SocialResolver::Stats SocialResolver::resolve(
    WorldData& data, const std::vector<Action>& actions, std::vector<double>& rewards) const
{
    Stats stats;

    for (Agent& actor : data.agents) {
        const Action action = actions[actor.id];
        if (isMovement(action)) {
            continue;
        }

        const std::vector<int> nearby =
            SpatialQuery::neighborsWithin(data.agents, actor.id, Rules::kInteractionRadius);

        switch (action) {
            case Action::Share:
                if (share(data, actor, nearby, rewards)) ++stats.shares;
                break;
            case Action::Steal:
                if (steal(data, actor, nearby, rewards)) ++stats.thefts;
                break;
            case Action::FormAlliance: {
                const AllianceOutcome outcome = formAlliance(data, actor, nearby, rewards);
                if (outcome == AllianceOutcome::Created) ++stats.alliancesCreated;
                if (outcome == AllianceOutcome::Joined) ++stats.alliancesJoined;
                break;
            }
            case Action::SignalHelp:
                signalHelp(data, actor, nearby, rewards);
                ++stats.signals;
                break;
            default:
                break;
        }
    }

    return stats;
}

bool SocialResolver::share(
    WorldData& data, Agent& actor, const std::vector<int>& nearby, std::vector<double>& rewards)
    const
{
    if (actor.personality != Personality::EnumType::Cooperative || actor.foodInventory <= 0) {
        return false;
    }

    for (int id : nearby) {
        Agent& other = data.agents[id];
        if (other.personality != Personality::EnumType::Cooperative) {
            continue;
        }

        actor.foodInventory -= 1;
        other.foodInventory += 1;
        other.score += 1;
        rewards[actor.id] += Rules::kShareReward;
        rewards[other.id] += Rules::kShareReward;
        data.counters.cooperationEvents += 1;

        LOG_TRACE(Social, "Agent {} shared food with agent {}", actor.id, other.id);
        return true;
    }

    return false;
}

bool SocialResolver::steal(
    WorldData& data, Agent& actor, const std::vector<int>& nearby, std::vector<double>& rewards)
    const
{
    if (actor.personality != Personality::EnumType::Aggressive) {
        return false;
    }

    for (int id : nearby) {
        Agent& victim = data.agents[id];
        if (victim.foodInventory <= 0) {
            continue;
        }

        const int stolen = std::min(1, victim.foodInventory);
        victim.foodInventory -= stolen;
        actor.foodInventory += stolen;
        actor.score += stolen;
        rewards[actor.id] += Rules::kStealReward;
        rewards[victim.id] -= Rules::kStealReward;
        data.counters.theftEvents += 1;

        LOG_TRACE(Social, "Agent {} stole {} food from agent {}", actor.id, stolen, victim.id);
        return true;
    }

    return false;
}

SocialResolver::AllianceOutcome SocialResolver::formAlliance(
    WorldData& data, Agent& actor, const std::vector<int>& nearby, std::vector<double>& rewards)
    const
{
    if (actor.personality != Personality::EnumType::Cooperative || actor.isAllied()) {
        return AllianceOutcome::None;
    }

    for (int id : nearby) {
        Agent& partner = data.agents[id];
        if (partner.personality != Personality::EnumType::Cooperative) {
            continue;
        }

        AllianceOutcome outcome;
        if (partner.isAllied()) {
            data.alliances.join(data.agents, *partner.allianceId, actor.id);
            outcome = AllianceOutcome::Joined;
        }
        else {
            data.alliances.create(data.agents, actor.id, partner.id);
            data.counters.allianceFormations += 1;
            outcome = AllianceOutcome::Created;
        }

        rewards[actor.id] += Rules::kAllianceReward;
        rewards[partner.id] += Rules::kAllianceReward;
        return outcome;
    }

    return AllianceOutcome::None;
}

void SocialResolver::signalHelp(
    WorldData& data, Agent& actor, const std::vector<int>& nearby, std::vector<double>& rewards)
    const
{
    actor.signal = CommunicationSignal::Help;
    if (!actor.isAllied()) {
        return;
    }

    // The caller is paid once per ally in range, not once per signal.
    int alliesInRange = 0;
    for (int member : data.alliances.members(*actor.allianceId)) {
        if (std::find(nearby.begin(), nearby.end(), member) == nearby.end()) {
            continue;
        }
        rewards[actor.id] += Rules::kSignalAllyReward;
        rewards[member] += Rules::kSignalAllyReward;
        ++alliesInRange;
    }

    LOG_TRACE(Social, "Agent {} signalled help, {} allies in range", actor.id, alliesInRange);
}

void SocialResolver::applyUpkeep(WorldData& data) const
{
    for (const auto& [id, members] : data.alliances.all()) {
        if (members.size() < 2) {
            continue;
        }
        for (int member : members) {
            Agent& agent = data.agents[member];
            agent.health = std::min(Rules::kMaxHealth, agent.health + Rules::kAllianceHealthBonus);
        }
    }

    for (Agent& agent : data.agents) {
        agent.health = std::max(0.0, agent.health - Rules::kHealthDecay);
    }
}

} // namespace EcoSim
