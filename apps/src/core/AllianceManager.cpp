#include "AllianceManager.h"

#include "Assert.h"
#include "LoggingChannels.h"

namespace EcoSim {

AllianceId AllianceManager::create(std::vector<Agent>& agents, int first, int second)
{
    ECOSIM_ASSERT(first != second, "Alliance needs two distinct agents, got {} twice", first);
    ECOSIM_ASSERT(
        first >= 0 && first < static_cast<int>(agents.size()) && second >= 0
            && second < static_cast<int>(agents.size()),
        "Alliance member id out of range");
    ECOSIM_ASSERT(
        !agents[first].isAllied() && !agents[second].isAllied(),
        "Alliance founders {} and {} must be unallied",
        first,
        second);

    const AllianceId id = next_id_++;
    alliances_.emplace(id, MemberSet{ first, second });
    agents[first].allianceId = id;
    agents[second].allianceId = id;

    LOG_DEBUG(Alliance, "Alliance {} created with agents {} and {}", id, first, second);
    return id;
}

void AllianceManager::join(std::vector<Agent>& agents, AllianceId alliance, int member)
{
    auto it = alliances_.find(alliance);
    ECOSIM_ASSERT(it != alliances_.end(), "Cannot join unknown alliance {}", alliance);
    ECOSIM_ASSERT(
        member >= 0 && member < static_cast<int>(agents.size()),
        "Member id {} out of range",
        member);
    ECOSIM_ASSERT(!agents[member].isAllied(), "Agent {} is already allied", member);

    it->second.insert(member);
    agents[member].allianceId = alliance;

    LOG_DEBUG(
        Alliance, "Agent {} joined alliance {} ({} members)", member, alliance, it->second.size());
}

void AllianceManager::clear()
{
    alliances_.clear();
    next_id_ = AllianceId{ 0 };
}

bool AllianceManager::contains(AllianceId alliance) const
{
    return alliances_.find(alliance) != alliances_.end();
}

const AllianceManager::MemberSet& AllianceManager::members(AllianceId alliance) const
{
    auto it = alliances_.find(alliance);
    ECOSIM_ASSERT(it != alliances_.end(), "Unknown alliance id {}", alliance);
    return it->second;
}

bool AllianceManager::isConsistent(const std::vector<Agent>& agents) const
{
    std::vector<int> membership(agents.size(), 0);

    for (const auto& [id, memberSet] : alliances_) {
        if (memberSet.size() < 2) {
            return false;
        }
        for (int member : memberSet) {
            if (member < 0 || member >= static_cast<int>(agents.size())) {
                return false;
            }
            if (++membership[member] > 1) {
                return false;
            }
            if (agents[member].allianceId != id) {
                return false;
            }
        }
    }

    for (const Agent& agent : agents) {
        if (agent.isAllied() && membership[agent.id] != 1) {
            return false;
        }
        if (!agent.isAllied() && membership[agent.id] != 0) {
            return false;
        }
    }

    return true;
}

} // namespace EcoSim
