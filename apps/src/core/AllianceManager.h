#pragma once

#include "Agent.h"

#include <cstddef>
#include <map>
#include <set>
#include <vector>

namespace EcoSim {

/**
 * Owns the alliance registry and is the only code path that edits member sets
 * or agent alliance ids.
 *
 * Invariants (checked by isConsistent()):
 * - Every alliance has at least two members.
 * - Member sets are pairwise disjoint.
 * - agent.allianceId == A  <=>  agent.id is in members(A).
 *
 * Alliances only grow. There is no leave, disband or merge operation, and
 * create/join assert that the incoming agents are unallied, so two existing
 * alliances can never collide.
 */
class AllianceManager {
public:
    using MemberSet = std::set<int>;

    AllianceManager() = default;

    // New alliance containing exactly {first, second}. Ids are never reused.
    AllianceId create(std::vector<Agent>& agents, int first, int second);

    // Adds an unallied agent to an existing alliance.
    void join(std::vector<Agent>& agents, AllianceId alliance, int member);

    // Drops every alliance and restarts id assignment at 0. Agent ids are not touched;
    // callers rebuild agents alongside.
    void clear();

    bool contains(AllianceId alliance) const;

    // Members of an existing alliance (asserts that it exists).
    const MemberSet& members(AllianceId alliance) const;

    const std::map<AllianceId, MemberSet>& all() const { return alliances_; }

    size_t size() const { return alliances_.size(); }
    AllianceId nextId() const { return next_id_; }

    bool isConsistent(const std::vector<Agent>& agents) const;

private:
    std::map<AllianceId, MemberSet> alliances_;
    AllianceId next_id_{ 0 };
};

} // namespace EcoSim
