#pragma once

#include "CommunicationSignal.h"
#include "Personality.h"
#include "StrongType.h"
#include "Vector2i.h"

#include <optional>

namespace EcoSim {

using AllianceId = StrongType<struct AllianceIdTag>;

/**
 * A forager on the grid. The id doubles as the index into WorldData::agents and
 * is stable for the whole episode.
 */
struct Agent {
    int id = 0;
    Vector2i position;
    Personality::EnumType personality = Personality::EnumType::Neutral;
    double health = 100.0;
    int score = 0;
    std::optional<AllianceId> allianceId;
    int foodInventory = 0;
    CommunicationSignal signal = CommunicationSignal::None;

    bool isAllied() const { return allianceId.has_value(); }
};

} // namespace EcoSim
