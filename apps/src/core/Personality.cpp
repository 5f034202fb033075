#include "Personality.h"

namespace EcoSim::Personality {

std::string toString(EnumType type)
{
    switch (type) {
        case EnumType::Cooperative:
            return "cooperative";
        case EnumType::Aggressive:
            return "aggressive";
        case EnumType::Neutral:
            return "neutral";
    }
    return "unknown";
}

std::optional<EnumType> fromString(const std::string& str)
{
    for (EnumType type : getAllTypes()) {
        if (toString(type) == str) {
            return type;
        }
    }
    return std::nullopt;
}

const std::array<EnumType, kCount>& getAllTypes()
{
    static const std::array<EnumType, kCount> types = {
        EnumType::Cooperative,
        EnumType::Aggressive,
        EnumType::Neutral,
    };
    return types;
}

} // namespace EcoSim::Personality
