#pragma once

#include <cstdint>

namespace EcoSim {

/**
 * One-step broadcast flag, visible to observation-radius neighbors in the next
 * encoding pass. The engine itself only ever emits Help; Food and Danger are
 * encoded so that policies or scenario code can raise them.
 */
enum class CommunicationSignal : uint8_t {
    None = 0,
    Help = 1,
    Food = 2,
    Danger = 3,
};

} // namespace EcoSim
