#pragma once

#include <cstdlib>
#include <spdlog/spdlog.h>

/**
 * Engine invariant check that stays on in release builds.
 *
 * A failure means EcoSim itself is wrong (never bad user input, which throws), so the
 * process logs the condition and location at critical level and aborts.
 *
 * The message is an fmt format string followed by its arguments:
 *   ECOSIM_ASSERT(obs.size() == kObservationSize, "Observation has {} features", obs.size());
 */
#define ECOSIM_ASSERT(condition, ...)                                                  \
    do {                                                                               \
        if (!(condition)) {                                                            \
            spdlog::critical(                                                          \
                "ASSERTION FAILED at {}:{}: {}", __FILE__, __LINE__,                   \
                fmt::format(__VA_ARGS__));                                             \
            spdlog::critical("  Condition: {}", #condition);                           \
            spdlog::default_logger()->flush();                                         \
            std::abort();                                                              \
        }                                                                              \
    } while (0)
