#include "Action.h"

namespace EcoSim {

std::optional<Action> actionFromCode(int code)
{
    if (code < 0 || code >= kActionCount) {
        return std::nullopt;
    }
    return static_cast<Action>(code);
}

std::string toString(Action action)
{
    switch (action) {
        case Action::Stay:
            return "Stay";
        case Action::Up:
            return "Up";
        case Action::Down:
            return "Down";
        case Action::Left:
            return "Left";
        case Action::Right:
            return "Right";
        case Action::Share:
            return "Share";
        case Action::Steal:
            return "Steal";
        case Action::FormAlliance:
            return "FormAlliance";
        case Action::SignalHelp:
            return "SignalHelp";
    }
    return "Unknown";
}

} // namespace EcoSim
