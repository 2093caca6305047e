#include "ability/AbilityState.hpp"

namespace Forge {
namespace Ability {

const char* AbilityStateToString(AbilityState state) {
    switch (state) {
        case AbilityState::ElementFreeze: return "ElementFreeze";
        case AbilityState::ElementWet: return "ElementWet";
        case AbilityState::MuteTaunt: return "MuteTaunt";
        default: return "unknown";
    }
}

std::optional<AbilityState> AbilityStateFromString(std::string_view str) {
    if (str == "ElementFreeze") return AbilityState::ElementFreeze;
    if (str == "ElementWet") return AbilityState::ElementWet;
    if (str == "MuteTaunt") return AbilityState::MuteTaunt;
    return std::nullopt;
}

} // namespace Ability
} // namespace Forge
