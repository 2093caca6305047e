#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Forge {
namespace Ability {

/**
 * @brief Status states an entity can carry, queried by predicates
 */
enum class AbilityState : uint8_t {
    ElementFreeze,
    ElementWet,
    MuteTaunt
};

[[nodiscard]] const char* AbilityStateToString(AbilityState state);

[[nodiscard]] std::optional<AbilityState> AbilityStateFromString(std::string_view str);

} // namespace Ability
} // namespace Forge
