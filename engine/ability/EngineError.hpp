#pragma once

#include <cstdint>

namespace Forge {
namespace Ability {

/**
 * @brief Failures reported by modifier application and reference resolution
 *
 * Every kind except HashCollision causes the single modifier that hit it to
 * be skipped. HashCollision is only ever recorded by the name hash index.
 */
enum class EngineError : uint8_t {
    UnknownAbility,
    UnknownSpecial,
    UnknownSkill,
    MalformedReference,
    IndexOutOfRange,
    HashCollision
};

[[nodiscard]] const char* EngineErrorToString(EngineError error) noexcept;

} // namespace Ability
} // namespace Forge
