#include "ability/EngineError.hpp"

namespace Forge {
namespace Ability {

const char* EngineErrorToString(EngineError error) noexcept {
    switch (error) {
        case EngineError::UnknownAbility:     return "Unknown ability";
        case EngineError::UnknownSpecial:     return "Unknown ability special";
        case EngineError::UnknownSkill:       return "Unknown skill";
        case EngineError::MalformedReference: return "Malformed parameter reference";
        case EngineError::IndexOutOfRange:    return "Parameter index out of range";
        case EngineError::HashCollision:      return "Hash collision";
        default: return "Unknown error";
    }
}

} // namespace Ability
} // namespace Forge
