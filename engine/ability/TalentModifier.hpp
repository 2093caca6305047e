#pragma once

#include "ability/EngineError.hpp"
#include "ability/ParamReference.hpp"
#include "ability/Predicate.hpp"
#include "ability/SkillDepot.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace Forge {
namespace Ability {

// ============================================================================
// Modifier kinds
// ============================================================================

/**
 * @brief Adds a delta to an ability special, then scales it by a ratio
 *
 * special = (special + delta) * ratio, where either step is skipped when its
 * spec is absent and the ratio step is also skipped for a literal 0.
 */
struct ModifyAbility {
    std::string abilityName;
    std::string paramSpecial;
    ParamSpec paramDelta;
    ParamSpec paramRatio;
};

/**
 * @brief Same delta/ratio rule applied to a skill cooldown
 */
struct ModifySkillCD {
    uint32_t skillId = 0;
    ParamSpec cdDelta;
    ParamSpec cdRatio;
};

/**
 * @brief Grants extra levels to a talent slot
 */
struct AddTalentExtraLevel {
    std::string talentType;
    int32_t extraLevel = 0;
};

/**
 * @brief Marks a talent parameter of an ability as unlocked
 */
struct UnlockTalentParam {
    std::string abilityName;
    std::string talentParam;
};

using TalentModifierKind = std::variant<ModifyAbility, ModifySkillCD, AddTalentExtraLevel, UnlockTalentParam>;

/**
 * @brief One configured mutation plus the predicates gating it
 */
struct TalentModifier {
    TalentModifierKind kind;
    std::vector<Predicate> predicates;

    TalentModifier() = default;
    TalentModifier(TalentModifierKind k, std::vector<Predicate> gates = {})
        : kind(std::move(k)), predicates(std::move(gates)) {}
};

/**
 * @brief Type tag of a modifier as written in configs ("ModifyAbility", ...)
 */
[[nodiscard]] const char* TalentModifierTypeName(const TalentModifierKind& kind);

/**
 * @brief Apply a modifier kind without looking at predicates
 *
 * The depot is only written once the whole computation has succeeded, so a
 * failed application leaves it exactly as it was.
 */
[[nodiscard]] std::expected<void, EngineError> ApplyModifierKind(
    const TalentModifierKind& kind,
    SkillDepot& depot,
    std::span<const double> params);

/**
 * @brief Apply a modifier if its predicates hold in the given context
 *
 * A modifier whose gate does not hold is skipped and reported as success.
 */
[[nodiscard]] std::expected<void, EngineError> ApplyModifier(
    const TalentModifier& modifier,
    SkillDepot& depot,
    std::span<const double> params,
    const IPredicateContext& context);

/**
 * @brief Apply a modifier with an empty predicate context
 *
 * Ungated modifiers always run; comparison predicates that need an entity
 * do not hold.
 */
[[nodiscard]] std::expected<void, EngineError> ApplyModifier(
    const TalentModifier& modifier,
    SkillDepot& depot,
    std::span<const double> params);

[[nodiscard]] std::expected<TalentModifier, std::string> TalentModifierFromJson(const nlohmann::json& j);

[[nodiscard]] nlohmann::json TalentModifierToJson(const TalentModifier& modifier);

} // namespace Ability
} // namespace Forge
