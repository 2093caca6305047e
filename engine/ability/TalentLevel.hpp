#pragma once

#include "ability/EngineError.hpp"
#include "ability/ParamReference.hpp"
#include "ability/Predicate.hpp"
#include "ability/SkillDepot.hpp"
#include "ability/TalentModifier.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Forge {
namespace Ability {

/**
 * @brief One talent or proud-skill level: its parameter list and the
 * modifiers it applies, in declaration order
 */
struct TalentLevelData {
    uint32_t id = 0;
    ParamList paramList;
    std::vector<TalentModifier> modifiers;

    [[nodiscard]] nlohmann::json ToJson() const;

    static std::expected<TalentLevelData, std::string> FromJson(const nlohmann::json& j);
};

/**
 * @brief A modifier that was skipped because it failed
 */
struct ModifierFailure {
    size_t index = 0;               // position in the modifier list
    std::string modifierType;
    EngineError error = EngineError::UnknownAbility;
};

/**
 * @brief Outcome of applying a modifier batch
 */
struct TalentApplyResult {
    size_t applied = 0;             // modifiers that changed the depot
    size_t gated = 0;               // modifiers whose predicates did not hold
    std::vector<ModifierFailure> failures;

    [[nodiscard]] bool Succeeded() const { return failures.empty(); }
};

/**
 * @brief Apply modifiers in order
 *
 * A failing modifier is recorded and skipped; later modifiers still run.
 */
TalentApplyResult ApplyModifiers(std::span<const TalentModifier> modifiers,
                                 SkillDepot& depot,
                                 std::span<const double> params,
                                 const IPredicateContext& context);

TalentApplyResult ApplyTalentLevel(const TalentLevelData& talent,
                                   SkillDepot& depot,
                                   const IPredicateContext& context);

TalentApplyResult ApplyTalentLevel(const TalentLevelData& talent, SkillDepot& depot);

/**
 * @brief Parse a single talent level object or an array of them
 */
[[nodiscard]] std::expected<std::vector<TalentLevelData>, std::string> ParseTalentLevels(
    const nlohmann::json& json);

} // namespace Ability
} // namespace Forge
