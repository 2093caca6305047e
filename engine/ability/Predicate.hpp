#pragma once

#include "ability/AbilityState.hpp"

#include <array>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

namespace Forge {
namespace Ability {

/**
 * @brief Comparison operators used by predicates
 */
enum class LogicType : uint8_t {
    Equal,          // ==
    NotEqual,       // !=
    Greater,        // >
    GreaterOrEqual, // >=
    Less,           // <
    LessOrEqual     // <=
};

[[nodiscard]] const char* LogicTypeToString(LogicType logic);

/**
 * @brief Parse an operator from its config name or symbol
 *
 * Accepts "Equal", "NotEqual", "Greater", "GreaterOrEqual", "Less"/"Lesser",
 * "LessOrEqual"/"LesserOrEqual" and the symbolic forms "==", "!=", ">", ">=",
 * "<", "<=".
 */
[[nodiscard]] std::optional<LogicType> LogicTypeFromString(std::string_view str);

/**
 * @brief Compare actual against reference with the given operator
 */
[[nodiscard]] bool Compare(float actual, LogicType logic, float reference);

/**
 * @brief Which entity a predicate inspects
 */
enum class PredicateTarget : uint8_t {
    Self,
    Target,
    Caster
};

[[nodiscard]] const char* PredicateTargetToString(PredicateTarget target);
[[nodiscard]] std::optional<PredicateTarget> PredicateTargetFromString(std::string_view str);

/**
 * @brief Read-only view of world/character state seen by predicates
 *
 * Every query returns nullopt (or false) when the designated entity does
 * not exist in the current context.
 */
class IPredicateContext {
public:
    virtual ~IPredicateContext() = default;

    [[nodiscard]] virtual std::optional<glm::vec3> GetPosition(PredicateTarget target) const = 0;
    [[nodiscard]] virtual std::optional<float> GetHPRatio(PredicateTarget target) const = 0;
    [[nodiscard]] virtual bool HasAbilityState(PredicateTarget target, AbilityState state) const = 0;
};

/**
 * @brief Snapshot of one entity for PredicateContext
 */
struct EntitySnapshot {
    glm::vec3 position{0.0f};
    float currentHp = 0.0f;
    float maxHp = 0.0f;
    std::vector<AbilityState> states;
};

/**
 * @brief Value-type predicate context built by the caller per evaluation
 */
class PredicateContext : public IPredicateContext {
public:
    PredicateContext() = default;

    PredicateContext& With(PredicateTarget target, EntitySnapshot snapshot);

    [[nodiscard]] std::optional<glm::vec3> GetPosition(PredicateTarget target) const override;
    [[nodiscard]] std::optional<float> GetHPRatio(PredicateTarget target) const override;
    [[nodiscard]] bool HasAbilityState(PredicateTarget target, AbilityState state) const override;

private:
    [[nodiscard]] const EntitySnapshot* Find(PredicateTarget target) const;

    std::array<std::optional<EntitySnapshot>, 3> m_entities{};
};

// ============================================================================
// Predicate kinds
// ============================================================================

/**
 * @brief Compares the target's altitude (world y) against a threshold
 */
struct ByTargetAltitude {
    PredicateTarget target = PredicateTarget::Self;
    std::optional<LogicType> logic;
    float value = 0.0f;
};

/**
 * @brief Compares the target's current/max HP ratio against a threshold
 */
struct ByTargetHPRatio {
    PredicateTarget target = PredicateTarget::Self;
    std::optional<LogicType> logic;
    float value = 0.0f;
};

/**
 * @brief Holds while the target carries the given state
 */
struct ByHasAbilityState {
    PredicateTarget target = PredicateTarget::Self;
    AbilityState state = AbilityState::ElementFreeze;
};

using Predicate = std::variant<ByTargetAltitude, ByTargetHPRatio, ByHasAbilityState>;

/**
 * @brief Type tag of a predicate as written in configs ("ByTargetAltitude", ...)
 */
[[nodiscard]] const char* PredicateTypeName(const Predicate& predicate);

/**
 * @brief Evaluate a single predicate
 *
 * Comparison kinds without an operator hold unconditionally. A comparison
 * against an entity absent from the context does not hold.
 */
[[nodiscard]] bool EvaluatePredicate(const Predicate& predicate, const IPredicateContext& context);

/**
 * @brief True when every predicate holds (and for an empty list)
 */
[[nodiscard]] bool EvaluateAll(std::span<const Predicate> predicates, const IPredicateContext& context);

[[nodiscard]] std::expected<Predicate, std::string> PredicateFromJson(const nlohmann::json& j);

[[nodiscard]] nlohmann::json PredicateToJson(const Predicate& predicate);

} // namespace Ability
} // namespace Forge
