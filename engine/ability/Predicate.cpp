#include "ability/Predicate.hpp"

#include <algorithm>
#include <type_traits>

namespace Forge {
namespace Ability {

// ============================================================================
// Operator Utilities
// ============================================================================

const char* LogicTypeToString(LogicType logic) {
    switch (logic) {
        case LogicType::Equal: return "Equal";
        case LogicType::NotEqual: return "NotEqual";
        case LogicType::Greater: return "Greater";
        case LogicType::GreaterOrEqual: return "GreaterOrEqual";
        case LogicType::Less: return "Less";
        case LogicType::LessOrEqual: return "LessOrEqual";
        default: return "unknown";
    }
}

std::optional<LogicType> LogicTypeFromString(std::string_view str) {
    if (str == "Equal" || str == "==") return LogicType::Equal;
    if (str == "NotEqual" || str == "!=") return LogicType::NotEqual;
    if (str == "Greater" || str == ">") return LogicType::Greater;
    if (str == "GreaterOrEqual" || str == ">=") return LogicType::GreaterOrEqual;
    if (str == "Less" || str == "Lesser" || str == "<") return LogicType::Less;
    if (str == "LessOrEqual" || str == "LesserOrEqual" || str == "<=") return LogicType::LessOrEqual;
    return std::nullopt;
}

bool Compare(float actual, LogicType logic, float reference) {
    switch (logic) {
        case LogicType::Equal: return actual == reference;
        case LogicType::NotEqual: return actual != reference;
        case LogicType::Greater: return actual > reference;
        case LogicType::GreaterOrEqual: return actual >= reference;
        case LogicType::Less: return actual < reference;
        case LogicType::LessOrEqual: return actual <= reference;
    }
    return false;
}

const char* PredicateTargetToString(PredicateTarget target) {
    switch (target) {
        case PredicateTarget::Self: return "Self";
        case PredicateTarget::Target: return "Target";
        case PredicateTarget::Caster: return "Caster";
        default: return "unknown";
    }
}

std::optional<PredicateTarget> PredicateTargetFromString(std::string_view str) {
    if (str == "Self") return PredicateTarget::Self;
    if (str == "Target") return PredicateTarget::Target;
    if (str == "Caster") return PredicateTarget::Caster;
    return std::nullopt;
}

// ============================================================================
// PredicateContext
// ============================================================================

PredicateContext& PredicateContext::With(PredicateTarget target, EntitySnapshot snapshot) {
    m_entities[static_cast<size_t>(target)] = std::move(snapshot);
    return *this;
}

const EntitySnapshot* PredicateContext::Find(PredicateTarget target) const {
    const auto& slot = m_entities[static_cast<size_t>(target)];
    return slot ? &*slot : nullptr;
}

std::optional<glm::vec3> PredicateContext::GetPosition(PredicateTarget target) const {
    const auto* entity = Find(target);
    if (!entity) {
        return std::nullopt;
    }
    return entity->position;
}

std::optional<float> PredicateContext::GetHPRatio(PredicateTarget target) const {
    const auto* entity = Find(target);
    if (!entity || entity->maxHp <= 0.0f) {
        return std::nullopt;
    }
    return entity->currentHp / entity->maxHp;
}

bool PredicateContext::HasAbilityState(PredicateTarget target, AbilityState state) const {
    const auto* entity = Find(target);
    if (!entity) {
        return false;
    }
    return std::find(entity->states.begin(), entity->states.end(), state) != entity->states.end();
}

// ============================================================================
// Evaluation
// ============================================================================

namespace {

bool CompareOptional(std::optional<float> actual, const std::optional<LogicType>& logic, float reference) {
    if (!logic) {
        return true;
    }
    if (!actual) {
        return false;
    }
    return Compare(*actual, *logic, reference);
}

} // namespace

const char* PredicateTypeName(const Predicate& predicate) {
    return std::visit([](const auto& p) -> const char* {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, ByTargetAltitude>) {
            return "ByTargetAltitude";
        } else if constexpr (std::is_same_v<T, ByTargetHPRatio>) {
            return "ByTargetHPRatio";
        } else {
            return "ByHasAbilityState";
        }
    }, predicate);
}

bool EvaluatePredicate(const Predicate& predicate, const IPredicateContext& context) {
    return std::visit([&context](const auto& p) -> bool {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, ByHasAbilityState>) {
            return context.HasAbilityState(p.target, p.state);
        } else {
            // Comparison kinds: no operator means the predicate always holds
            if (!p.logic) {
                return true;
            }
            if constexpr (std::is_same_v<T, ByTargetAltitude>) {
                auto position = context.GetPosition(p.target);
                return CompareOptional(position ? std::optional<float>(position->y) : std::nullopt,
                                       p.logic, p.value);
            } else {
                return CompareOptional(context.GetHPRatio(p.target), p.logic, p.value);
            }
        }
    }, predicate);
}

bool EvaluateAll(std::span<const Predicate> predicates, const IPredicateContext& context) {
    return std::all_of(predicates.begin(), predicates.end(), [&context](const Predicate& p) {
        return EvaluatePredicate(p, context);
    });
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

template<typename T>
std::expected<T, std::string> ParseComparison(const nlohmann::json& j) {
    T predicate;

    if (j.contains("target")) {
        auto target = PredicateTargetFromString(j["target"].get<std::string>());
        if (!target) {
            return std::unexpected("Unknown predicate target: " + j["target"].get<std::string>());
        }
        predicate.target = *target;
    }

    if (j.contains("logic") && !j["logic"].is_null()) {
        auto logic = LogicTypeFromString(j["logic"].get<std::string>());
        if (!logic) {
            return std::unexpected("Unknown logic operator: " + j["logic"].get<std::string>());
        }
        predicate.logic = *logic;
    }

    if (j.contains("value")) {
        if (!j["value"].is_number()) {
            return std::unexpected("Predicate value must be a number");
        }
        predicate.value = j["value"].get<float>();
    }

    return predicate;
}

} // namespace

std::expected<Predicate, std::string> PredicateFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("$type") || !j["$type"].is_string()) {
        return std::unexpected("Predicate is missing its $type tag");
    }

    try {
        const auto type = j["$type"].get<std::string>();

        if (type == "ByTargetAltitude") {
            return ParseComparison<ByTargetAltitude>(j);
        }
        if (type == "ByTargetHPRatio") {
            return ParseComparison<ByTargetHPRatio>(j);
        }
        if (type == "ByHasAbilityState") {
            ByHasAbilityState predicate;
            if (j.contains("target")) {
                auto target = PredicateTargetFromString(j["target"].get<std::string>());
                if (!target) {
                    return std::unexpected("Unknown predicate target: " + j["target"].get<std::string>());
                }
                predicate.target = *target;
            }
            if (!j.contains("state")) {
                return std::unexpected("ByHasAbilityState requires a state");
            }
            auto state = AbilityStateFromString(j["state"].get<std::string>());
            if (!state) {
                return std::unexpected("Unknown ability state: " + j["state"].get<std::string>());
            }
            predicate.state = *state;
            return predicate;
        }

        return std::unexpected("Unknown predicate type: " + type);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Invalid predicate: " + std::string(e.what()));
    }
}

nlohmann::json PredicateToJson(const Predicate& predicate) {
    nlohmann::json j;
    j["$type"] = PredicateTypeName(predicate);

    std::visit([&j](const auto& p) {
        using T = std::decay_t<decltype(p)>;

        j["target"] = PredicateTargetToString(p.target);
        if constexpr (std::is_same_v<T, ByHasAbilityState>) {
            j["state"] = AbilityStateToString(p.state);
        } else {
            if (p.logic) j["logic"] = LogicTypeToString(*p.logic);
            j["value"] = p.value;
        }
    }, predicate);

    return j;
}

} // namespace Ability
} // namespace Forge
