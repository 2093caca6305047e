#include "ability/TalentModifier.hpp"
#include "core/Logger.hpp"

#include <type_traits>

namespace Forge {
namespace Ability {

namespace {

std::expected<void, EngineError> Apply(const ModifyAbility& mod, SkillDepot& depot,
                                       std::span<const double> params) {
    auto ability = depot.abilitySpecials.find(mod.abilityName);
    if (ability == depot.abilitySpecials.end()) {
        return std::unexpected(EngineError::UnknownAbility);
    }
    auto special = ability->second.find(mod.paramSpecial);
    if (special == ability->second.end()) {
        return std::unexpected(EngineError::UnknownSpecial);
    }

    auto result = ApplyDeltaRatio(special->second, mod.paramDelta, mod.paramRatio, params);
    if (!result) {
        return std::unexpected(result.error());
    }

    FORGE_LOG_TRACE("ModifyAbility {}.{}: {} -> {}", mod.abilityName, mod.paramSpecial,
                    special->second, *result);
    special->second = *result;
    return {};
}

std::expected<void, EngineError> Apply(const ModifySkillCD& mod, SkillDepot& depot,
                                       std::span<const double> params) {
    auto skill = depot.skillCooldowns.find(mod.skillId);
    if (skill == depot.skillCooldowns.end()) {
        return std::unexpected(EngineError::UnknownSkill);
    }

    auto result = ApplyDeltaRatio(skill->second, mod.cdDelta, mod.cdRatio, params);
    if (!result) {
        return std::unexpected(result.error());
    }

    FORGE_LOG_TRACE("ModifySkillCD {}: {} -> {}", mod.skillId, skill->second, *result);
    skill->second = *result;
    return {};
}

std::expected<void, EngineError> Apply(const AddTalentExtraLevel& mod, SkillDepot& depot,
                                       std::span<const double>) {
    depot.extraTalentLevels[mod.talentType] += mod.extraLevel;
    FORGE_LOG_TRACE("AddTalentExtraLevel {} +{}", mod.talentType, mod.extraLevel);
    return {};
}

std::expected<void, EngineError> Apply(const UnlockTalentParam& mod, SkillDepot& depot,
                                       std::span<const double>) {
    if (!depot.HasAbility(mod.abilityName)) {
        return std::unexpected(EngineError::UnknownAbility);
    }
    depot.unlockedTalentParams[mod.abilityName].insert(mod.talentParam);
    FORGE_LOG_TRACE("UnlockTalentParam {}.{}", mod.abilityName, mod.talentParam);
    return {};
}

std::expected<ParamSpec, std::string> ReadSpec(const nlohmann::json& j, const char* field) {
    if (!j.contains(field)) {
        return ParamSpec{};
    }
    auto spec = ParamSpecFromJson(j[field]);
    if (!spec) {
        return std::unexpected(std::string(field) + " must be a number or a reference string");
    }
    return *spec;
}

} // namespace

const char* TalentModifierTypeName(const TalentModifierKind& kind) {
    return std::visit([](const auto& mod) -> const char* {
        using T = std::decay_t<decltype(mod)>;

        if constexpr (std::is_same_v<T, ModifyAbility>) {
            return "ModifyAbility";
        } else if constexpr (std::is_same_v<T, ModifySkillCD>) {
            return "ModifySkillCD";
        } else if constexpr (std::is_same_v<T, AddTalentExtraLevel>) {
            return "AddTalentExtraLevel";
        } else {
            return "UnlockTalentParam";
        }
    }, kind);
}

std::expected<void, EngineError> ApplyModifierKind(
    const TalentModifierKind& kind,
    SkillDepot& depot,
    std::span<const double> params)
{
    return std::visit([&depot, params](const auto& mod) {
        return Apply(mod, depot, params);
    }, kind);
}

std::expected<void, EngineError> ApplyModifier(
    const TalentModifier& modifier,
    SkillDepot& depot,
    std::span<const double> params,
    const IPredicateContext& context)
{
    if (!EvaluateAll(modifier.predicates, context)) {
        FORGE_LOG_TRACE("{} skipped: predicates do not hold", TalentModifierTypeName(modifier.kind));
        return {};
    }
    return ApplyModifierKind(modifier.kind, depot, params);
}

std::expected<void, EngineError> ApplyModifier(
    const TalentModifier& modifier,
    SkillDepot& depot,
    std::span<const double> params)
{
    const PredicateContext empty{};
    return ApplyModifier(modifier, depot, params, empty);
}

// ============================================================================
// Serialization
// ============================================================================

std::expected<TalentModifier, std::string> TalentModifierFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("$type") || !j["$type"].is_string()) {
        return std::unexpected("Talent modifier is missing its $type tag");
    }

    try {
        TalentModifier modifier;
        const auto type = j["$type"].get<std::string>();

        if (type == "ModifyAbility") {
            ModifyAbility mod;
            mod.abilityName = j.at("abilityName").get<std::string>();
            mod.paramSpecial = j.at("paramSpecial").get<std::string>();
            auto delta = ReadSpec(j, "paramDelta");
            if (!delta) return std::unexpected(delta.error());
            auto ratio = ReadSpec(j, "paramRatio");
            if (!ratio) return std::unexpected(ratio.error());
            mod.paramDelta = std::move(*delta);
            mod.paramRatio = std::move(*ratio);
            modifier.kind = std::move(mod);
        } else if (type == "ModifySkillCD") {
            ModifySkillCD mod;
            mod.skillId = j.at("skillId").get<uint32_t>();
            auto delta = ReadSpec(j, "cdDelta");
            if (!delta) return std::unexpected(delta.error());
            auto ratio = ReadSpec(j, "cdRatio");
            if (!ratio) return std::unexpected(ratio.error());
            mod.cdDelta = std::move(*delta);
            mod.cdRatio = std::move(*ratio);
            modifier.kind = std::move(mod);
        } else if (type == "AddTalentExtraLevel") {
            AddTalentExtraLevel mod;
            mod.talentType = j.at("talentType").get<std::string>();
            mod.extraLevel = j.value("extraLevel", 0);
            modifier.kind = std::move(mod);
        } else if (type == "UnlockTalentParam") {
            UnlockTalentParam mod;
            mod.abilityName = j.at("abilityName").get<std::string>();
            mod.talentParam = j.at("talentParam").get<std::string>();
            modifier.kind = std::move(mod);
        } else {
            return std::unexpected("Unknown talent modifier type: " + type);
        }

        if (j.contains("predicates")) {
            for (const auto& predicateJson : j["predicates"]) {
                auto predicate = PredicateFromJson(predicateJson);
                if (!predicate) {
                    return std::unexpected(predicate.error());
                }
                modifier.predicates.push_back(std::move(*predicate));
            }
        }

        return modifier;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Invalid talent modifier: " + std::string(e.what()));
    }
}

nlohmann::json TalentModifierToJson(const TalentModifier& modifier) {
    nlohmann::json j;
    j["$type"] = TalentModifierTypeName(modifier.kind);

    std::visit([&j](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, ModifyAbility>) {
            j["abilityName"] = m.abilityName;
            j["paramSpecial"] = m.paramSpecial;
            if (!IsAbsent(m.paramDelta)) j["paramDelta"] = ParamSpecToJson(m.paramDelta);
            if (!IsAbsent(m.paramRatio)) j["paramRatio"] = ParamSpecToJson(m.paramRatio);
        } else if constexpr (std::is_same_v<T, ModifySkillCD>) {
            j["skillId"] = m.skillId;
            if (!IsAbsent(m.cdDelta)) j["cdDelta"] = ParamSpecToJson(m.cdDelta);
            if (!IsAbsent(m.cdRatio)) j["cdRatio"] = ParamSpecToJson(m.cdRatio);
        } else if constexpr (std::is_same_v<T, AddTalentExtraLevel>) {
            j["talentType"] = m.talentType;
            j["extraLevel"] = m.extraLevel;
        } else {
            j["abilityName"] = m.abilityName;
            j["talentParam"] = m.talentParam;
        }
    }, modifier.kind);

    if (!modifier.predicates.empty()) {
        j["predicates"] = nlohmann::json::array();
        for (const auto& predicate : modifier.predicates) {
            j["predicates"].push_back(PredicateToJson(predicate));
        }
    }

    return j;
}

} // namespace Ability
} // namespace Forge
