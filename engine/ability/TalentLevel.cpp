#include "ability/TalentLevel.hpp"
#include "core/Logger.hpp"

namespace Forge {
namespace Ability {

nlohmann::json TalentLevelData::ToJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["paramList"] = paramList;
    j["modifiers"] = nlohmann::json::array();
    for (const auto& modifier : modifiers) {
        j["modifiers"].push_back(TalentModifierToJson(modifier));
    }
    return j;
}

std::expected<TalentLevelData, std::string> TalentLevelData::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected("Talent level must be an object");
    }

    TalentLevelData talent;
    try {
        talent.id = j.value("id", 0u);
        if (j.contains("paramList")) {
            talent.paramList = j["paramList"].get<ParamList>();
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Invalid talent level: " + std::string(e.what()));
    }

    if (j.contains("modifiers")) {
        if (!j["modifiers"].is_array()) {
            return std::unexpected("modifiers of talent " + std::to_string(talent.id) + " must be an array");
        }
        for (const auto& modifierJson : j["modifiers"]) {
            auto modifier = TalentModifierFromJson(modifierJson);
            if (!modifier) {
                return std::unexpected("Talent " + std::to_string(talent.id) + ": " + modifier.error());
            }
            talent.modifiers.push_back(std::move(*modifier));
        }
    }

    return talent;
}

TalentApplyResult ApplyModifiers(std::span<const TalentModifier> modifiers,
                                 SkillDepot& depot,
                                 std::span<const double> params,
                                 const IPredicateContext& context) {
    TalentApplyResult result;

    for (size_t i = 0; i < modifiers.size(); ++i) {
        const auto& modifier = modifiers[i];

        if (!EvaluateAll(modifier.predicates, context)) {
            ++result.gated;
            continue;
        }

        auto applied = ApplyModifierKind(modifier.kind, depot, params);
        if (!applied) {
            const char* type = TalentModifierTypeName(modifier.kind);
            FORGE_LOG_WARN("Skipping {} #{} on depot {}: {}", type, i, depot.depotId,
                           EngineErrorToString(applied.error()));
            result.failures.push_back(ModifierFailure{i, type, applied.error()});
            continue;
        }

        ++result.applied;
    }

    return result;
}

TalentApplyResult ApplyTalentLevel(const TalentLevelData& talent,
                                   SkillDepot& depot,
                                   const IPredicateContext& context) {
    FORGE_LOG_DEBUG("Applying talent {} ({} modifiers) to depot {}",
                    talent.id, talent.modifiers.size(), depot.depotId);
    return ApplyModifiers(talent.modifiers, depot, talent.paramList, context);
}

TalentApplyResult ApplyTalentLevel(const TalentLevelData& talent, SkillDepot& depot) {
    const PredicateContext empty{};
    return ApplyTalentLevel(talent, depot, empty);
}

std::expected<std::vector<TalentLevelData>, std::string> ParseTalentLevels(const nlohmann::json& json) {
    std::vector<TalentLevelData> talents;

    if (!json.is_array()) {
        auto talent = TalentLevelData::FromJson(json);
        if (!talent) {
            return std::unexpected(talent.error());
        }
        talents.push_back(std::move(*talent));
        return talents;
    }

    for (const auto& entry : json) {
        auto talent = TalentLevelData::FromJson(entry);
        if (!talent) {
            return std::unexpected(talent.error());
        }
        talents.push_back(std::move(*talent));
    }
    return talents;
}

} // namespace Ability
} // namespace Forge
