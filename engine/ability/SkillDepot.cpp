#include "ability/SkillDepot.hpp"

#include <charconv>
#include <system_error>

namespace Forge {
namespace Ability {

std::optional<uint32_t> ParseSkillId(std::string_view text) {
    uint32_t value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

void SkillDepot::AddAbility(const std::string& abilityName, const AbilitySpecials& specials) {
    auto& entry = abilitySpecials[abilityName];
    for (const auto& [name, value] : specials) {
        entry[name] = value;
    }
}

std::optional<float> SkillDepot::GetSpecial(std::string_view abilityName,
                                            std::string_view specialName) const {
    auto ability = abilitySpecials.find(abilityName);
    if (ability == abilitySpecials.end()) {
        return std::nullopt;
    }
    auto special = ability->second.find(specialName);
    if (special == ability->second.end()) {
        return std::nullopt;
    }
    return special->second;
}

bool SkillDepot::SetSpecial(std::string_view abilityName, std::string_view specialName, float value) {
    auto ability = abilitySpecials.find(abilityName);
    if (ability == abilitySpecials.end()) {
        return false;
    }
    auto special = ability->second.find(specialName);
    if (special == ability->second.end()) {
        return false;
    }
    special->second = value;
    return true;
}

int32_t SkillDepot::GetExtraLevel(std::string_view talentType) const {
    auto it = extraTalentLevels.find(talentType);
    return it != extraTalentLevels.end() ? it->second : 0;
}

bool SkillDepot::IsTalentParamUnlocked(std::string_view abilityName,
                                       std::string_view talentParam) const {
    auto it = unlockedTalentParams.find(abilityName);
    if (it == unlockedTalentParams.end()) {
        return false;
    }
    return it->second.find(talentParam) != it->second.end();
}

// ============================================================================
// Snapshot serialization
// ============================================================================

nlohmann::json SkillDepot::ToJson() const {
    nlohmann::json j;
    j["depotId"] = depotId;

    j["abilitySpecials"] = nlohmann::json::object();
    for (const auto& [ability, specials] : abilitySpecials) {
        auto& node = j["abilitySpecials"][ability];
        node = nlohmann::json::object();
        for (const auto& [name, value] : specials) {
            node[name] = value;
        }
    }

    // JSON object keys must be strings
    j["skillCooldowns"] = nlohmann::json::object();
    for (const auto& [skillId, cooldown] : skillCooldowns) {
        j["skillCooldowns"][std::to_string(skillId)] = cooldown;
    }

    j["extraTalentLevels"] = nlohmann::json::object();
    for (const auto& [talentType, level] : extraTalentLevels) {
        j["extraTalentLevels"][talentType] = level;
    }

    j["unlockedTalentParams"] = nlohmann::json::object();
    for (const auto& [ability, params] : unlockedTalentParams) {
        auto& node = j["unlockedTalentParams"][ability];
        node = nlohmann::json::array();
        for (const auto& param : params) {
            node.push_back(param);
        }
    }

    return j;
}

std::expected<SkillDepot, std::string> SkillDepot::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected("Skill depot snapshot must be an object");
    }

    SkillDepot depot;

    try {
        if (j.contains("depotId")) {
            depot.depotId = j["depotId"].get<uint32_t>();
        }

        if (j.contains("abilitySpecials")) {
            for (const auto& [ability, specials] : j["abilitySpecials"].items()) {
                auto& entry = depot.abilitySpecials[ability];
                for (const auto& [name, value] : specials.items()) {
                    entry[name] = value.get<float>();
                }
            }
        }

        if (j.contains("skillCooldowns")) {
            for (const auto& [key, cooldown] : j["skillCooldowns"].items()) {
                auto skillId = ParseSkillId(key);
                if (!skillId) {
                    return std::unexpected("Invalid skill id in snapshot: " + key);
                }
                depot.skillCooldowns[*skillId] = cooldown.get<float>();
            }
        }

        if (j.contains("extraTalentLevels")) {
            for (const auto& [talentType, level] : j["extraTalentLevels"].items()) {
                depot.extraTalentLevels[talentType] = level.get<int32_t>();
            }
        }

        if (j.contains("unlockedTalentParams")) {
            for (const auto& [ability, params] : j["unlockedTalentParams"].items()) {
                auto& entry = depot.unlockedTalentParams[ability];
                for (const auto& param : params) {
                    entry.insert(param.get<std::string>());
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Invalid skill depot snapshot: " + std::string(e.what()));
    }

    return depot;
}

} // namespace Ability
} // namespace Forge
