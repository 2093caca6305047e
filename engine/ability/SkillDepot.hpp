#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace Forge {
namespace Ability {

/**
 * @brief Named numeric parameters of one ability ("specials")
 */
using AbilitySpecials = std::map<std::string, float, std::less<>>;

/**
 * @brief Parse a decimal skill id key such as "10013"
 * @return nullopt unless the whole text is a number that fits in 32 bits
 */
[[nodiscard]] std::optional<uint32_t> ParseSkillId(std::string_view text);

/**
 * @brief Mutable per-character store read and written by talent modifiers
 *
 * A depot belongs to exactly one live character and is mutated by one
 * thread at a time. Copying a depot yields a fully independent clone.
 */
struct SkillDepot {
    uint32_t depotId = 0;

    // ability name -> special name -> value
    std::map<std::string, AbilitySpecials, std::less<>> abilitySpecials;

    // skill id -> cooldown in seconds
    std::map<uint32_t, float> skillCooldowns;

    // talent slot ("NormalAttack", "Skill", "Burst") -> extra levels granted
    std::map<std::string, int32_t, std::less<>> extraTalentLevels;

    // ability name -> unlocked talent params
    std::map<std::string, std::set<std::string, std::less<>>, std::less<>> unlockedTalentParams;

    [[nodiscard]] bool HasAbility(std::string_view abilityName) const {
        return abilitySpecials.find(abilityName) != abilitySpecials.end();
    }

    /**
     * @brief Register an ability, merging into any specials already present
     */
    void AddAbility(const std::string& abilityName, const AbilitySpecials& specials = {});

    [[nodiscard]] std::optional<float> GetSpecial(std::string_view abilityName,
                                                  std::string_view specialName) const;

    /**
     * @brief Overwrite an existing special
     * @return false when the ability or the special does not exist
     */
    bool SetSpecial(std::string_view abilityName, std::string_view specialName, float value);

    [[nodiscard]] int32_t GetExtraLevel(std::string_view talentType) const;

    [[nodiscard]] bool IsTalentParamUnlocked(std::string_view abilityName,
                                             std::string_view talentParam) const;

    [[nodiscard]] nlohmann::json ToJson() const;

    static std::expected<SkillDepot, std::string> FromJson(const nlohmann::json& j);
};

} // namespace Ability
} // namespace Forge
