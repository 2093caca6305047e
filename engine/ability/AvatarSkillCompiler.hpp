#pragma once

#include "ability/AbilityConfig.hpp"
#include "ability/Predicate.hpp"
#include "ability/SkillDepot.hpp"
#include "ability/TalentLevel.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace Forge {
namespace Ability {

/**
 * @brief Everything needed to compile one character definition's depot
 */
struct AvatarSkillDefinition {
    uint32_t avatarId = 0;
    std::vector<std::string> abilityNames;
    std::map<uint32_t, float> skillCooldowns;
    std::vector<TalentLevelData> talents;   // unlocked levels, in unlock order

    static std::expected<AvatarSkillDefinition, std::string> FromJson(const nlohmann::json& j);
};

/**
 * @brief Result of compiling a definition
 */
struct CompiledAvatar {
    uint32_t avatarId = 0;
    SkillDepot depot;
    std::vector<TalentApplyResult> talentResults;   // one per talent, same order

    [[nodiscard]] size_t FailureCount() const;
};

/**
 * @brief Builds per-character skill depots from loaded ability configs
 *
 * Compilation happens once per character definition; the compiled depot is
 * then cloned for every live instance of that character.
 */
class AvatarSkillCompiler {
public:
    explicit AvatarSkillCompiler(std::span<const ConfigAbility> abilities);

    /**
     * @brief Depot holding the default specials of every listed ability
     * @return Error naming the first ability with no loaded config
     */
    [[nodiscard]] std::expected<SkillDepot, std::string> BuildBaseDepot(
        const AvatarSkillDefinition& definition) const;

    /**
     * @brief Build the base depot and apply every talent of the definition
     *
     * Modifier failures are collected in the result rather than failing the
     * compilation.
     */
    [[nodiscard]] std::expected<CompiledAvatar, std::string> Compile(
        const AvatarSkillDefinition& definition,
        const IPredicateContext& context) const;

    [[nodiscard]] std::expected<CompiledAvatar, std::string> Compile(
        const AvatarSkillDefinition& definition) const;

    /**
     * @brief Independent copies of a compiled depot for live instances
     * @param parallel Spread the copies over the job system
     * @throws Whatever a depot copy throws (e.g. std::bad_alloc); no partial
     *         result is returned
     */
    [[nodiscard]] static std::vector<SkillDepot> CloneDepots(const SkillDepot& base,
                                                             size_t count,
                                                             bool parallel = true);

    [[nodiscard]] const ConfigAbility* FindAbility(const std::string& abilityName) const;

    [[nodiscard]] size_t AbilityCount() const { return m_abilities.size(); }

private:
    std::unordered_map<std::string, ConfigAbility> m_abilities;
};

/**
 * @brief Parse avatar definitions (a single object or an array) from a file
 */
[[nodiscard]] std::expected<std::vector<AvatarSkillDefinition>, std::string> LoadAvatarDefinitions(
    const std::filesystem::path& filepath);

} // namespace Ability
} // namespace Forge
