#include "ability/AvatarSkillCompiler.hpp"
#include "core/JobSystem.hpp"
#include "core/Logger.hpp"

#include <fstream>
#include <numeric>

namespace Forge {
namespace Ability {

// ============================================================================
// AvatarSkillDefinition
// ============================================================================

std::expected<AvatarSkillDefinition, std::string> AvatarSkillDefinition::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected("Avatar definition must be an object");
    }

    AvatarSkillDefinition definition;
    try {
        definition.avatarId = j.value("avatarId", 0u);
        if (j.contains("abilities")) {
            definition.abilityNames = j["abilities"].get<std::vector<std::string>>();
        }
        if (j.contains("skillCooldowns")) {
            for (const auto& [key, cooldown] : j["skillCooldowns"].items()) {
                auto skillId = ParseSkillId(key);
                if (!skillId) {
                    return std::unexpected("Invalid skill id in avatar definition: " + key);
                }
                definition.skillCooldowns[*skillId] = cooldown.get<float>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Invalid avatar definition: " + std::string(e.what()));
    }

    if (j.contains("talents")) {
        auto talents = ParseTalentLevels(j["talents"]);
        if (!talents) {
            return std::unexpected("Avatar " + std::to_string(definition.avatarId) + ": " + talents.error());
        }
        definition.talents = std::move(*talents);
    }

    return definition;
}

size_t CompiledAvatar::FailureCount() const {
    return std::accumulate(talentResults.begin(), talentResults.end(), size_t(0),
        [](size_t sum, const TalentApplyResult& r) { return sum + r.failures.size(); });
}

// ============================================================================
// AvatarSkillCompiler
// ============================================================================

AvatarSkillCompiler::AvatarSkillCompiler(std::span<const ConfigAbility> abilities) {
    m_abilities.reserve(abilities.size());
    for (const auto& ability : abilities) {
        m_abilities.insert_or_assign(ability.abilityName, ability);
    }
}

const ConfigAbility* AvatarSkillCompiler::FindAbility(const std::string& abilityName) const {
    auto it = m_abilities.find(abilityName);
    return it != m_abilities.end() ? &it->second : nullptr;
}

std::expected<SkillDepot, std::string> AvatarSkillCompiler::BuildBaseDepot(
    const AvatarSkillDefinition& definition) const
{
    SkillDepot depot;
    depot.depotId = definition.avatarId;

    for (const auto& abilityName : definition.abilityNames) {
        const auto* ability = FindAbility(abilityName);
        if (!ability) {
            return std::unexpected("Avatar " + std::to_string(definition.avatarId) +
                                   " references unloaded ability " + abilityName);
        }
        depot.AddAbility(ability->abilityName, ability->abilitySpecials);
    }

    depot.skillCooldowns = definition.skillCooldowns;
    return depot;
}

std::expected<CompiledAvatar, std::string> AvatarSkillCompiler::Compile(
    const AvatarSkillDefinition& definition,
    const IPredicateContext& context) const
{
    auto depot = BuildBaseDepot(definition);
    if (!depot) {
        return std::unexpected(depot.error());
    }

    CompiledAvatar compiled;
    compiled.avatarId = definition.avatarId;
    compiled.depot = std::move(*depot);
    compiled.talentResults.reserve(definition.talents.size());

    for (const auto& talent : definition.talents) {
        compiled.talentResults.push_back(ApplyTalentLevel(talent, compiled.depot, context));
    }

    const size_t failures = compiled.FailureCount();
    if (failures > 0) {
        FORGE_LOG_WARN("Compiled avatar {} with {} skipped modifiers", definition.avatarId, failures);
    } else {
        FORGE_LOG_DEBUG("Compiled avatar {}: {} abilities, {} talents", definition.avatarId,
                        compiled.depot.abilitySpecials.size(), definition.talents.size());
    }

    return compiled;
}

std::expected<CompiledAvatar, std::string> AvatarSkillCompiler::Compile(
    const AvatarSkillDefinition& definition) const
{
    const PredicateContext empty{};
    return Compile(definition, empty);
}

std::vector<SkillDepot> AvatarSkillCompiler::CloneDepots(const SkillDepot& base, size_t count, bool parallel) {
    std::vector<SkillDepot> clones(count);

    auto copyOne = [&base, &clones](size_t i) {
        clones[i] = base;
    };

    if (parallel) {
        JobSystem::Instance().ParallelFor(count, copyOne);
    } else {
        for (size_t i = 0; i < count; ++i) {
            copyOne(i);
        }
    }

    return clones;
}

// ============================================================================
// Loading
// ============================================================================

std::expected<std::vector<AvatarSkillDefinition>, std::string> LoadAvatarDefinitions(
    const std::filesystem::path& filepath)
{
    if (!std::filesystem::exists(filepath)) {
        return std::unexpected("File not found: " + filepath.string());
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::unexpected("Could not open file: " + filepath.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }

    std::vector<AvatarSkillDefinition> definitions;
    const auto parseOne = [&definitions](const nlohmann::json& entry) -> std::expected<void, std::string> {
        auto definition = AvatarSkillDefinition::FromJson(entry);
        if (!definition) {
            return std::unexpected(definition.error());
        }
        definitions.push_back(std::move(*definition));
        return {};
    };

    if (json.is_array()) {
        for (const auto& entry : json) {
            auto parsed = parseOne(entry);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
        }
    } else {
        auto parsed = parseOne(json);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
    }

    FORGE_LOG_INFO("Loaded {} avatar definitions from {}", definitions.size(), filepath.string());
    return definitions;
}

} // namespace Ability
} // namespace Forge
