#pragma once

#include "ability/SkillDepot.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Forge {
namespace Ability {

/**
 * @brief One loaded ability definition
 *
 * Only the parts the engine consumes are kept: the ability name, its
 * default specials and the names of the modifiers it declares.
 */
struct ConfigAbility {
    std::string abilityName;
    AbilitySpecials abilitySpecials;
    std::vector<std::string> specialNames;    // abilitySpecials keys in declared order
    std::vector<std::string> modifierNames;   // declared order
};

/**
 * @brief Parser for ability definition documents
 *
 * A document is either a single ability object or an array of them:
 * {"abilityName": "...", "abilitySpecials": {"k": 1.0}, "modifiers": {"m": {...}}}
 *
 * Documents are read as ordered_json so special and modifier names keep the
 * order they are declared in.
 */
class AbilityConfigParser {
public:
    [[nodiscard]] std::expected<ConfigAbility, std::string> Parse(const nlohmann::ordered_json& json) const;

    [[nodiscard]] std::expected<std::vector<ConfigAbility>, std::string> ParseDocument(
        const nlohmann::ordered_json& json) const;

    [[nodiscard]] std::expected<std::vector<ConfigAbility>, std::string> ParseString(
        const std::string& jsonString) const;

    [[nodiscard]] std::expected<std::vector<ConfigAbility>, std::string> ParseFile(
        const std::filesystem::path& filepath) const;
};

} // namespace Ability
} // namespace Forge
