#include "ability/AbilityConfig.hpp"
#include "core/Logger.hpp"

#include <fstream>

namespace Forge {
namespace Ability {

std::expected<ConfigAbility, std::string> AbilityConfigParser::Parse(const nlohmann::ordered_json& json) const {
    if (!json.is_object()) {
        return std::unexpected("Ability config must be an object");
    }
    if (!json.contains("abilityName") || !json["abilityName"].is_string()) {
        return std::unexpected("Ability config is missing abilityName");
    }

    ConfigAbility config;
    config.abilityName = json["abilityName"].get<std::string>();

    if (json.contains("abilitySpecials") && !json["abilitySpecials"].is_null()) {
        const auto& specials = json["abilitySpecials"];
        if (!specials.is_object()) {
            return std::unexpected("abilitySpecials of " + config.abilityName + " must be an object");
        }
        for (const auto& [name, value] : specials.items()) {
            if (!value.is_number()) {
                return std::unexpected("Special " + config.abilityName + "." + name + " is not a number");
            }
            if (!config.abilitySpecials.contains(name)) {
                config.specialNames.push_back(name);
            }
            config.abilitySpecials[name] = value.get<float>();
        }
    }

    if (json.contains("modifiers") && !json["modifiers"].is_null()) {
        const auto& modifiers = json["modifiers"];
        if (!modifiers.is_object()) {
            return std::unexpected("modifiers of " + config.abilityName + " must be an object");
        }
        for (const auto& item : modifiers.items()) {
            config.modifierNames.push_back(item.key());
        }
    }

    return config;
}

std::expected<std::vector<ConfigAbility>, std::string> AbilityConfigParser::ParseDocument(
    const nlohmann::ordered_json& json) const
{
    std::vector<ConfigAbility> configs;

    if (json.is_array()) {
        configs.reserve(json.size());
        for (const auto& entry : json) {
            auto config = Parse(entry);
            if (!config) {
                return std::unexpected(config.error());
            }
            configs.push_back(std::move(*config));
        }
        return configs;
    }

    auto config = Parse(json);
    if (!config) {
        return std::unexpected(config.error());
    }
    configs.push_back(std::move(*config));
    return configs;
}

std::expected<std::vector<ConfigAbility>, std::string> AbilityConfigParser::ParseString(
    const std::string& jsonString) const
{
    try {
        auto json = nlohmann::ordered_json::parse(jsonString);
        return ParseDocument(json);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }
}

std::expected<std::vector<ConfigAbility>, std::string> AbilityConfigParser::ParseFile(
    const std::filesystem::path& filepath) const
{
    if (!std::filesystem::exists(filepath)) {
        return std::unexpected("File not found: " + filepath.string());
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::unexpected("Could not open file: " + filepath.string());
    }

    try {
        auto json = nlohmann::ordered_json::parse(file);
        auto configs = ParseDocument(json);
        if (configs) {
            FORGE_LOG_INFO("Loaded {} ability configs from {}", configs->size(), filepath.string());
        }
        return configs;
    } catch (const nlohmann::ordered_json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }
}

} // namespace Ability
} // namespace Forge
