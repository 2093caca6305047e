#include "ability/AbilityHash.hpp"
#include "ability/EngineError.hpp"
#include "core/Logger.hpp"

namespace Forge {
namespace Ability {

NameHashIndex NameHashIndex::Build(std::span<const ConfigAbility> configs, bool logCollisions) {
    NameHashIndex index;
    index.m_logCollisions = logCollisions;

    for (const auto& config : configs) {
        index.Insert(config.abilityName);
        // Configs built in code carry no declared order; fall back to key order
        if (config.specialNames.empty()) {
            for (const auto& special : config.abilitySpecials) {
                index.Insert(special.first);
            }
        } else {
            for (const auto& special : config.specialNames) {
                index.Insert(special);
            }
        }
        for (const auto& modifier : config.modifierNames) {
            index.Insert(modifier);
        }
    }

    FORGE_LOG_INFO("Built name hash index: {} names from {} abilities, {} collisions",
                   index.Size(), configs.size(), index.m_collisions.size());
    return index;
}

void NameHashIndex::Insert(std::string_view name) {
    Insert(AbilityHash(name), std::string(name));
}

void NameHashIndex::Insert(uint32_t hash, std::string name) {
    auto [it, inserted] = m_names.try_emplace(hash, name);
    if (inserted || it->second == name) {
        return;
    }

    if (m_logCollisions) {
        FORGE_LOG_WARN("{}: {:#010x} maps to both '{}' and '{}', keeping '{}'",
                       EngineErrorToString(EngineError::HashCollision),
                       hash, it->second, name, name);
    }
    m_collisions.push_back(HashCollision{hash, it->second, name});
    it->second = std::move(name);
}

std::optional<std::string> NameHashIndex::Lookup(uint32_t hash) const {
    auto it = m_names.find(hash);
    if (it == m_names.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string NameHashIndex::LookupOrUnknown(uint32_t hash) const {
    return Lookup(hash).value_or("unknown");
}

} // namespace Ability
} // namespace Forge
