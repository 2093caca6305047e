#pragma once

#include "ability/AbilityConfig.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Forge {
namespace Ability {

namespace detail {

/**
 * @brief Decode the UTF-8 sequence starting at pos and advance past it
 *
 * A malformed, overlong or truncated sequence yields its lead byte as the
 * code point and advances by one byte.
 */
constexpr uint32_t DecodeUtf8(std::string_view str, size_t& pos) noexcept {
    const auto lead = static_cast<unsigned char>(str[pos]);
    size_t length = 0;
    uint32_t codePoint = 0;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        codePoint = lead & 0x1Fu;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        codePoint = lead & 0x0Fu;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        codePoint = lead & 0x07u;
    }

    if (length == 0 || pos + length > str.size()) {
        ++pos;
        return lead;
    }

    for (size_t k = 1; k < length; ++k) {
        const auto next = static_cast<unsigned char>(str[pos + k]);
        if ((next & 0xC0u) != 0x80u) {
            ++pos;
            return lead;
        }
        codePoint = (codePoint << 6) | (next & 0x3Fu);
    }

    if ((length == 3 && codePoint < 0x800u) ||
        (length == 4 && (codePoint < 0x10000u || codePoint > 0x10FFFFu))) {
        ++pos;
        return lead;
    }

    pos += length;
    return codePoint;
}

} // namespace detail

/**
 * @brief 32-bit identifier hash used by clients for ability, special and
 * modifier names
 *
 * h = h * 131 + unit, wrapping, starting from 0, over the UTF-16 code units
 * of the name. Names are stored as UTF-8 and transcoded on the fly, so
 * non-ASCII names hash the same as on the client; ASCII names hash their
 * bytes.
 */
[[nodiscard]] constexpr uint32_t AbilityHash(std::string_view str) noexcept {
    uint32_t hash = 0;
    for (size_t pos = 0; pos < str.size();) {
        const uint32_t codePoint = detail::DecodeUtf8(str, pos);
        if (codePoint > 0xFFFFu) {
            const uint32_t offset = codePoint - 0x10000u;
            hash = hash * 131u + (0xD800u + (offset >> 10));
            hash = hash * 131u + (0xDC00u + (offset & 0x3FFu));
        } else {
            hash = hash * 131u + codePoint;
        }
    }
    return hash;
}

/**
 * @brief Record of one name replaced by another with the same hash
 */
struct HashCollision {
    uint32_t hash = 0;
    std::string previous;
    std::string replacement;
};

/**
 * @brief Reverse lookup from name hash to the configuration key it came from
 *
 * Built once at startup from every loaded ability config and read-only
 * afterwards; concurrent Lookup calls need no synchronization. When two
 * distinct names share a hash the later one wins and the collision is
 * recorded.
 */
class NameHashIndex {
public:
    NameHashIndex() = default;

    /**
     * @brief Index every ability name, special name and modifier name
     * @param configs All loaded ability configs
     * @param logCollisions Emit a warning for each collision
     */
    [[nodiscard]] static NameHashIndex Build(std::span<const ConfigAbility> configs,
                                             bool logCollisions = true);

    /**
     * @brief Insert a name under its AbilityHash
     */
    void Insert(std::string_view name);

    /**
     * @brief Insert a name under an explicit hash
     */
    void Insert(uint32_t hash, std::string name);

    [[nodiscard]] std::optional<std::string> Lookup(uint32_t hash) const;

    /**
     * @brief Lookup that yields "unknown" for hashes not in the index
     */
    [[nodiscard]] std::string LookupOrUnknown(uint32_t hash) const;

    [[nodiscard]] bool Contains(uint32_t hash) const { return m_names.contains(hash); }
    [[nodiscard]] size_t Size() const { return m_names.size(); }

    [[nodiscard]] const std::vector<HashCollision>& GetCollisions() const { return m_collisions; }

    void SetLogCollisions(bool enabled) { m_logCollisions = enabled; }

private:
    std::unordered_map<uint32_t, std::string> m_names;
    std::vector<HashCollision> m_collisions;
    bool m_logCollisions = true;
};

} // namespace Ability
} // namespace Forge
