#pragma once

#include "ability/EngineError.hpp"

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace Forge {
namespace Ability {

/**
 * @brief Per-context parameter list (one talent level or proud-skill level)
 */
using ParamList = std::vector<double>;

/**
 * @brief Delta/ratio specification as authored in talent configs
 *
 * - std::monostate: field absent
 * - double: literal value
 * - std::string: indexed reference into the ParamList, e.g. "%2"
 */
using ParamSpec = std::variant<std::monostate, double, std::string>;

/**
 * @brief Build a ParamSpec from a JSON field value
 * @return nullopt when the value is neither null, number nor string
 */
[[nodiscard]] std::optional<ParamSpec> ParamSpecFromJson(const nlohmann::json& value);

[[nodiscard]] nlohmann::json ParamSpecToJson(const ParamSpec& spec);

[[nodiscard]] inline bool IsAbsent(const ParamSpec& spec) {
    return std::holds_alternative<std::monostate>(spec);
}

/**
 * @brief Parse the index encoded in a reference string
 *
 * Every '%' is removed, then the remainder must be a base-10 integer with an
 * optional leading sign (surrounding whitespace allowed). A negative index
 * parses but is out of range for any list.
 */
[[nodiscard]] std::expected<long long, EngineError> ParseReferenceIndex(std::string_view reference);

/**
 * @brief Resolve a specification against a parameter list
 * @return nullopt for an absent spec, the float value otherwise
 */
[[nodiscard]] std::expected<std::optional<float>, EngineError> ResolveParamReference(
    const ParamSpec& spec,
    std::span<const double> params);

/**
 * @brief Apply "+= delta, then *= ratio" to a value
 *
 * Shared by every modifier kind that carries a delta/ratio pair. A literal
 * ratio of exactly zero is ignored; a referenced ratio that resolves to zero
 * is applied. On error the input value is not touched.
 */
[[nodiscard]] std::expected<float, EngineError> ApplyDeltaRatio(
    float value,
    const ParamSpec& delta,
    const ParamSpec& ratio,
    std::span<const double> params);

} // namespace Ability
} // namespace Forge
