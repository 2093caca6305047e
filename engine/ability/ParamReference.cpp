#include "ability/ParamReference.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>

namespace Forge {
namespace Ability {

std::optional<ParamSpec> ParamSpecFromJson(const nlohmann::json& value) {
    if (value.is_null()) {
        return ParamSpec{std::monostate{}};
    }
    if (value.is_number()) {
        return ParamSpec{value.get<double>()};
    }
    if (value.is_string()) {
        return ParamSpec{value.get<std::string>()};
    }
    return std::nullopt;
}

nlohmann::json ParamSpecToJson(const ParamSpec& spec) {
    return std::visit([](const auto& val) -> nlohmann::json {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return val;
        }
    }, spec);
}

std::expected<long long, EngineError> ParseReferenceIndex(std::string_view reference) {
    std::string digits;
    digits.reserve(reference.size());
    std::copy_if(reference.begin(), reference.end(), std::back_inserter(digits),
                 [](char c) { return c != '%'; });

    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    auto first = std::find_if_not(digits.begin(), digits.end(), isSpace);
    auto last = std::find_if_not(digits.rbegin(), digits.rend(), isSpace).base();
    if (first >= last) {
        return std::unexpected(EngineError::MalformedReference);
    }

    std::string_view body(&*first, static_cast<size_t>(last - first));
    bool negative = false;
    if (body.front() == '+' || body.front() == '-') {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    if (body.empty() || !std::isdigit(static_cast<unsigned char>(body.front()))) {
        return std::unexpected(EngineError::MalformedReference);
    }

    long long index = 0;
    auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), index);
    if (ec != std::errc{} || ptr != body.data() + body.size()) {
        return std::unexpected(EngineError::MalformedReference);
    }

    return negative ? -index : index;
}

std::expected<std::optional<float>, EngineError> ResolveParamReference(
    const ParamSpec& spec,
    std::span<const double> params)
{
    if (const auto* literal = std::get_if<double>(&spec)) {
        return static_cast<float>(*literal);
    }

    if (const auto* reference = std::get_if<std::string>(&spec)) {
        auto index = ParseReferenceIndex(*reference);
        if (!index) {
            return std::unexpected(index.error());
        }
        if (*index < 0 || static_cast<unsigned long long>(*index) >= params.size()) {
            return std::unexpected(EngineError::IndexOutOfRange);
        }
        return static_cast<float>(params[static_cast<size_t>(*index)]);
    }

    return std::optional<float>{};
}

std::expected<float, EngineError> ApplyDeltaRatio(
    float value,
    const ParamSpec& delta,
    const ParamSpec& ratio,
    std::span<const double> params)
{
    auto resolvedDelta = ResolveParamReference(delta, params);
    if (!resolvedDelta) {
        return std::unexpected(resolvedDelta.error());
    }
    auto resolvedRatio = ResolveParamReference(ratio, params);
    if (!resolvedRatio) {
        return std::unexpected(resolvedRatio.error());
    }

    if (resolvedDelta->has_value()) {
        value += **resolvedDelta;
    }

    // Zero suppression applies to literals only
    if (resolvedRatio->has_value()) {
        const auto* literal = std::get_if<double>(&ratio);
        if (!literal || *literal != 0.0) {
            value *= **resolvedRatio;
        }
    }

    return value;
}

} // namespace Ability
} // namespace Forge
