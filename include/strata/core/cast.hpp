#pragma once

#include <strata/core/dtype.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <concepts>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace strata {

namespace detail {

template <std::floating_point F, std::integral I>
[[nodiscard]] auto float_to_integer(F value) noexcept -> std::optional<I> {
    if (!std::isfinite(value) || std::trunc(value) != value) {
        return std::nullopt;
    }
    // Both bounds are powers of two (or zero) and therefore exact in F.
    const F lower = static_cast<F>(std::numeric_limits<I>::min());
    const F upper = std::ldexp(F{1}, std::numeric_limits<I>::digits);
    if (value < lower || value >= upper) {
        return std::nullopt;
    }
    return static_cast<I>(value);
}

[[nodiscard]] inline auto parse_bool(std::string_view text) noexcept -> std::optional<bool> {
    auto equals_ci = [text](std::string_view word) {
        if (text.size() != word.size()) {
            return false;
        }
        for (std::size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            if (c != word[i]) {
                return false;
            }
        }
        return true;
    };
    if (equals_ci("true")) {
        return true;
    }
    if (equals_ci("false")) {
        return false;
    }
    return std::nullopt;
}

/// Parses the whole of `text` as a number; trailing characters fail.
template <NumericElement T>
[[nodiscard]] auto parse_number(std::string_view text) noexcept -> std::optional<T> {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    T value{};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace detail

/// Convert one value to `To`, succeeding only when the value is exactly
/// representable in the target type.
///
/// - integer -> integer: range checked
/// - integer <-> float: the value must survive the round trip unchanged
/// - f64 -> f32: must round-trip; NaN and infinities are kept
/// - bool <-> numeric: only 0 and 1
/// - anything -> string: decimal text ("true"/"false" for bool)
/// - string -> anything: the whole text must parse
template <ColumnElement To, ColumnElement From>
[[nodiscard]] auto cast_value(const From& value) -> std::optional<To> {
    if constexpr (std::same_as<To, From>) {
        return value;
    } else if constexpr (std::same_as<To, std::string>) {
        if constexpr (std::same_as<From, bool>) {
            return std::string(value ? "true" : "false");
        } else {
            return fmt::format("{}", value);
        }
    } else if constexpr (std::same_as<From, std::string>) {
        if constexpr (std::same_as<To, bool>) {
            return detail::parse_bool(value);
        } else {
            return detail::parse_number<To>(value);
        }
    } else if constexpr (std::same_as<From, bool>) {
        return static_cast<To>(value ? 1 : 0);
    } else if constexpr (std::same_as<To, bool>) {
        if (value == From{0}) {
            return false;
        }
        if (value == From{1}) {
            return true;
        }
        return std::nullopt;
    } else if constexpr (std::integral<From> && std::integral<To>) {
        if (!std::in_range<To>(value)) {
            return std::nullopt;
        }
        return static_cast<To>(value);
    } else if constexpr (std::floating_point<From> && std::integral<To>) {
        return detail::float_to_integer<From, To>(value);
    } else if constexpr (std::integral<From> && std::floating_point<To>) {
        const To converted = static_cast<To>(value);
        auto back = detail::float_to_integer<To, From>(converted);
        if (!back || *back != value) {
            return std::nullopt;
        }
        return converted;
    } else {
        // float <-> double
        if (std::isnan(value)) {
            return std::numeric_limits<To>::quiet_NaN();
        }
        if (std::isfinite(value) &&
            std::fabs(static_cast<long double>(value)) >
                static_cast<long double>(std::numeric_limits<To>::max())) {
            return std::nullopt;
        }
        const To converted = static_cast<To>(value);
        if (static_cast<From>(converted) != value) {
            return std::nullopt;
        }
        return converted;
    }
}

}  // namespace strata
