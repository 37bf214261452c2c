#include <strata/core/strings.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace strata {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

auto map_strings(const Column<std::string>& column, std::string_view suffix, auto&& func)
    -> Column<std::string> {
    auto out = column.apply(
        [&](const std::optional<std::string>& value) -> std::optional<std::string> {
            if (!value.has_value()) {
                return std::nullopt;
            }
            return func(*value);
        });
    out.rename(fmt::format("{}_{}", column.name(), suffix));
    return out;
}

auto match_strings(const Column<std::string>& column, std::string_view suffix, auto&& pred)
    -> Mask {
    std::vector<bool> out(column.size());
    for (std::size_t i = 0; i < column.size(); ++i) {
        out[i] = column.is_valid(i) && pred(std::string_view{column[i]});
    }
    return Mask(fmt::format("{}_{}", column.name(), suffix), std::move(out));
}

}  // namespace

auto StringAccessor::str_len() const -> Column<std::uint32_t> {
    auto out = column_->apply(
        [](const std::optional<std::string>& value) -> std::optional<std::uint32_t> {
            if (!value.has_value()) {
                return std::nullopt;
            }
            return static_cast<std::uint32_t>(value->size());
        });
    out.rename(fmt::format("{}_len", column_->name()));
    return out;
}

auto StringAccessor::to_uppercase() const -> Column<std::string> {
    return map_strings(*column_, "upper", [](std::string s) {
        std::ranges::transform(s, s.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        return s;
    });
}

auto StringAccessor::to_lowercase() const -> Column<std::string> {
    return map_strings(*column_, "lower", [](std::string s) {
        std::ranges::transform(s, s.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return s;
    });
}

auto StringAccessor::contains(std::string_view pattern) const -> Mask {
    return match_strings(*column_, fmt::format("contains_{}", pattern),
                         [pattern](std::string_view s) { return s.find(pattern) != s.npos; });
}

auto StringAccessor::starts_with(std::string_view prefix) const -> Mask {
    return match_strings(*column_, fmt::format("startswith_{}", prefix),
                         [prefix](std::string_view s) { return s.starts_with(prefix); });
}

auto StringAccessor::ends_with(std::string_view suffix) const -> Mask {
    return match_strings(*column_, fmt::format("endswith_{}", suffix),
                         [suffix](std::string_view s) { return s.ends_with(suffix); });
}

auto StringAccessor::replace(std::string_view from, std::string_view to) const
    -> Column<std::string> {
    return map_strings(*column_, "replaced", [from, to](const std::string& s) {
        if (from.empty()) {
            return s;
        }
        std::string out;
        out.reserve(s.size());
        std::size_t pos = 0;
        while (true) {
            auto hit = s.find(from, pos);
            if (hit == std::string::npos) {
                out.append(s, pos, std::string::npos);
                break;
            }
            out.append(s, pos, hit - pos);
            out.append(to);
            pos = hit + from.size();
        }
        return out;
    });
}

auto StringAccessor::strip() const -> Column<std::string> {
    return map_strings(*column_, "strip", [](const std::string& s) {
        auto first = s.find_first_not_of(kWhitespace);
        if (first == std::string::npos) {
            return std::string{};
        }
        auto last = s.find_last_not_of(kWhitespace);
        return s.substr(first, last - first + 1);
    });
}

auto StringAccessor::lstrip() const -> Column<std::string> {
    return map_strings(*column_, "lstrip", [](const std::string& s) {
        auto first = s.find_first_not_of(kWhitespace);
        return first == std::string::npos ? std::string{} : s.substr(first);
    });
}

auto StringAccessor::rstrip() const -> Column<std::string> {
    return map_strings(*column_, "rstrip", [](const std::string& s) {
        auto last = s.find_last_not_of(kWhitespace);
        return last == std::string::npos ? std::string{} : s.substr(0, last + 1);
    });
}

auto str(const Series& series) -> Result<StringAccessor> {
    const auto* column = series.as<std::string>();
    if (column == nullptr) {
        return make_error(ErrorKind::TypeMismatch,
                          "string operations need a str column, but '{}' is {}", series.name(),
                          dtype_name(series.dtype()));
    }
    return StringAccessor{*column};
}

}  // namespace strata
