#include <strata/core/series.hpp>

#include <fmt/format.h>

#include <cmath>
#include <functional>
#include <type_traits>

namespace strata {

namespace {

template <typename T>
auto format_element(const T& value) -> std::string {
    if constexpr (std::is_same_v<T, std::string>) {
        return value;
    } else if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_floating_point_v<T>) {
        if (std::isnan(value)) {
            return "nan";
        }
        if (std::isinf(value)) {
            return value > 0 ? "inf" : "-inf";
        }
        return fmt::format("{:g}", value);
    } else {
        return fmt::format("{}", value);
    }
}

template <typename T>
auto wrap(Result<Column<T>> result) -> Result<Series> {
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    return Series{std::move(*result)};
}

}  // namespace

auto scalar_equal(const Scalar& a, const Scalar& b) noexcept -> bool {
    if (a.index() != b.index()) {
        return false;
    }
    return std::visit(
        [&b](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return true;
            } else {
                const auto& rhs = std::get<T>(b);
                if constexpr (std::is_floating_point_v<T>) {
                    if (std::isnan(lhs) || std::isnan(rhs)) {
                        return std::isnan(lhs) && std::isnan(rhs);
                    }
                }
                return lhs == rhs;
            }
        },
        a);
}

auto scalar_hash(const Scalar& value) noexcept -> std::size_t {
    const std::size_t tag = value.index();
    std::size_t h = std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return 0;
            } else if constexpr (std::is_floating_point_v<T>) {
                // NaN payloads differ; all NaNs share a bucket.
                if (std::isnan(v)) {
                    return 0x7ff8;
                }
                return std::hash<T>{}(v);
            } else {
                return std::hash<T>{}(v);
            }
        },
        value);
    return h ^ (tag + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

auto format_scalar(const Scalar& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else {
                return format_element(v);
            }
        },
        value);
}

// ─── Series ───────────────────────────────────────────────────────────────────

auto Series::empty(std::string name, DataType dtype) -> Series {
    return visit_dtype(dtype, [&](auto tag) -> Series {
        using T = typename decltype(tag)::type;
        return Series{Column<T>(std::move(name))};
    });
}

auto Series::name() const -> const std::string& {
    return std::visit([](const auto& col) -> const std::string& { return col.name(); }, column_);
}

void Series::rename(std::string name) {
    std::visit([&](auto& col) { col.rename(std::move(name)); }, column_);
}

auto Series::dtype() const noexcept -> DataType {
    return std::visit([](const auto& col) { return col.dtype(); }, column_);
}

auto Series::size() const noexcept -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column_);
}

auto Series::null_count() const noexcept -> std::size_t {
    return std::visit([](const auto& col) { return col.null_count(); }, column_);
}

auto Series::is_valid(std::size_t idx) const noexcept -> bool {
    return std::visit([idx](const auto& col) { return col.is_valid(idx); }, column_);
}

auto Series::get(std::size_t idx) const -> Result<Scalar> {
    if (idx >= size()) {
        return make_error(ErrorKind::IndexOutOfRange,
                          "index {} out of range for column '{}' of length {}", idx, name(),
                          size());
    }
    return at(idx);
}

auto Series::at(std::size_t idx) const -> Scalar {
    return std::visit(
        [idx](const auto& col) -> Scalar {
            if (!col.is_valid(idx)) {
                return std::monostate{};
            }
            using T = typename std::decay_t<decltype(col)>::value_type;
            return Scalar{std::in_place_type<T>, col[idx]};
        },
        column_);
}

auto Series::is_null() const -> Mask {
    return std::visit([](const auto& col) { return col.is_null(); }, column_);
}

auto Series::not_null() const -> Mask {
    return std::visit([](const auto& col) { return col.not_null(); }, column_);
}

auto Series::filter(const Mask& mask) const -> Result<Series> {
    return std::visit([&mask](const auto& col) { return wrap(col.filter(mask)); }, column_);
}

auto Series::take(std::span<const std::size_t> indices) const -> Result<Series> {
    return std::visit([indices](const auto& col) { return wrap(col.take(indices)); }, column_);
}

auto Series::take_optional(std::span<const std::optional<std::size_t>> indices) const
    -> Result<Series> {
    return std::visit([indices](const auto& col) { return wrap(col.take_optional(indices)); },
                      column_);
}

auto Series::head(std::size_t n) const -> Series {
    return std::visit([n](const auto& col) { return Series{col.head(n)}; }, column_);
}

auto Series::tail(std::size_t n) const -> Series {
    return std::visit([n](const auto& col) { return Series{col.tail(n)}; }, column_);
}

auto Series::argsort(bool descending) const -> std::vector<std::size_t> {
    return std::visit([descending](const auto& col) { return col.argsort(descending); }, column_);
}

auto Series::cast(DataType target) const -> Result<Series> {
    return std::visit(
        [target](const auto& col) -> Result<Series> {
            return visit_dtype(target, [&col](auto tag) -> Result<Series> {
                using U = typename decltype(tag)::type;
                return wrap(col.template cast<U>());
            });
        },
        column_);
}

auto Series::equals(const Series& other) const -> bool {
    if (column_.index() != other.column_.index()) {
        return false;
    }
    return std::visit(
        [&other](const auto& col) {
            using ColT = std::decay_t<decltype(col)>;
            return col.equals(std::get<ColT>(other.column_));
        },
        column_);
}

auto Series::format_cell(std::size_t idx) const -> std::string {
    return std::visit(
        [idx](const auto& col) -> std::string {
            if (!col.is_valid(idx)) {
                return "null";
            }
            using T = typename std::decay_t<decltype(col)>::value_type;
            return format_element<T>(col[idx]);
        },
        column_);
}

}  // namespace strata
