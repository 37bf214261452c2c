#pragma once

#include <strata/core/column.hpp>
#include <strata/core/dtype.hpp>
#include <strata/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace strata {

/// Closed set of column alternatives, one per DataType.
using ColumnValue =
    std::variant<Column<bool>, Column<std::int8_t>, Column<std::int16_t>, Column<std::int32_t>,
                 Column<std::int64_t>, Column<std::uint8_t>, Column<std::uint16_t>,
                 Column<std::uint32_t>, Column<std::uint64_t>, Column<float>, Column<double>,
                 Column<std::string>>;

/// A single cell. `std::monostate` is null.
using Scalar = std::variant<std::monostate, bool, std::int8_t, std::int16_t, std::int32_t,
                            std::int64_t, std::uint8_t, std::uint16_t, std::uint32_t,
                            std::uint64_t, float, double, std::string>;

[[nodiscard]] inline auto is_null(const Scalar& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// Equality used for grouping and join keys: null equals null, NaN equals NaN.
[[nodiscard]] auto scalar_equal(const Scalar& a, const Scalar& b) noexcept -> bool;

/// Hash consistent with scalar_equal.
[[nodiscard]] auto scalar_hash(const Scalar& value) noexcept -> std::size_t;

/// Human-readable text for one cell ("null" for nulls).
[[nodiscard]] auto format_scalar(const Scalar& value) -> std::string;

/// A runtime-typed column.
///
/// Series wraps one ColumnValue alternative and forwards the shared
/// capabilities (gather, cast, compare, display) to it by std::visit.
class Series {
   public:
    Series() = default;

    template <ColumnElement T>
    Series(Column<T> column)  // NOLINT(google-explicit-constructor)
        : column_(std::move(column)) {}

    /// Empty column of the given runtime type, for incremental population.
    [[nodiscard]] static auto empty(std::string name, DataType dtype) -> Series;

    [[nodiscard]] auto name() const -> const std::string&;
    void rename(std::string name);

    [[nodiscard]] auto dtype() const noexcept -> DataType;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto null_count() const noexcept -> std::size_t;
    [[nodiscard]] auto is_valid(std::size_t idx) const noexcept -> bool;

    /// Bounds-checked cell access.
    [[nodiscard]] auto get(std::size_t idx) const -> Result<Scalar>;

    /// Unchecked cell access.
    [[nodiscard]] auto at(std::size_t idx) const -> Scalar;

    template <ColumnElement T>
    [[nodiscard]] auto as() const noexcept -> const Column<T>* {
        return std::get_if<Column<T>>(&column_);
    }

    template <ColumnElement T>
    [[nodiscard]] auto as() noexcept -> Column<T>* {
        return std::get_if<Column<T>>(&column_);
    }

    [[nodiscard]] auto column() const noexcept -> const ColumnValue& { return column_; }

    template <typename F>
    decltype(auto) visit(F&& func) const {
        return std::visit(std::forward<F>(func), column_);
    }

    [[nodiscard]] auto is_null() const -> Mask;
    [[nodiscard]] auto not_null() const -> Mask;

    [[nodiscard]] auto filter(const Mask& mask) const -> Result<Series>;
    [[nodiscard]] auto take(std::span<const std::size_t> indices) const -> Result<Series>;
    [[nodiscard]] auto take_optional(std::span<const std::optional<std::size_t>> indices) const
        -> Result<Series>;
    [[nodiscard]] auto head(std::size_t n) const -> Series;
    [[nodiscard]] auto tail(std::size_t n) const -> Series;

    [[nodiscard]] auto argsort(bool descending = false) const -> std::vector<std::size_t>;

    /// Runtime-tagged cast; see Column<T>::cast.
    [[nodiscard]] auto cast(DataType target) const -> Result<Series>;

    /// Same dtype, length, null positions and values. Names are ignored.
    [[nodiscard]] auto equals(const Series& other) const -> bool;

    /// Display text for one cell; "null" for nulls.
    [[nodiscard]] auto format_cell(std::size_t idx) const -> std::string;

   private:
    ColumnValue column_;
};

}  // namespace strata
