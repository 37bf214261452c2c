#pragma once

#include <strata/core/column.hpp>
#include <strata/core/error.hpp>
#include <strata/core/series.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace strata {

/// String operations over a Column<std::string>.
///
/// Every operation produces a new column of the same length; nulls stay
/// null. Output columns are named after the input, with a suffix naming
/// the operation (e.g. "name_len", "name_upper").
class StringAccessor {
   public:
    explicit StringAccessor(const Column<std::string>& column) : column_(&column) {}
    explicit StringAccessor(const Column<std::string>&& column) = delete;

    /// Length in bytes.
    [[nodiscard]] auto str_len() const -> Column<std::uint32_t>;
    [[nodiscard]] auto to_uppercase() const -> Column<std::string>;
    [[nodiscard]] auto to_lowercase() const -> Column<std::string>;
    [[nodiscard]] auto contains(std::string_view pattern) const -> Mask;
    [[nodiscard]] auto starts_with(std::string_view prefix) const -> Mask;
    [[nodiscard]] auto ends_with(std::string_view suffix) const -> Mask;
    /// Replace every non-overlapping occurrence of `from`.
    [[nodiscard]] auto replace(std::string_view from, std::string_view to) const
        -> Column<std::string>;
    [[nodiscard]] auto strip() const -> Column<std::string>;
    [[nodiscard]] auto lstrip() const -> Column<std::string>;
    [[nodiscard]] auto rstrip() const -> Column<std::string>;

   private:
    const Column<std::string>* column_;
};

/// String accessor for a runtime-typed column; TypeMismatch unless the
/// column holds strings. The accessor borrows `series`.
[[nodiscard]] auto str(const Series& series) -> Result<StringAccessor>;
auto str(const Series&& series) -> Result<StringAccessor> = delete;

}  // namespace strata
