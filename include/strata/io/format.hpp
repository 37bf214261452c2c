#pragma once

#include <strata/core/series.hpp>
#include <strata/table/table.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>

namespace strata {

/// Default number of rows rendered before eliding the middle.
inline constexpr std::size_t kDefaultDisplayRows = 20;

/// Render a table as aligned text: a header of column names, a dashed
/// separator, one line per row with nulls shown as "null", and a
/// "[rows x cols]" footer. Tables longer than `max_rows` show the first and
/// last halves separated by "...".
[[nodiscard]] auto format_table(const Table& table, std::size_t max_rows = kDefaultDisplayRows)
    -> std::string;

/// Render one column with its name and dtype as the header.
[[nodiscard]] auto format_series(const Series& series, std::size_t max_rows = kDefaultDisplayRows)
    -> std::string;

void print(const Table& table, std::ostream& out, std::size_t max_rows = kDefaultDisplayRows);
void print(const Series& series, std::ostream& out, std::size_t max_rows = kDefaultDisplayRows);

}  // namespace strata
