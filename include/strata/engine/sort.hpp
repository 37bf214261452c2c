#pragma once

#include <strata/core/error.hpp>
#include <strata/table/table.hpp>

#include <cstddef>
#include <vector>

namespace strata {

/// Stable permutation of `table`'s rows ordered by `keys` in priority order.
///
/// Each key compares non-null values in its own direction; nulls go after
/// every non-null value whatever the direction, and NaN sorts above all
/// other floats. Rows equal on every key keep their original order.
/// ColumnNotFound for an unknown key.
[[nodiscard]] auto sort_indices(const Table& table, const std::vector<SortKey>& keys)
    -> Result<std::vector<std::size_t>>;

}  // namespace strata
