#pragma once

#include <strata/core/error.hpp>
#include <strata/table/table.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class JoinKind : std::uint8_t {
    Inner,
    Left,
    Right,
    Outer,
};

[[nodiscard]] auto join_kind_name(JoinKind kind) noexcept -> std::string_view;

/// One output row of a join: the contributing row of each side, or
/// nothing when that side is null-filled.
struct JoinPair {
    std::optional<std::size_t> left;
    std::optional<std::size_t> right;
};

using JoinResult = std::vector<JoinPair>;

/// Match rows of `left` and `right` on the paired key columns.
///
/// The right table is the build side: its key tuples are indexed first
/// and duplicate keys are kept. The left table is probed in row order and
/// every match is emitted in right row order. Left and Outer also emit
/// unmatched left rows; Right and Outer then append the unmatched right
/// rows in their original order. A key containing a null never matches.
/// Keys compare like group keys otherwise, so a NaN key matches a NaN key.
///
/// ColumnNotFound for a missing key, InvalidArgument when the key lists
/// differ in length or are empty, TypeMismatch when paired keys differ in
/// type.
[[nodiscard]] auto join_indices(const Table& left, const Table& right,
                                const std::vector<std::string>& left_on,
                                const std::vector<std::string>& right_on, JoinKind kind)
    -> Result<JoinResult>;

/// Materialise a join: all left columns, then the right columns that are
/// not join keys. Left key columns take the right key value on rows with no
/// left match. DuplicateColumn when a right non-key column name is already
/// used by the left table.
[[nodiscard]] auto join_tables(const Table& left, const Table& right,
                               const std::vector<std::string>& left_on,
                               const std::vector<std::string>& right_on, JoinKind kind)
    -> Result<Table>;

}  // namespace strata
