#pragma once

#include <strata/core/error.hpp>
#include <strata/core/series.hpp>
#include <strata/table/table.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class AggFunc : std::uint8_t {
    Sum,
    Mean,
    Min,
    Max,
    Count,
    First,
    Last,
};

[[nodiscard]] auto agg_func_name(AggFunc func) noexcept -> std::string_view;
[[nodiscard]] auto parse_agg_func(std::string_view name) -> std::optional<AggFunc>;

/// One requested aggregation. An empty `alias` keeps the source column name.
/// Count with an empty `column` counts member rows and is named "count".
struct AggSpec {
    std::string column;
    AggFunc func = AggFunc::Sum;
    std::string alias;
};

/// Rows of a table partitioned by key tuple.
///
/// Groups are numbered in order of first appearance. A null key cell is a
/// value of its own: rows whose key is null in the same positions share a
/// group. GroupBy borrows the source table, which must outlive it.
class GroupBy {
   public:
    /// ColumnNotFound for an unknown key; InvalidArgument for no keys.
    [[nodiscard]] static auto create(const Table& table, std::vector<std::string> keys)
        -> Result<GroupBy>;
    static auto create(const Table&& table, std::vector<std::string> keys)
        -> Result<GroupBy> = delete;

    [[nodiscard]] auto ngroups() const noexcept -> std::size_t { return members_.size(); }
    [[nodiscard]] auto keys() const noexcept -> const std::vector<std::string>& { return keys_; }

    /// Source row indices of group `g`, ascending. IndexOutOfRange unless
    /// `g < ngroups()`.
    [[nodiscard]] auto group_rows(std::size_t g) const
        -> Result<const std::vector<std::size_t>*>;

    /// One row per group holding the key values.
    [[nodiscard]] auto key_table() const -> Result<Table>;

    // Keys followed by one column per numeric non-key column. Nulls are
    // skipped; a group with no non-null value aggregates to null.

    /// Integers widen to i64 / u64, floats to f64.
    [[nodiscard]] auto sum() const -> Result<Table>;
    /// Always f64.
    [[nodiscard]] auto mean() const -> Result<Table>;
    [[nodiscard]] auto min() const -> Result<Table>;
    [[nodiscard]] auto max() const -> Result<Table>;

    /// Keys followed by "count" (u64), the number of member rows.
    [[nodiscard]] auto count() const -> Result<Table>;

    /// Explicit aggregation list. Sum and Mean on a non-numeric column fail
    /// with UnsupportedAggregation; Min, Max, First, Last and Count accept
    /// any column type. Count of a column counts its non-null cells.
    [[nodiscard]] auto agg(const std::vector<AggSpec>& specs) const -> Result<Table>;

   private:
    GroupBy(const Table& table, std::vector<std::string> keys)
        : table_(&table), keys_(std::move(keys)) {}

    [[nodiscard]] auto aggregate_numeric(AggFunc func) const -> Result<Table>;

    const Table* table_;
    std::vector<std::string> keys_;
    std::vector<std::vector<std::size_t>> members_;
    std::vector<std::size_t> first_rows_;
};

}  // namespace strata
