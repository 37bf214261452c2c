#pragma once

#include <strata/core/column.hpp>
#include <strata/core/dtype.hpp>
#include <strata/core/error.hpp>
#include <strata/core/series.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata {

class GroupBy;
enum class JoinKind : std::uint8_t;

/// One sort key: column name and direction. Nulls always sort last.
struct SortKey {
    std::string name;
    bool descending = false;
};

/// An ordered collection of uniquely named, equal-length columns.
///
/// The table owns its columns by value. Every operation that reindexes rows
/// returns a new Table with freshly gathered storage.
class Table {
   public:
    Table() = default;

    /// Build from columns in order; LengthMismatch or DuplicateColumn on
    /// inconsistent input.
    [[nodiscard]] static auto from_columns(std::vector<Series> columns) -> Result<Table>;

    // ─── Column management ────────────────────────────────────────────────────

    /// Append a column under its own name. An empty table adopts the
    /// column's length.
    auto add_column(Series column) -> Result<void>;

    /// Append a column under `name`.
    auto add_column(std::string name, Series column) -> Result<void>;

    auto drop_column(const std::string& name) -> Result<void>;
    auto rename_column(const std::string& from, std::string to) -> Result<void>;

    // ─── Lookup ───────────────────────────────────────────────────────────────

    [[nodiscard]] auto column(const std::string& name) const -> Result<const Series*>;

    /// nullptr when absent.
    [[nodiscard]] auto find(const std::string& name) const noexcept -> const Series*;

    [[nodiscard]] auto column_at(std::size_t idx) const -> Result<const Series*>;

    /// Typed view of a column; TypeMismatch when its runtime tag is not T.
    template <ColumnElement T>
    [[nodiscard]] auto downcast_column(const std::string& name) const
        -> Result<const Column<T>*> {
        auto series = column(name);
        if (!series) {
            return std::unexpected(std::move(series.error()));
        }
        const auto* typed = (*series)->template as<T>();
        if (typed == nullptr) {
            return make_error(ErrorKind::TypeMismatch, "column '{}' is {}, not {}", name,
                              dtype_name((*series)->dtype()), dtype_name(data_type_of_v<T>));
        }
        return typed;
    }

    [[nodiscard]] auto columns() const noexcept -> const std::vector<Series>& { return columns_; }
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
    [[nodiscard]] auto dtypes() const -> std::vector<DataType>;
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index_.contains(name);
    }

    // ─── Shape ────────────────────────────────────────────────────────────────

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto cols() const noexcept -> std::size_t { return columns_.size(); }

    /// (row count, column count)
    [[nodiscard]] auto shape() const noexcept -> std::pair<std::size_t, std::size_t> {
        return {rows_, columns_.size()};
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return columns_.empty(); }

    // ─── Row and column selection ─────────────────────────────────────────────

    /// The requested columns in the requested order.
    [[nodiscard]] auto select(const std::vector<std::string>& names) const -> Result<Table>;

    /// Every column except `name`.
    [[nodiscard]] auto drop(const std::string& name) const -> Result<Table>;

    /// Rows where `mask` is true; LengthMismatch unless the mask has one
    /// entry per row.
    [[nodiscard]] auto filter(const Mask& mask) const -> Result<Table>;

    /// Same result as filter(). Columns are gathered on separate threads;
    /// `workers == 0` uses the hardware concurrency.
    [[nodiscard]] auto par_filter(const Mask& mask, std::size_t workers = 0) const
        -> Result<Table>;

    /// Gather the same row indices from every column.
    [[nodiscard]] auto take(std::span<const std::size_t> indices) const -> Result<Table>;

    [[nodiscard]] auto head(std::size_t n) const -> Table;
    [[nodiscard]] auto tail(std::size_t n) const -> Table;

    /// Stable sort by `keys` in priority order, one direction flag per key.
    [[nodiscard]] auto sort(const std::vector<std::string>& keys,
                            const std::vector<bool>& descending) const -> Result<Table>;

    /// Stable sort by `keys`, all in one direction.
    [[nodiscard]] auto sort(const std::vector<std::string>& keys, bool descending = false) const
        -> Result<Table>;

    /// Stable sort with a direction per key.
    [[nodiscard]] auto sort_by(const std::vector<SortKey>& keys) const -> Result<Table>;

    // ─── Grouping and joins ───────────────────────────────────────────────────

    /// Group rows by `keys`. The returned GroupBy borrows this table, so
    /// grouping a temporary is rejected at compile time.
    [[nodiscard]] auto groupby(const std::vector<std::string>& keys) const& -> Result<GroupBy>;
    auto groupby(const std::vector<std::string>& keys) const&& -> Result<GroupBy> = delete;

    [[nodiscard]] auto inner_join(const Table& right, const std::vector<std::string>& on) const
        -> Result<Table>;
    [[nodiscard]] auto left_join(const Table& right, const std::vector<std::string>& on) const
        -> Result<Table>;
    [[nodiscard]] auto right_join(const Table& right, const std::vector<std::string>& on) const
        -> Result<Table>;
    [[nodiscard]] auto outer_join(const Table& right, const std::vector<std::string>& on) const
        -> Result<Table>;

    /// Join on differently named key columns.
    [[nodiscard]] auto join(const Table& right, const std::vector<std::string>& left_on,
                            const std::vector<std::string>& right_on, JoinKind kind) const
        -> Result<Table>;

    /// Same column names, order, types and cell values.
    [[nodiscard]] auto equals(const Table& other) const -> bool;

   private:
    [[nodiscard]] auto missing_column(const std::string& name) const -> Error;
    [[nodiscard]] auto selected_rows(const Mask& mask) const -> Result<std::vector<std::size_t>>;

    std::vector<Series> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t rows_ = 0;
};

}  // namespace strata
