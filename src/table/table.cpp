#include <strata/engine/group.hpp>
#include <strata/engine/join.hpp>
#include <strata/core/parallel.hpp>
#include <strata/engine/sort.hpp>
#include <strata/table/table.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <optional>

namespace strata {

auto Table::from_columns(std::vector<Series> columns) -> Result<Table> {
    Table table;
    for (auto& column : columns) {
        if (auto added = table.add_column(std::move(column)); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    return table;
}

auto Table::add_column(Series column) -> Result<void> {
    const std::string& name = column.name();
    if (index_.contains(name)) {
        return make_error(ErrorKind::DuplicateColumn, "column '{}' already exists", name);
    }
    if (!columns_.empty() && column.size() != rows_) {
        return make_error(ErrorKind::LengthMismatch,
                          "column '{}' has {} rows but the table has {}", name, column.size(),
                          rows_);
    }
    if (columns_.empty()) {
        rows_ = column.size();
    }
    index_.emplace(name, columns_.size());
    columns_.push_back(std::move(column));
    return {};
}

auto Table::add_column(std::string name, Series column) -> Result<void> {
    column.rename(std::move(name));
    return add_column(std::move(column));
}

auto Table::drop_column(const std::string& name) -> Result<void> {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::unexpected(missing_column(name));
    }
    columns_.erase(columns_.begin() + static_cast<std::ptrdiff_t>(it->second));
    index_.clear();
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        index_.emplace(columns_[i].name(), i);
    }
    if (columns_.empty()) {
        rows_ = 0;
    }
    return {};
}

auto Table::rename_column(const std::string& from, std::string to) -> Result<void> {
    auto it = index_.find(from);
    if (it == index_.end()) {
        return std::unexpected(missing_column(from));
    }
    if (from == to) {
        return {};
    }
    if (index_.contains(to)) {
        return make_error(ErrorKind::DuplicateColumn, "column '{}' already exists", to);
    }
    const std::size_t pos = it->second;
    index_.erase(it);
    columns_[pos].rename(to);
    index_.emplace(std::move(to), pos);
    return {};
}

auto Table::column(const std::string& name) const -> Result<const Series*> {
    const auto* found = find(name);
    if (found == nullptr) {
        return std::unexpected(missing_column(name));
    }
    return found;
}

auto Table::find(const std::string& name) const noexcept -> const Series* {
    if (auto it = index_.find(name); it != index_.end()) {
        return &columns_[it->second];
    }
    return nullptr;
}

auto Table::column_at(std::size_t idx) const -> Result<const Series*> {
    if (idx >= columns_.size()) {
        return make_error(ErrorKind::IndexOutOfRange,
                          "column index {} out of range for table with {} columns", idx,
                          columns_.size());
    }
    return &columns_[idx];
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name());
    }
    return names;
}

auto Table::dtypes() const -> std::vector<DataType> {
    std::vector<DataType> out;
    out.reserve(columns_.size());
    for (const auto& column : columns_) {
        out.push_back(column.dtype());
    }
    return out;
}

auto Table::select(const std::vector<std::string>& names) const -> Result<Table> {
    Table output;
    for (const auto& name : names) {
        auto found = column(name);
        if (!found) {
            return std::unexpected(std::move(found.error()));
        }
        if (auto added = output.add_column(**found); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    return output;
}

auto Table::drop(const std::string& name) const -> Result<Table> {
    if (!index_.contains(name)) {
        return std::unexpected(missing_column(name));
    }
    Table output = *this;
    if (auto dropped = output.drop_column(name); !dropped) {
        return std::unexpected(std::move(dropped.error()));
    }
    return output;
}

auto Table::selected_rows(const Mask& mask) const -> Result<std::vector<std::size_t>> {
    if (mask.size() != rows_) {
        return make_error(ErrorKind::LengthMismatch,
                          "filter: mask length {} does not match table row count {}", mask.size(),
                          rows_);
    }
    std::vector<std::size_t> selected;
    selected.reserve(rows_);
    for (std::size_t i = 0; i < rows_; ++i) {
        if (mask.is_valid(i) && mask[i]) {
            selected.push_back(i);
        }
    }
    return selected;
}

auto Table::filter(const Mask& mask) const -> Result<Table> {
    return selected_rows(mask).and_then(
        [this](const std::vector<std::size_t>& selected) { return take(selected); });
}

auto Table::par_filter(const Mask& mask, std::size_t workers) const -> Result<Table> {
    auto selected = selected_rows(mask);
    if (!selected) {
        return std::unexpected(std::move(selected.error()));
    }
    std::vector<std::optional<Result<Series>>> gathered(columns_.size());
    parallel_for_ranges(columns_.size(), workers, [&](std::size_t begin, std::size_t end) {
        for (std::size_t c = begin; c < end; ++c) {
            gathered[c] = columns_[c].take(*selected);
        }
    });

    Table output;
    for (auto& column : gathered) {
        if (!*column) {
            return std::unexpected(std::move(column->error()));
        }
        if (auto added = output.add_column(std::move(**column)); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    return output;
}

auto Table::take(std::span<const std::size_t> indices) const -> Result<Table> {
    Table output;
    for (const auto& column : columns_) {
        auto gathered = column.take(indices);
        if (!gathered) {
            return std::unexpected(std::move(gathered.error()));
        }
        if (auto added = output.add_column(std::move(*gathered)); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    return output;
}

auto Table::head(std::size_t n) const -> Table {
    Table output = *this;
    for (auto& column : output.columns_) {
        column = column.head(n);
    }
    output.rows_ = std::min(n, rows_);
    return output;
}

auto Table::tail(std::size_t n) const -> Table {
    Table output = *this;
    for (auto& column : output.columns_) {
        column = column.tail(n);
    }
    output.rows_ = std::min(n, rows_);
    return output;
}

auto Table::sort(const std::vector<std::string>& keys, const std::vector<bool>& descending) const
    -> Result<Table> {
    if (keys.size() != descending.size()) {
        return make_error(ErrorKind::InvalidArgument,
                          "sort: {} keys but {} direction flags", keys.size(), descending.size());
    }
    std::vector<SortKey> sort_keys;
    sort_keys.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        sort_keys.push_back(SortKey{keys[i], descending[i]});
    }
    return sort_by(sort_keys);
}

auto Table::sort(const std::vector<std::string>& keys, bool descending) const -> Result<Table> {
    return sort(keys, std::vector<bool>(keys.size(), descending));
}

auto Table::sort_by(const std::vector<SortKey>& keys) const -> Result<Table> {
    auto order = sort_indices(*this, keys);
    if (!order) {
        return std::unexpected(std::move(order.error()));
    }
    return take(*order);
}

auto Table::groupby(const std::vector<std::string>& keys) const& -> Result<GroupBy> {
    return GroupBy::create(*this, keys);
}

auto Table::inner_join(const Table& right, const std::vector<std::string>& on) const
    -> Result<Table> {
    return join_tables(*this, right, on, on, JoinKind::Inner);
}

auto Table::left_join(const Table& right, const std::vector<std::string>& on) const
    -> Result<Table> {
    return join_tables(*this, right, on, on, JoinKind::Left);
}

auto Table::right_join(const Table& right, const std::vector<std::string>& on) const
    -> Result<Table> {
    return join_tables(*this, right, on, on, JoinKind::Right);
}

auto Table::outer_join(const Table& right, const std::vector<std::string>& on) const
    -> Result<Table> {
    return join_tables(*this, right, on, on, JoinKind::Outer);
}

auto Table::join(const Table& right, const std::vector<std::string>& left_on,
                 const std::vector<std::string>& right_on, JoinKind kind) const -> Result<Table> {
    return join_tables(*this, right, left_on, right_on, kind);
}

auto Table::equals(const Table& other) const -> bool {
    if (rows_ != other.rows_ || columns_.size() != other.columns_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name() != other.columns_[i].name() ||
            !columns_[i].equals(other.columns_[i])) {
            return false;
        }
    }
    return true;
}

auto Table::missing_column(const std::string& name) const -> Error {
    return Error{ErrorKind::ColumnNotFound,
                 fmt::format("column not found: {} (available: {})", name,
                             fmt::join(column_names(), ", "))};
}

}  // namespace strata
