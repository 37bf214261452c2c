#include <strata/engine/group.hpp>
#include <strata/engine/key.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <concepts>
#include <type_traits>

namespace strata {

namespace {

template <typename T>
using sum_type_t =
    std::conditional_t<std::floating_point<T>, double,
                       std::conditional_t<std::signed_integral<T>, std::int64_t, std::uint64_t>>;

using Groups = std::vector<std::vector<std::size_t>>;

template <typename T>
auto unsupported(const Column<T>& column, AggFunc func) -> std::unexpected<Error> {
    return make_error(ErrorKind::UnsupportedAggregation, "{} is not defined for {} column '{}'",
                      agg_func_name(func), dtype_name(Column<T>::dtype()), column.name());
}

template <typename T>
auto aggregate_column(const Column<T>& column, const Groups& groups, AggFunc func,
                      const std::string& name) -> Result<Series> {
    switch (func) {
        case AggFunc::Sum: {
            if constexpr (NumericElement<T>) {
                using Acc = sum_type_t<T>;
                Column<Acc> out(name);
                out.reserve(groups.size());
                for (const auto& rows : groups) {
                    std::optional<Acc> acc;
                    for (auto r : rows) {
                        if (!column.is_valid(r)) {
                            continue;
                        }
                        const auto value = static_cast<Acc>(column[r]);
                        acc = acc.has_value() ? detail::wrapping_add<Acc>(*acc, value) : value;
                    }
                    out.push(acc);
                }
                return Series{std::move(out)};
            } else {
                return unsupported(column, func);
            }
        }
        case AggFunc::Mean: {
            if constexpr (NumericElement<T>) {
                Column<double> out(name);
                out.reserve(groups.size());
                for (const auto& rows : groups) {
                    double total = 0.0;
                    std::size_t count = 0;
                    for (auto r : rows) {
                        if (column.is_valid(r)) {
                            total += static_cast<double>(column[r]);
                            ++count;
                        }
                    }
                    if (count == 0) {
                        out.push_null();
                    } else {
                        out.push_back(total / static_cast<double>(count));
                    }
                }
                return Series{std::move(out)};
            } else {
                return unsupported(column, func);
            }
        }
        case AggFunc::Min:
        case AggFunc::Max: {
            const bool largest = func == AggFunc::Max;
            Column<T> out(name);
            out.reserve(groups.size());
            for (const auto& rows : groups) {
                std::optional<std::size_t> best;
                for (auto r : rows) {
                    if (!column.is_valid(r)) {
                        continue;
                    }
                    if constexpr (std::floating_point<T>) {
                        if (std::isnan(column[r])) {
                            continue;
                        }
                    }
                    if (!best.has_value()) {
                        best = r;
                        continue;
                    }
                    const int cmp = detail::compare_values<T>(column[r], column[*best]);
                    if (largest ? cmp > 0 : cmp < 0) {
                        best = r;
                    }
                }
                if (best.has_value()) {
                    out.push_back(T(column[*best]));
                } else {
                    out.push_null();
                }
            }
            return Series{std::move(out)};
        }
        case AggFunc::First:
        case AggFunc::Last: {
            Column<T> out(name);
            out.reserve(groups.size());
            for (const auto& rows : groups) {
                std::optional<std::size_t> pick;
                for (auto r : rows) {
                    if (column.is_valid(r)) {
                        pick = r;
                        if (func == AggFunc::First) {
                            break;
                        }
                    }
                }
                if (pick.has_value()) {
                    out.push_back(T(column[*pick]));
                } else {
                    out.push_null();
                }
            }
            return Series{std::move(out)};
        }
        case AggFunc::Count: {
            Column<std::uint64_t> out(name);
            out.reserve(groups.size());
            for (const auto& rows : groups) {
                out.push_back(static_cast<std::uint64_t>(std::ranges::count_if(
                    rows, [&column](std::size_t r) { return column.is_valid(r); })));
            }
            return Series{std::move(out)};
        }
    }
    return make_error(ErrorKind::InvalidArgument, "unknown aggregation");
}

auto group_sizes(const Groups& groups, std::string name) -> Column<std::uint64_t> {
    Column<std::uint64_t> out(std::move(name));
    out.reserve(groups.size());
    for (const auto& rows : groups) {
        out.push_back(static_cast<std::uint64_t>(rows.size()));
    }
    return out;
}

}  // namespace

auto agg_func_name(AggFunc func) noexcept -> std::string_view {
    switch (func) {
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Mean:
            return "mean";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
        case AggFunc::Count:
            return "count";
        case AggFunc::First:
            return "first";
        case AggFunc::Last:
            return "last";
    }
    return "unknown";
}

auto parse_agg_func(std::string_view name) -> std::optional<AggFunc> {
    constexpr std::array kFuncs{AggFunc::Sum,   AggFunc::Mean,  AggFunc::Min, AggFunc::Max,
                                AggFunc::Count, AggFunc::First, AggFunc::Last};
    for (auto func : kFuncs) {
        if (agg_func_name(func) == name) {
            return func;
        }
    }
    return std::nullopt;
}

auto GroupBy::create(const Table& table, std::vector<std::string> keys) -> Result<GroupBy> {
    if (keys.empty()) {
        return make_error(ErrorKind::InvalidArgument, "groupby requires at least one key");
    }
    std::vector<const Series*> key_columns;
    key_columns.reserve(keys.size());
    for (const auto& key : keys) {
        auto column = table.column(key);
        if (!column) {
            return std::unexpected(std::move(column.error()));
        }
        key_columns.push_back(*column);
    }

    GroupBy grouped(table, std::move(keys));
    robin_hood::unordered_flat_map<detail::RowKey, std::size_t, detail::RowKeyHash,
                                   detail::RowKeyEq>
        group_ids;
    group_ids.reserve(table.rows());
    for (std::size_t row = 0; row < table.rows(); ++row) {
        auto [it, inserted] =
            group_ids.try_emplace(detail::make_row_key(key_columns, row), grouped.members_.size());
        if (inserted) {
            grouped.members_.emplace_back();
            grouped.first_rows_.push_back(row);
        }
        grouped.members_[it->second].push_back(row);
    }
    spdlog::debug("groupby: {} rows into {} groups", table.rows(), grouped.ngroups());
    return grouped;
}

auto GroupBy::group_rows(std::size_t g) const -> Result<const std::vector<std::size_t>*> {
    if (g >= members_.size()) {
        return make_error(ErrorKind::IndexOutOfRange, "group {} out of range for {} groups", g,
                          members_.size());
    }
    return &members_[g];
}

auto GroupBy::key_table() const -> Result<Table> {
    Table output;
    for (const auto& key : keys_) {
        auto column = table_->column(key);
        if (!column) {
            return std::unexpected(std::move(column.error()));
        }
        auto gathered = (*column)->take(first_rows_);
        if (!gathered) {
            return std::unexpected(std::move(gathered.error()));
        }
        if (auto added = output.add_column(std::move(*gathered)); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    return output;
}

auto GroupBy::aggregate_numeric(AggFunc func) const -> Result<Table> {
    auto output = key_table();
    if (!output) {
        return output;
    }
    for (const auto& column : table_->columns()) {
        if (std::ranges::find(keys_, column.name()) != keys_.end() ||
            !is_numeric(column.dtype())) {
            continue;
        }
        auto aggregated = column.visit([&](const auto& col) {
            return aggregate_column(col, members_, func, col.name());
        });
        if (!aggregated) {
            return std::unexpected(std::move(aggregated.error()));
        }
        if (auto added = output->add_column(std::move(*aggregated)); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    return output;
}

auto GroupBy::sum() const -> Result<Table> {
    return aggregate_numeric(AggFunc::Sum);
}

auto GroupBy::mean() const -> Result<Table> {
    return aggregate_numeric(AggFunc::Mean);
}

auto GroupBy::min() const -> Result<Table> {
    return aggregate_numeric(AggFunc::Min);
}

auto GroupBy::max() const -> Result<Table> {
    return aggregate_numeric(AggFunc::Max);
}

auto GroupBy::count() const -> Result<Table> {
    auto output = key_table();
    if (!output) {
        return output;
    }
    if (auto added = output->add_column(group_sizes(members_, "count")); !added) {
        return std::unexpected(std::move(added.error()));
    }
    return output;
}

auto GroupBy::agg(const std::vector<AggSpec>& specs) const -> Result<Table> {
    auto output = key_table();
    if (!output) {
        return output;
    }
    for (const auto& spec : specs) {
        Result<Series> aggregated;
        if (spec.func == AggFunc::Count && spec.column.empty()) {
            aggregated = Series{group_sizes(members_, spec.alias.empty() ? "count" : spec.alias)};
        } else {
            auto column = table_->column(spec.column);
            if (!column) {
                return std::unexpected(std::move(column.error()));
            }
            const std::string& name = spec.alias.empty() ? spec.column : spec.alias;
            aggregated = (*column)->visit([&](const auto& col) {
                return aggregate_column(col, members_, spec.func, name);
            });
        }
        if (!aggregated) {
            return std::unexpected(std::move(aggregated.error()));
        }
        if (auto added = output->add_column(std::move(*aggregated)); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    spdlog::debug("groupby agg: {} groups, {} aggregations", ngroups(), specs.size());
    return output;
}

}  // namespace strata
