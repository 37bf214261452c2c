#include <strata/engine/sort.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <numeric>

namespace strata {

namespace {

using RowComparator = std::function<int(std::size_t, std::size_t)>;

// Resolve the column type once per key so the comparator loop does not
// dispatch on the variant for every comparison.
auto make_comparator(const Series& series, bool descending) -> RowComparator {
    return series.visit([descending](const auto& col) -> RowComparator {
        using T = typename std::decay_t<decltype(col)>::value_type;
        const auto* column = &col;
        return [column, descending](std::size_t a, std::size_t b) -> int {
            const bool a_valid = column->is_valid(a);
            const bool b_valid = column->is_valid(b);
            if (!a_valid || !b_valid) {
                // Nulls last in both directions.
                return static_cast<int>(!a_valid) - static_cast<int>(!b_valid);
            }
            const int cmp = detail::compare_values<T>((*column)[a], (*column)[b]);
            return descending ? -cmp : cmp;
        };
    });
}

}  // namespace

auto sort_indices(const Table& table, const std::vector<SortKey>& keys)
    -> Result<std::vector<std::size_t>> {
    std::vector<RowComparator> comparators;
    comparators.reserve(keys.size());
    for (const auto& key : keys) {
        auto series = table.column(key.name);
        if (!series) {
            return std::unexpected(std::move(series.error()));
        }
        comparators.push_back(make_comparator(**series, key.descending));
    }

    std::vector<std::size_t> order(table.rows());
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (comparators.empty() || order.size() <= 1) {
        return order;
    }
    std::ranges::stable_sort(order, [&comparators](std::size_t a, std::size_t b) {
        for (const auto& cmp : comparators) {
            const int c = cmp(a, b);
            if (c != 0) {
                return c < 0;
            }
        }
        return false;
    });
    spdlog::debug("sort_indices: {} rows by {} keys", order.size(), keys.size());
    return order;
}

}  // namespace strata
