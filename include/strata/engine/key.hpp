#pragma once

#include <strata/core/series.hpp>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace strata::detail {

/// Key tuple for one row across the grouping or join key columns.
/// A null cell is `std::monostate` and equals other nulls.
struct RowKey {
    std::vector<Scalar> values;

    [[nodiscard]] auto has_null() const -> bool {
        return std::ranges::any_of(values, [](const Scalar& v) { return is_null(v); });
    }
};

struct RowKeyHash {
    auto operator()(const RowKey& key) const noexcept -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& value : key.values) {
            hash_combine(scalar_hash(value));
        }
        return seed;
    }
};

struct RowKeyEq {
    auto operator()(const RowKey& a, const RowKey& b) const noexcept -> bool {
        return std::ranges::equal(a.values, b.values, scalar_equal);
    }
};

[[nodiscard]] inline auto make_row_key(const std::vector<const Series*>& columns, std::size_t row)
    -> RowKey {
    RowKey key;
    key.values.reserve(columns.size());
    for (const auto* column : columns) {
        key.values.push_back(column->at(row));
    }
    return key;
}

}  // namespace strata::detail
