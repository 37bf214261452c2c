#include <strata/engine/join.hpp>
#include <strata/engine/key.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata {

namespace {

struct JoinKeys {
    std::vector<const Series*> left;
    std::vector<const Series*> right;
};

auto resolve_keys(const Table& left, const Table& right, const std::vector<std::string>& left_on,
                  const std::vector<std::string>& right_on) -> Result<JoinKeys> {
    if (left_on.empty() || right_on.empty()) {
        return make_error(ErrorKind::InvalidArgument, "join requires at least one key");
    }
    if (left_on.size() != right_on.size()) {
        return make_error(ErrorKind::InvalidArgument,
                          "join: {} left keys but {} right keys", left_on.size(), right_on.size());
    }
    JoinKeys keys;
    keys.left.reserve(left_on.size());
    keys.right.reserve(right_on.size());
    for (std::size_t i = 0; i < left_on.size(); ++i) {
        auto left_col = left.column(left_on[i]);
        if (!left_col) {
            return make_error(ErrorKind::ColumnNotFound, "join key not found in left: {}",
                              left_col.error().message);
        }
        auto right_col = right.column(right_on[i]);
        if (!right_col) {
            return make_error(ErrorKind::ColumnNotFound, "join key not found in right: {}",
                              right_col.error().message);
        }
        if ((*left_col)->dtype() != (*right_col)->dtype()) {
            return make_error(ErrorKind::TypeMismatch,
                              "join key type mismatch: '{}' is {} but '{}' is {}", left_on[i],
                              dtype_name((*left_col)->dtype()), right_on[i],
                              dtype_name((*right_col)->dtype()));
        }
        keys.left.push_back(*left_col);
        keys.right.push_back(*right_col);
    }
    return keys;
}

// Left key column of the output: the left value where a left row exists,
// otherwise the right key value.
auto coalesce_key(const Series& left_key, const Series& right_key, const JoinResult& pairs)
    -> Result<Series> {
    return left_key.visit([&](const auto& lcol) -> Result<Series> {
        using T = typename std::decay_t<decltype(lcol)>::value_type;
        const auto* rcol = right_key.as<T>();
        if (rcol == nullptr) {
            return make_error(ErrorKind::TypeMismatch, "join key type mismatch for '{}'",
                              lcol.name());
        }
        Column<T> out(lcol.name());
        out.reserve(pairs.size());
        for (const auto& pair : pairs) {
            if (pair.left.has_value()) {
                out.push(lcol.optional_at(*pair.left));
            } else if (pair.right.has_value()) {
                out.push(rcol->optional_at(*pair.right));
            } else {
                out.push_null();
            }
        }
        return Series{std::move(out)};
    });
}

}  // namespace

auto join_kind_name(JoinKind kind) noexcept -> std::string_view {
    switch (kind) {
        case JoinKind::Inner:
            return "inner";
        case JoinKind::Left:
            return "left";
        case JoinKind::Right:
            return "right";
        case JoinKind::Outer:
            return "outer";
    }
    return "unknown";
}

auto join_indices(const Table& left, const Table& right, const std::vector<std::string>& left_on,
                  const std::vector<std::string>& right_on, JoinKind kind) -> Result<JoinResult> {
    auto keys = resolve_keys(left, right, left_on, right_on);
    if (!keys) {
        return std::unexpected(std::move(keys.error()));
    }

    // Build side: right table. Keys containing a null are never indexed.
    robin_hood::unordered_flat_map<detail::RowKey, std::size_t, detail::RowKeyHash,
                                   detail::RowKeyEq>
        bucket_of;
    std::vector<std::vector<std::size_t>> buckets;
    bucket_of.reserve(right.rows());
    for (std::size_t r = 0; r < right.rows(); ++r) {
        auto key = detail::make_row_key(keys->right, r);
        if (key.has_null()) {
            continue;
        }
        auto [it, inserted] = bucket_of.try_emplace(std::move(key), buckets.size());
        if (inserted) {
            buckets.emplace_back();
        }
        buckets[it->second].push_back(r);
    }

    const bool keep_left = kind == JoinKind::Left || kind == JoinKind::Outer;
    const bool keep_right = kind == JoinKind::Right || kind == JoinKind::Outer;

    JoinResult pairs;
    std::vector<bool> right_matched(right.rows(), false);
    for (std::size_t l = 0; l < left.rows(); ++l) {
        auto key = detail::make_row_key(keys->left, l);
        const std::vector<std::size_t>* matches = nullptr;
        if (!key.has_null()) {
            if (auto it = bucket_of.find(key); it != bucket_of.end()) {
                matches = &buckets[it->second];
            }
        }
        if (matches == nullptr) {
            if (keep_left) {
                pairs.push_back(JoinPair{l, std::nullopt});
            }
            continue;
        }
        for (auto r : *matches) {
            pairs.push_back(JoinPair{l, r});
            right_matched[r] = true;
        }
    }
    if (keep_right) {
        for (std::size_t r = 0; r < right.rows(); ++r) {
            if (!right_matched[r]) {
                pairs.push_back(JoinPair{std::nullopt, r});
            }
        }
    }
    spdlog::debug("{} join: {} x {} rows -> {} rows", join_kind_name(kind), left.rows(),
                  right.rows(), pairs.size());
    return pairs;
}

auto join_tables(const Table& left, const Table& right, const std::vector<std::string>& left_on,
                 const std::vector<std::string>& right_on, JoinKind kind) -> Result<Table> {
    auto pairs = join_indices(left, right, left_on, right_on, kind);
    if (!pairs) {
        return std::unexpected(std::move(pairs.error()));
    }

    std::vector<const Series*> right_out;
    for (const auto& column : right.columns()) {
        if (std::ranges::find(right_on, column.name()) != right_on.end()) {
            continue;
        }
        if (left.contains(column.name())) {
            return make_error(ErrorKind::DuplicateColumn,
                              "join: column '{}' exists in both tables and is not a join key",
                              column.name());
        }
        right_out.push_back(&column);
    }

    std::vector<std::optional<std::size_t>> left_rows;
    std::vector<std::optional<std::size_t>> right_rows;
    left_rows.reserve(pairs->size());
    right_rows.reserve(pairs->size());
    for (const auto& pair : *pairs) {
        left_rows.push_back(pair.left);
        right_rows.push_back(pair.right);
    }

    Table output;
    for (const auto& column : left.columns()) {
        Result<Series> gathered;
        auto key_it = std::ranges::find(left_on, column.name());
        if (key_it != left_on.end()) {
            const auto& right_key = right_on[static_cast<std::size_t>(key_it - left_on.begin())];
            gathered = coalesce_key(column, *right.find(right_key), *pairs);
        } else {
            gathered = column.take_optional(left_rows);
        }
        if (!gathered) {
            return std::unexpected(std::move(gathered.error()));
        }
        if (auto added = output.add_column(std::move(*gathered)); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    for (const auto* column : right_out) {
        auto gathered = column->take_optional(right_rows);
        if (!gathered) {
            return std::unexpected(std::move(gathered.error()));
        }
        if (auto added = output.add_column(std::move(*gathered)); !added) {
            return std::unexpected(std::move(added.error()));
        }
    }
    return output;
}

}  // namespace strata
