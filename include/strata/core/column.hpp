#pragma once

#include <strata/core/cast.hpp>
#include <strata/core/dtype.hpp>
#include <strata/core/error.hpp>
#include <strata/core/parallel.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace strata {

template <ColumnElement T>
class Column;

/// Boolean column used to select rows. A null entry selects nothing.
using Mask = Column<bool>;

namespace detail {

template <typename>
struct optional_inner {};

template <typename U>
struct optional_inner<std::optional<U>> {
    using type = U;
};

/// Element type produced by a mapping `std::optional<T> -> std::optional<U>`.
template <typename F, typename T>
using mapped_element_t =
    typename optional_inner<std::remove_cvref_t<std::invoke_result_t<F&, std::optional<T>>>>::type;

/// Three-way comparison with NaN ordered above every other float and equal
/// to itself, giving a strict weak order over all non-null values.
template <typename T>
[[nodiscard]] auto compare_values(const T& a, const T& b) noexcept -> int {
    if constexpr (std::floating_point<T>) {
        const bool a_nan = std::isnan(a);
        const bool b_nan = std::isnan(b);
        if (a_nan || b_nan) {
            return static_cast<int>(a_nan) - static_cast<int>(b_nan);
        }
    }
    if (a < b) {
        return -1;
    }
    if (b < a) {
        return 1;
    }
    return 0;
}

// Integer arithmetic wraps modulo 2^bits. The computation runs in an unsigned
// type at least as wide as `unsigned` so that promotion never reaches signed int.
template <typename T>
using wrap_t =
    std::conditional_t<(sizeof(T) < sizeof(unsigned)), unsigned, std::make_unsigned_t<T>>;

template <NumericElement T>
[[nodiscard]] constexpr auto wrapping_add(T a, T b) noexcept -> T {
    if constexpr (std::integral<T>) {
        using W = wrap_t<T>;
        return static_cast<T>(static_cast<W>(static_cast<W>(a) + static_cast<W>(b)));
    } else {
        return a + b;
    }
}

template <NumericElement T>
[[nodiscard]] constexpr auto wrapping_sub(T a, T b) noexcept -> T {
    if constexpr (std::integral<T>) {
        using W = wrap_t<T>;
        return static_cast<T>(static_cast<W>(static_cast<W>(a) - static_cast<W>(b)));
    } else {
        return a - b;
    }
}

template <NumericElement T>
[[nodiscard]] constexpr auto wrapping_mul(T a, T b) noexcept -> T {
    if constexpr (std::integral<T>) {
        using W = wrap_t<T>;
        return static_cast<T>(static_cast<W>(static_cast<W>(a) * static_cast<W>(b)));
    } else {
        return a * b;
    }
}

/// Integral callers must reject a zero divisor first.
template <NumericElement T>
[[nodiscard]] constexpr auto checked_div(T a, T b) noexcept -> T {
    if constexpr (std::signed_integral<T>) {
        if (b == T{-1}) {
            return wrapping_sub(T{0}, a);
        }
    }
    return a / b;
}

template <NumericElement T>
[[nodiscard]] auto checked_rem(T a, T b) noexcept -> T {
    if constexpr (std::floating_point<T>) {
        return std::fmod(a, b);
    } else {
        if constexpr (std::signed_integral<T>) {
            if (b == T{-1}) {
                return T{0};
            }
        }
        return a % b;
    }
}

}  // namespace detail

/// A named, typed, nullable column.
///
/// Values live in a contiguous buffer with a parallel validity vector of the
/// same length. The content of a value slot whose validity bit is false is
/// unspecified and never read. Every derived column owns fresh storage.
template <ColumnElement T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;
    using const_reference = typename std::vector<T>::const_reference;

    Column() = default;

    explicit Column(std::string name) : name_(std::move(name)) {}

    Column(std::string name, std::vector<T> values)
        : name_(std::move(name)), data_(std::move(values)), validity_(data_.size(), true) {}

    Column(std::string name, std::initializer_list<T> init)
        : Column(std::move(name), std::vector<T>(init)) {}

    /// Build from optional values; `std::nullopt` entries become nulls.
    [[nodiscard]] static auto from_options(std::string name,
                                           const std::vector<std::optional<T>>& values) -> Column {
        Column out(std::move(name));
        out.reserve(values.size());
        for (const auto& value : values) {
            out.push(value);
        }
        return out;
    }

    /// Build from a value buffer and a validity vector of equal length.
    [[nodiscard]] static auto from_parts(std::string name, std::vector<T> values,
                                         std::vector<bool> validity) -> Result<Column> {
        if (values.size() != validity.size()) {
            return make_error(ErrorKind::Shape,
                              "column '{}': {} values but {} validity entries", name,
                              values.size(), validity.size());
        }
        Column out(std::move(name));
        out.data_ = std::move(values);
        out.validity_ = std::move(validity);
        return out;
    }

    [[nodiscard]] static constexpr auto dtype() noexcept -> DataType { return data_type_of_v<T>; }

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    void rename(std::string name) { name_ = std::move(name); }

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    [[nodiscard]] auto null_count() const noexcept -> size_type {
        return static_cast<size_type>(std::ranges::count(validity_, false));
    }

    /// Unchecked validity access.
    [[nodiscard]] auto is_valid(size_type idx) const noexcept -> bool { return validity_[idx]; }

    /// Unchecked raw value access; meaningless when `!is_valid(idx)`.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const_reference {
        return data_[idx];
    }

    /// Bounds-checked access returning the value or null.
    [[nodiscard]] auto get(size_type idx) const -> Result<std::optional<T>> {
        if (idx >= data_.size()) {
            return make_error(ErrorKind::IndexOutOfRange,
                              "index {} out of range for column '{}' of length {}", idx, name_,
                              data_.size());
        }
        return optional_at(idx);
    }

    /// Unchecked access returning the value or null.
    [[nodiscard]] auto optional_at(size_type idx) const -> std::optional<T> {
        if (!validity_[idx]) {
            return std::nullopt;
        }
        return std::optional<T>{data_[idx]};
    }

    [[nodiscard]] auto values() const noexcept -> const std::vector<T>& { return data_; }
    [[nodiscard]] auto validity() const noexcept -> const std::vector<bool>& { return validity_; }

    void reserve(size_type capacity) {
        data_.reserve(capacity);
        validity_.reserve(capacity);
    }

    void push_back(const T& value) {
        data_.push_back(value);
        validity_.push_back(true);
        check_invariant();
    }

    void push_back(T&& value) {
        data_.push_back(std::move(value));
        validity_.push_back(true);
        check_invariant();
    }

    void push_null() {
        data_.emplace_back();
        validity_.push_back(false);
        check_invariant();
    }

    void push(const std::optional<T>& value) {
        if (value.has_value()) {
            push_back(*value);
        } else {
            push_null();
        }
    }

    [[nodiscard]] auto to_options() const -> std::vector<std::optional<T>> {
        std::vector<std::optional<T>> out;
        out.reserve(size());
        for (size_type i = 0; i < size(); ++i) {
            out.push_back(optional_at(i));
        }
        return out;
    }

    // ─── Null handling ────────────────────────────────────────────────────────

    [[nodiscard]] auto is_null() const -> Column<bool> {
        std::vector<bool> out(validity_.size());
        for (size_type i = 0; i < validity_.size(); ++i) {
            out[i] = !validity_[i];
        }
        return Column<bool>(name_, std::move(out));
    }

    [[nodiscard]] auto not_null() const -> Column<bool> {
        return Column<bool>(name_, std::vector<bool>(validity_));
    }

    /// Copy with every null replaced by `value`.
    [[nodiscard]] auto fill_null(const T& value) const -> Column {
        Column out = *this;
        out.fill_null_inplace(value);
        return out;
    }

    void fill_null_inplace(const T& value) {
        for (size_type i = 0; i < data_.size(); ++i) {
            if (!validity_[i]) {
                data_[i] = value;
                validity_[i] = true;
            }
        }
    }

    /// Lazy view over the non-null values, in order. Calling it again
    /// starts a fresh pass.
    [[nodiscard]] auto iter_valid() const {
        return std::views::iota(size_type{0}, data_.size()) |
               std::views::filter([this](size_type i) { return static_cast<bool>(validity_[i]); }) |
               std::views::transform([this](size_type i) -> const_reference { return data_[i]; });
    }

    // ─── Mapping ──────────────────────────────────────────────────────────────

    /// Map every element through `func(std::optional<T>) -> std::optional<U>`.
    template <typename F>
        requires std::invocable<F&, std::optional<T>>
    [[nodiscard]] auto apply(F func) const -> Column<detail::mapped_element_t<F, T>> {
        using U = detail::mapped_element_t<F, T>;
        Column<U> out(name_);
        out.reserve(size());
        for (size_type i = 0; i < size(); ++i) {
            out.push(func(optional_at(i)));
        }
        return out;
    }

    /// Same result as apply(). Contiguous index ranges are evaluated on
    /// separate threads, each with its own copy of `func`; `workers == 0`
    /// uses the hardware concurrency.
    template <typename F>
        requires std::invocable<F&, std::optional<T>> && std::copy_constructible<F>
    [[nodiscard]] auto par_apply(F func, size_type workers = 0) const
        -> Column<detail::mapped_element_t<F, T>> {
        using U = detail::mapped_element_t<F, T>;
        std::vector<std::optional<U>> slots(size());
        parallel_for_ranges(size(), workers, [&](size_type begin, size_type end) {
            F local = func;
            for (size_type i = begin; i < end; ++i) {
                slots[i] = local(optional_at(i));
            }
        });
        return Column<U>::from_options(name_, slots);
    }

    // ─── Selection ────────────────────────────────────────────────────────────

    [[nodiscard]] auto filter(const Column<bool>& mask) const -> Result<Column> {
        if (mask.size() != size()) {
            return make_error(ErrorKind::LengthMismatch,
                              "filter: mask length {} does not match column '{}' length {}",
                              mask.size(), name_, size());
        }
        Column out(name_);
        for (size_type i = 0; i < size(); ++i) {
            if (mask.is_valid(i) && mask[i]) {
                out.push_row(*this, i);
            }
        }
        return out;
    }

    /// Gather rows by index.
    [[nodiscard]] auto take(std::span<const size_type> indices) const -> Result<Column> {
        Column out(name_);
        out.reserve(indices.size());
        for (auto idx : indices) {
            if (idx >= size()) {
                return make_error(ErrorKind::IndexOutOfRange,
                                  "take: index {} out of range for column '{}' of length {}", idx,
                                  name_, size());
            }
            out.push_row(*this, idx);
        }
        return out;
    }

    /// Gather rows by index; an empty index produces a null.
    [[nodiscard]] auto take_optional(std::span<const std::optional<size_type>> indices) const
        -> Result<Column> {
        Column out(name_);
        out.reserve(indices.size());
        for (const auto& idx : indices) {
            if (!idx.has_value()) {
                out.push_null();
                continue;
            }
            if (*idx >= size()) {
                return make_error(ErrorKind::IndexOutOfRange,
                                  "take: index {} out of range for column '{}' of length {}",
                                  *idx, name_, size());
            }
            out.push_row(*this, *idx);
        }
        return out;
    }

    [[nodiscard]] auto head(size_type n) const -> Column { return slice(0, std::min(n, size())); }

    [[nodiscard]] auto tail(size_type n) const -> Column {
        const size_type count = std::min(n, size());
        return slice(size() - count, size());
    }

    // ─── Ordering ─────────────────────────────────────────────────────────────

    /// Stable permutation that orders non-null values and places nulls last.
    [[nodiscard]] auto argsort(bool descending = false) const -> std::vector<size_type> {
        std::vector<size_type> order;
        std::vector<size_type> nulls;
        order.reserve(size());
        for (size_type i = 0; i < size(); ++i) {
            (validity_[i] ? order : nulls).push_back(i);
        }
        std::ranges::stable_sort(order, [this, descending](size_type a, size_type b) {
            const int cmp = detail::compare_values<T>(data_[a], data_[b]);
            return descending ? cmp > 0 : cmp < 0;
        });
        order.insert(order.end(), nulls.begin(), nulls.end());
        return order;
    }

    /// Stable in-place sort; nulls end up last in either direction.
    void sort(bool descending = false) {
        const auto order = argsort(descending);
        std::vector<T> data;
        std::vector<bool> validity;
        data.reserve(order.size());
        validity.reserve(order.size());
        for (auto idx : order) {
            data.push_back(data_[idx]);
            validity.push_back(validity_[idx]);
        }
        data_ = std::move(data);
        validity_ = std::move(validity);
        check_invariant();
    }

    /// Linear check: non-null values monotone in the given direction and
    /// every null after the last non-null value.
    [[nodiscard]] auto is_sorted(bool descending = false) const -> bool {
        bool seen_null = false;
        std::optional<size_type> prev;
        for (size_type i = 0; i < size(); ++i) {
            if (!validity_[i]) {
                seen_null = true;
                continue;
            }
            if (seen_null) {
                return false;
            }
            if (prev.has_value()) {
                const int cmp = detail::compare_values<T>(data_[*prev], data_[i]);
                if (descending ? cmp < 0 : cmp > 0) {
                    return false;
                }
            }
            prev = i;
        }
        return true;
    }

    // ─── Conversion ───────────────────────────────────────────────────────────

    /// Convert every non-null value to U; fails if any is not exactly
    /// representable. Nulls stay null.
    template <ColumnElement U>
    [[nodiscard]] auto cast() const -> Result<Column<U>> {
        Column<U> out(name_);
        out.reserve(size());
        for (size_type i = 0; i < size(); ++i) {
            if (!validity_[i]) {
                out.push_null();
                continue;
            }
            auto converted = cast_value<U, T>(data_[i]);
            if (!converted.has_value()) {
                return make_error(ErrorKind::Cast,
                                  "cannot cast {} at row {} of column '{}' from {} to {}",
                                  T(data_[i]), i, name_, dtype_name(dtype()),
                                  dtype_name(data_type_of_v<U>));
            }
            out.push_back(std::move(*converted));
        }
        return out;
    }

    // ─── Reductions ───────────────────────────────────────────────────────────

    /// Sum of non-null values; null when there are none. Integers wrap.
    [[nodiscard]] auto sum() const -> std::optional<T>
        requires NumericElement<T>
    {
        std::optional<T> acc;
        for (auto value : iter_valid()) {
            acc = acc.has_value() ? detail::wrapping_add<T>(*acc, value) : value;
        }
        return acc;
    }

    [[nodiscard]] auto mean() const -> std::optional<double>
        requires NumericElement<T>
    {
        double total = 0.0;
        size_type count = 0;
        for (auto value : iter_valid()) {
            total += static_cast<double>(value);
            ++count;
        }
        if (count == 0) {
            return std::nullopt;
        }
        return total / static_cast<double>(count);
    }

    /// Smallest non-null value; NaN is skipped.
    [[nodiscard]] auto min() const -> std::optional<T> { return extreme(false); }

    /// Largest non-null value; NaN is skipped.
    [[nodiscard]] auto max() const -> std::optional<T> { return extreme(true); }

    /// True when every non-null entry is true.
    [[nodiscard]] auto all() const -> bool
        requires std::same_as<T, bool>
    {
        for (size_type i = 0; i < size(); ++i) {
            if (validity_[i] && !data_[i]) {
                return false;
            }
        }
        return true;
    }

    /// True when some non-null entry is true.
    [[nodiscard]] auto any() const -> bool
        requires std::same_as<T, bool>
    {
        for (size_type i = 0; i < size(); ++i) {
            if (validity_[i] && data_[i]) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] auto is_nan() const -> Column<bool>
        requires std::floating_point<T>
    {
        std::vector<bool> out(size());
        for (size_type i = 0; i < size(); ++i) {
            out[i] = validity_[i] && std::isnan(data_[i]);
        }
        return Column<bool>(name_, std::move(out));
    }

    /// Null entries count as not NaN.
    [[nodiscard]] auto is_not_nan() const -> Column<bool>
        requires std::floating_point<T>
    {
        std::vector<bool> out(size());
        for (size_type i = 0; i < size(); ++i) {
            out[i] = !validity_[i] || !std::isnan(data_[i]);
        }
        return Column<bool>(name_, std::move(out));
    }

    [[nodiscard]] auto is_infinite() const -> Column<bool>
        requires std::floating_point<T>
    {
        std::vector<bool> out(size());
        for (size_type i = 0; i < size(); ++i) {
            out[i] = validity_[i] && std::isinf(data_[i]);
        }
        return Column<bool>(name_, std::move(out));
    }

    /// Same length, same null positions, equal values elsewhere. Names are
    /// not compared; NaN equals NaN.
    [[nodiscard]] auto equals(const Column& other) const -> bool {
        if (size() != other.size()) {
            return false;
        }
        for (size_type i = 0; i < size(); ++i) {
            if (validity_[i] != other.validity_[i]) {
                return false;
            }
            if (validity_[i] && detail::compare_values<T>(data_[i], other.data_[i]) != 0) {
                return false;
            }
        }
        return true;
    }

    // ─── Arithmetic ───────────────────────────────────────────────────────────
    // Null at i iff either operand is null at i. Integer results wrap.

    [[nodiscard]] auto add(const Column& rhs) const -> Result<Column>
        requires NumericElement<T>
    {
        return zip_with(rhs, "add", [](T a, T b) { return detail::wrapping_add<T>(a, b); });
    }

    [[nodiscard]] auto add(const T& rhs) const -> Column
        requires NumericElement<T>
    {
        return map_values([rhs](T a) { return detail::wrapping_add<T>(a, rhs); });
    }

    [[nodiscard]] auto sub(const Column& rhs) const -> Result<Column>
        requires NumericElement<T>
    {
        return zip_with(rhs, "sub", [](T a, T b) { return detail::wrapping_sub<T>(a, b); });
    }

    [[nodiscard]] auto sub(const T& rhs) const -> Column
        requires NumericElement<T>
    {
        return map_values([rhs](T a) { return detail::wrapping_sub<T>(a, rhs); });
    }

    [[nodiscard]] auto mul(const Column& rhs) const -> Result<Column>
        requires NumericElement<T>
    {
        return zip_with(rhs, "mul", [](T a, T b) { return detail::wrapping_mul<T>(a, b); });
    }

    [[nodiscard]] auto mul(const T& rhs) const -> Column
        requires NumericElement<T>
    {
        return map_values([rhs](T a) { return detail::wrapping_mul<T>(a, rhs); });
    }

    /// Floats follow IEEE 754 (inf / NaN); integers fail with DivisionByZero
    /// when a non-null dividend meets a zero divisor.
    [[nodiscard]] auto div(const Column& rhs) const -> Result<Column>
        requires NumericElement<T>
    {
        if (auto zero = reject_zero_divisor(rhs, "div"); !zero) {
            return std::unexpected(std::move(zero.error()));
        }
        return zip_with(rhs, "div", [](T a, T b) { return detail::checked_div<T>(a, b); });
    }

    [[nodiscard]] auto div(const T& rhs) const -> Result<Column>
        requires NumericElement<T>
    {
        if constexpr (std::integral<T>) {
            if (rhs == T{0} && null_count() < size()) {
                return make_error(ErrorKind::DivisionByZero, "div: column '{}' divided by zero",
                                  name_);
            }
        }
        return map_values([rhs](T a) { return detail::checked_div<T>(a, rhs); });
    }

    [[nodiscard]] auto rem(const Column& rhs) const -> Result<Column>
        requires NumericElement<T>
    {
        if (auto zero = reject_zero_divisor(rhs, "rem"); !zero) {
            return std::unexpected(std::move(zero.error()));
        }
        return zip_with(rhs, "rem", [](T a, T b) { return detail::checked_rem<T>(a, b); });
    }

    [[nodiscard]] auto rem(const T& rhs) const -> Result<Column>
        requires NumericElement<T>
    {
        if constexpr (std::integral<T>) {
            if (rhs == T{0} && null_count() < size()) {
                return make_error(ErrorKind::DivisionByZero, "rem: column '{}' divided by zero",
                                  name_);
            }
        }
        return map_values([rhs](T a) { return detail::checked_rem<T>(a, rhs); });
    }

    // ─── Comparison ───────────────────────────────────────────────────────────
    // The resulting mask has no nulls: a null operand yields false.

    [[nodiscard]] auto gt(const T& rhs) const -> Column<bool> {
        return compare_scalar(rhs, [](const T& a, const T& b) { return a > b; });
    }
    [[nodiscard]] auto lt(const T& rhs) const -> Column<bool> {
        return compare_scalar(rhs, [](const T& a, const T& b) { return a < b; });
    }
    [[nodiscard]] auto ge(const T& rhs) const -> Column<bool> {
        return compare_scalar(rhs, [](const T& a, const T& b) { return a >= b; });
    }
    [[nodiscard]] auto le(const T& rhs) const -> Column<bool> {
        return compare_scalar(rhs, [](const T& a, const T& b) { return a <= b; });
    }
    [[nodiscard]] auto eq(const T& rhs) const -> Column<bool> {
        return compare_scalar(rhs, [](const T& a, const T& b) { return a == b; });
    }
    [[nodiscard]] auto ne(const T& rhs) const -> Column<bool> {
        return compare_scalar(rhs, [](const T& a, const T& b) { return a != b; });
    }

    [[nodiscard]] auto gt(const Column& rhs) const -> Result<Column<bool>> {
        return compare_column(rhs, "gt", [](const T& a, const T& b) { return a > b; });
    }
    [[nodiscard]] auto lt(const Column& rhs) const -> Result<Column<bool>> {
        return compare_column(rhs, "lt", [](const T& a, const T& b) { return a < b; });
    }
    [[nodiscard]] auto ge(const Column& rhs) const -> Result<Column<bool>> {
        return compare_column(rhs, "ge", [](const T& a, const T& b) { return a >= b; });
    }
    [[nodiscard]] auto le(const Column& rhs) const -> Result<Column<bool>> {
        return compare_column(rhs, "le", [](const T& a, const T& b) { return a <= b; });
    }
    [[nodiscard]] auto eq(const Column& rhs) const -> Result<Column<bool>> {
        return compare_column(rhs, "eq", [](const T& a, const T& b) { return a == b; });
    }
    [[nodiscard]] auto ne(const Column& rhs) const -> Result<Column<bool>> {
        return compare_column(rhs, "ne", [](const T& a, const T& b) { return a != b; });
    }

   private:
    void check_invariant() const {
        if (data_.size() != validity_.size()) {
            detail::invariant_failure(
                fmt::format("column '{}' holds {} values but {} validity entries", name_,
                            data_.size(), validity_.size()));
        }
    }

    void push_row(const Column& src, size_type idx) {
        data_.push_back(src.data_[idx]);
        validity_.push_back(src.validity_[idx]);
    }

    [[nodiscard]] auto slice(size_type begin, size_type end) const -> Column {
        Column out(name_);
        out.data_.assign(data_.begin() + static_cast<std::ptrdiff_t>(begin),
                         data_.begin() + static_cast<std::ptrdiff_t>(end));
        out.validity_.assign(validity_.begin() + static_cast<std::ptrdiff_t>(begin),
                             validity_.begin() + static_cast<std::ptrdiff_t>(end));
        return out;
    }

    [[nodiscard]] auto extreme(bool largest) const -> std::optional<T> {
        std::optional<T> best;
        for (size_type i = 0; i < size(); ++i) {
            if (!validity_[i]) {
                continue;
            }
            if constexpr (std::floating_point<T>) {
                if (std::isnan(data_[i])) {
                    continue;
                }
            }
            if (!best.has_value() || (largest ? *best < data_[i] : data_[i] < *best)) {
                best = data_[i];
            }
        }
        return best;
    }

    [[nodiscard]] auto check_length(const Column& rhs, std::string_view op) const -> Result<void> {
        if (rhs.size() != size()) {
            return make_error(ErrorKind::Shape, "{}: column '{}' has length {} but '{}' has {}", op,
                              name_, size(), rhs.name_, rhs.size());
        }
        return {};
    }

    [[nodiscard]] auto reject_zero_divisor(const Column& rhs, std::string_view op) const
        -> Result<void> {
        if (auto length = check_length(rhs, op); !length) {
            return length;
        }
        if constexpr (std::integral<T>) {
            for (size_type i = 0; i < size(); ++i) {
                if (validity_[i] && rhs.validity_[i] && rhs.data_[i] == T{0}) {
                    return make_error(ErrorKind::DivisionByZero,
                                      "{}: zero divisor in '{}' at row {}", op, rhs.name_, i);
                }
            }
        }
        return {};
    }

    template <typename Op>
    [[nodiscard]] auto zip_with(const Column& rhs, std::string_view op_name, Op op) const
        -> Result<Column> {
        if (auto length = check_length(rhs, op_name); !length) {
            return std::unexpected(std::move(length.error()));
        }
        Column out(name_);
        out.data_.resize(size());
        out.validity_.resize(size());
        for (size_type i = 0; i < size(); ++i) {
            if (validity_[i] && rhs.validity_[i]) {
                out.data_[i] = op(data_[i], rhs.data_[i]);
                out.validity_[i] = true;
            }
        }
        return out;
    }

    template <typename Op>
    [[nodiscard]] auto map_values(Op op) const -> Column {
        Column out(name_);
        out.data_.resize(size());
        out.validity_ = validity_;
        for (size_type i = 0; i < size(); ++i) {
            if (validity_[i]) {
                out.data_[i] = op(data_[i]);
            }
        }
        return out;
    }

    template <typename Pred>
    [[nodiscard]] auto compare_scalar(const T& rhs, Pred pred) const -> Column<bool> {
        std::vector<bool> out(size());
        for (size_type i = 0; i < size(); ++i) {
            out[i] = validity_[i] && pred(data_[i], rhs);
        }
        return Column<bool>(name_, std::move(out));
    }

    template <typename Pred>
    [[nodiscard]] auto compare_column(const Column& rhs, std::string_view op_name, Pred pred) const
        -> Result<Column<bool>> {
        if (auto length = check_length(rhs, op_name); !length) {
            return std::unexpected(std::move(length.error()));
        }
        std::vector<bool> out(size());
        for (size_type i = 0; i < size(); ++i) {
            out[i] = validity_[i] && rhs.validity_[i] && pred(data_[i], rhs.data_[i]);
        }
        return Column<bool>(name_, std::move(out));
    }

    template <ColumnElement U>
    friend class Column;

    std::string name_;
    std::vector<T> data_;
    std::vector<bool> validity_;
};

extern template class Column<bool>;
extern template class Column<std::int64_t>;
extern template class Column<double>;
extern template class Column<std::string>;

}  // namespace strata
