#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace strata {

/// Runtime tag naming the element type of a column.
enum class DataType : std::uint8_t {
    Bool,
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64,
    String,
};

/// Short display name ("bool", "i8", ..., "f64", "str").
[[nodiscard]] auto dtype_name(DataType dtype) noexcept -> std::string_view;

/// Parse a display name back into a tag. Accepts the long spellings
/// ("int64", "float64", "string", ...) as well.
[[nodiscard]] auto parse_dtype(std::string_view name) -> std::optional<DataType>;

[[nodiscard]] constexpr auto is_signed_integer(DataType dtype) noexcept -> bool {
    return dtype == DataType::Int8 || dtype == DataType::Int16 || dtype == DataType::Int32 ||
           dtype == DataType::Int64;
}

[[nodiscard]] constexpr auto is_unsigned_integer(DataType dtype) noexcept -> bool {
    return dtype == DataType::UInt8 || dtype == DataType::UInt16 || dtype == DataType::UInt32 ||
           dtype == DataType::UInt64;
}

[[nodiscard]] constexpr auto is_integer(DataType dtype) noexcept -> bool {
    return is_signed_integer(dtype) || is_unsigned_integer(dtype);
}

[[nodiscard]] constexpr auto is_float(DataType dtype) noexcept -> bool {
    return dtype == DataType::Float32 || dtype == DataType::Float64;
}

/// Bool and String are not numeric.
[[nodiscard]] constexpr auto is_numeric(DataType dtype) noexcept -> bool {
    return is_integer(dtype) || is_float(dtype);
}

// ─── Static type mapping ──────────────────────────────────────────────────────

template <typename T>
struct DataTypeOf;

template <>
struct DataTypeOf<bool> : std::integral_constant<DataType, DataType::Bool> {};
template <>
struct DataTypeOf<std::int8_t> : std::integral_constant<DataType, DataType::Int8> {};
template <>
struct DataTypeOf<std::int16_t> : std::integral_constant<DataType, DataType::Int16> {};
template <>
struct DataTypeOf<std::int32_t> : std::integral_constant<DataType, DataType::Int32> {};
template <>
struct DataTypeOf<std::int64_t> : std::integral_constant<DataType, DataType::Int64> {};
template <>
struct DataTypeOf<std::uint8_t> : std::integral_constant<DataType, DataType::UInt8> {};
template <>
struct DataTypeOf<std::uint16_t> : std::integral_constant<DataType, DataType::UInt16> {};
template <>
struct DataTypeOf<std::uint32_t> : std::integral_constant<DataType, DataType::UInt32> {};
template <>
struct DataTypeOf<std::uint64_t> : std::integral_constant<DataType, DataType::UInt64> {};
template <>
struct DataTypeOf<float> : std::integral_constant<DataType, DataType::Float32> {};
template <>
struct DataTypeOf<double> : std::integral_constant<DataType, DataType::Float64> {};
template <>
struct DataTypeOf<std::string> : std::integral_constant<DataType, DataType::String> {};

template <typename T>
inline constexpr DataType data_type_of_v = DataTypeOf<T>::value;

/// Element types a Column may hold: exactly the types with a DataType tag.
template <typename T>
concept ColumnElement = requires { DataTypeOf<T>::value; };

/// Integral or floating element types, excluding bool.
template <typename T>
concept NumericElement =
    ColumnElement<T> && (std::integral<T> || std::floating_point<T>) && !std::same_as<T, bool>;

/// Invoke `func(std::type_identity<T>{})` with the element type named by `dtype`.
template <typename F>
decltype(auto) visit_dtype(DataType dtype, F&& func) {
    switch (dtype) {
        case DataType::Bool:
            return std::forward<F>(func)(std::type_identity<bool>{});
        case DataType::Int8:
            return std::forward<F>(func)(std::type_identity<std::int8_t>{});
        case DataType::Int16:
            return std::forward<F>(func)(std::type_identity<std::int16_t>{});
        case DataType::Int32:
            return std::forward<F>(func)(std::type_identity<std::int32_t>{});
        case DataType::Int64:
            return std::forward<F>(func)(std::type_identity<std::int64_t>{});
        case DataType::UInt8:
            return std::forward<F>(func)(std::type_identity<std::uint8_t>{});
        case DataType::UInt16:
            return std::forward<F>(func)(std::type_identity<std::uint16_t>{});
        case DataType::UInt32:
            return std::forward<F>(func)(std::type_identity<std::uint32_t>{});
        case DataType::UInt64:
            return std::forward<F>(func)(std::type_identity<std::uint64_t>{});
        case DataType::Float32:
            return std::forward<F>(func)(std::type_identity<float>{});
        case DataType::Float64:
            return std::forward<F>(func)(std::type_identity<double>{});
        case DataType::String:
            break;
    }
    return std::forward<F>(func)(std::type_identity<std::string>{});
}

}  // namespace strata
