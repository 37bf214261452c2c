#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace strata {

/// Category of a recoverable failure.
enum class ErrorKind : std::uint8_t {
    Shape,
    LengthMismatch,
    DuplicateColumn,
    ColumnNotFound,
    TypeMismatch,
    Cast,
    UnsupportedAggregation,
    DivisionByZero,
    IndexOutOfRange,
    InvalidArgument,
    Parse,
    Io,
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;
};

/// Every fallible operation returns a Result; none throws for usage errors.
template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto error_kind_name(ErrorKind kind) noexcept -> std::string_view;

/// "<kind>: <message>"
[[nodiscard]] auto to_string(const Error& error) -> std::string;

template <typename... Args>
[[nodiscard]] auto make_error(ErrorKind kind, fmt::format_string<Args...> format, Args&&... args)
    -> std::unexpected<Error> {
    return std::unexpected(Error{kind, fmt::format(format, std::forward<Args>(args)...)});
}

namespace detail {

/// Logs at critical level and aborts. Reserved for corrupted column state
/// (value and validity buffers of different length), never for usage errors.
[[noreturn]] void invariant_failure(std::string_view what);

}  // namespace detail

}  // namespace strata
