#include <strata/core/error.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace strata {

auto error_kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::Shape:
            return "ShapeError";
        case ErrorKind::LengthMismatch:
            return "LengthMismatch";
        case ErrorKind::DuplicateColumn:
            return "DuplicateColumn";
        case ErrorKind::ColumnNotFound:
            return "ColumnNotFound";
        case ErrorKind::TypeMismatch:
            return "TypeMismatch";
        case ErrorKind::Cast:
            return "CastError";
        case ErrorKind::UnsupportedAggregation:
            return "UnsupportedAggregation";
        case ErrorKind::DivisionByZero:
            return "DivisionByZero";
        case ErrorKind::IndexOutOfRange:
            return "IndexOutOfRange";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::Parse:
            return "ParseError";
        case ErrorKind::Io:
            return "IoError";
    }
    return "Error";
}

auto to_string(const Error& error) -> std::string {
    return fmt::format("{}: {}", error_kind_name(error.kind), error.message);
}

namespace detail {

void invariant_failure(std::string_view what) {
    spdlog::critical("strata invariant violated: {}", what);
    std::abort();
}

}  // namespace detail

}  // namespace strata
