#include <strata/core/dtype.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace strata {

namespace {

struct DtypeSpelling {
    std::string_view name;
    DataType dtype;
};

constexpr std::array<DtypeSpelling, 26> kSpellings{{
    {"bool", DataType::Bool},       {"i8", DataType::Int8},          {"int8", DataType::Int8},
    {"i16", DataType::Int16},       {"int16", DataType::Int16},      {"i32", DataType::Int32},
    {"int32", DataType::Int32},     {"i64", DataType::Int64},        {"int64", DataType::Int64},
    {"u8", DataType::UInt8},        {"uint8", DataType::UInt8},      {"u16", DataType::UInt16},
    {"uint16", DataType::UInt16},   {"u32", DataType::UInt32},       {"uint32", DataType::UInt32},
    {"u64", DataType::UInt64},      {"uint64", DataType::UInt64},    {"f32", DataType::Float32},
    {"float32", DataType::Float32}, {"float", DataType::Float32},    {"f64", DataType::Float64},
    {"float64", DataType::Float64}, {"double", DataType::Float64},   {"str", DataType::String},
    {"string", DataType::String},   {"boolean", DataType::Bool},
}};

}  // namespace

auto dtype_name(DataType dtype) noexcept -> std::string_view {
    switch (dtype) {
        case DataType::Bool:
            return "bool";
        case DataType::Int8:
            return "i8";
        case DataType::Int16:
            return "i16";
        case DataType::Int32:
            return "i32";
        case DataType::Int64:
            return "i64";
        case DataType::UInt8:
            return "u8";
        case DataType::UInt16:
            return "u16";
        case DataType::UInt32:
            return "u32";
        case DataType::UInt64:
            return "u64";
        case DataType::Float32:
            return "f32";
        case DataType::Float64:
            return "f64";
        case DataType::String:
            return "str";
    }
    return "unknown";
}

auto parse_dtype(std::string_view name) -> std::optional<DataType> {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = std::ranges::find(kSpellings, std::string_view{lowered}, &DtypeSpelling::name);
    if (it == kSpellings.end()) {
        return std::nullopt;
    }
    return it->dtype;
}

}  // namespace strata
