#pragma once
// Strata CSV adapter: RFC 4180 reading via rapidcsv, plus a writer.
//
// The adapter produces and consumes fully materialised Tables; the core
// library performs no file I/O of its own.
//
//   strata::csv::CsvReadOptions opts;
//   opts.skip_rows = 1;
//   opts.use_columns = std::vector<std::string>{"symbol", "price"};
//   auto table = strata::csv::read_csv("data/prices.csv", opts);

#include <strata/core/dtype.hpp>
#include <strata/core/error.hpp>
#include <strata/table/table.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata::csv {

struct CsvReadOptions {
    /// First (non-skipped) line holds column names. Without a header,
    /// columns are named column_0, column_1, ...
    bool header = true;
    /// Raw lines dropped before the header.
    std::size_t skip_rows = 0;
    /// Columns to keep, in output order. Unknown names are a ParseError.
    std::optional<std::vector<std::string>> use_columns;
    char delimiter = ',';
    /// Lines starting with this character are dropped.
    std::optional<char> comment_char;
    /// Cells equal to any of these are null.
    std::vector<std::string> null_values{""};
    /// Infer i64, f64, bool or str per column; when false every column is str.
    bool infer_types = true;
    /// Explicit types by column name, overriding inference.
    std::unordered_map<std::string, DataType> dtypes;
};

enum class QuoteStyle : std::uint8_t {
    /// Quote fields containing the delimiter, a quote or a line break.
    Necessary,
    Always,
    Never,
    /// Quote every non-null string field.
    NonNumeric,
};

struct CsvWriteOptions {
    bool header = true;
    char delimiter = ',';
    /// Text written for null cells.
    std::string null_repr;
    QuoteStyle quote = QuoteStyle::Necessary;
    std::string line_terminator = "\n";
};

/// Parse CSV text. Every failure surfaces as ErrorKind::Parse.
[[nodiscard]] auto read_csv_string(std::string_view text, const CsvReadOptions& options = {})
    -> Result<Table>;

[[nodiscard]] auto read_csv(const std::filesystem::path& path, const CsvReadOptions& options = {})
    -> Result<Table>;

/// Render a table as CSV text.
[[nodiscard]] auto write_csv_string(const Table& table, const CsvWriteOptions& options = {})
    -> std::string;

/// Write a table to `path`; returns the number of data rows written.
/// ErrorKind::Io when the file cannot be written.
[[nodiscard]] auto write_csv(const Table& table, const std::filesystem::path& path,
                             const CsvWriteOptions& options = {}) -> Result<std::size_t>;

}  // namespace strata::csv
