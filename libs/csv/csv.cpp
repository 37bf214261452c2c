#include "csv.hpp"

#include <strata/core/cast.hpp>
#include <strata/core/column.hpp>
#include <strata/core/series.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <iterator>
#include <sstream>

namespace strata::csv {

namespace {

// Drop the first `skip_rows` raw lines and any comment lines.
auto preprocess(std::string_view text, const CsvReadOptions& options) -> std::string {
    if (options.skip_rows == 0 && !options.comment_char.has_value()) {
        return std::string(text);
    }
    std::string out;
    out.reserve(text.size());
    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t end = text.find('\n', pos);
        const std::size_t next = end == std::string_view::npos ? text.size() : end + 1;
        auto line = text.substr(pos, next - pos);
        const bool skipped = line_no < options.skip_rows;
        const bool comment = options.comment_char.has_value() && !line.empty() &&
                             line.front() == *options.comment_char;
        if (!skipped && !comment) {
            out.append(line);
        }
        ++line_no;
        pos = next;
    }
    return out;
}

auto is_null_token(const std::string& cell, const CsvReadOptions& options) -> bool {
    return std::ranges::find(options.null_values, cell) != options.null_values.end();
}

auto infer_dtype(const std::vector<std::string>& cells, const CsvReadOptions& options)
    -> DataType {
    if (!options.infer_types) {
        return DataType::String;
    }
    bool all_int = true;
    bool all_float = true;
    bool all_bool = true;
    bool any_valid = false;
    for (const auto& cell : cells) {
        if (is_null_token(cell, options)) {
            continue;
        }
        any_valid = true;
        all_int = all_int && detail::parse_number<std::int64_t>(cell).has_value();
        all_float = all_float && detail::parse_number<double>(cell).has_value();
        all_bool = all_bool && detail::parse_bool(cell).has_value();
        if (!all_int && !all_float && !all_bool) {
            return DataType::String;
        }
    }
    if (!any_valid) {
        return DataType::String;
    }
    if (all_int) {
        return DataType::Int64;
    }
    if (all_float) {
        return DataType::Float64;
    }
    if (all_bool) {
        return DataType::Bool;
    }
    return DataType::String;
}

auto build_column(const std::string& name, const std::vector<std::string>& cells,
                  const CsvReadOptions& options) -> Result<Series> {
    Column<std::string> text(name);
    text.reserve(cells.size());
    for (const auto& cell : cells) {
        if (is_null_token(cell, options)) {
            text.push_null();
        } else {
            text.push_back(cell);
        }
    }

    DataType dtype = DataType::String;
    if (auto it = options.dtypes.find(name); it != options.dtypes.end()) {
        dtype = it->second;
    } else {
        dtype = infer_dtype(cells, options);
    }
    if (dtype == DataType::String) {
        return Series{std::move(text)};
    }
    auto typed = Series{std::move(text)}.cast(dtype);
    if (!typed) {
        return make_error(ErrorKind::Parse, "csv column '{}': {}", name, typed.error().message);
    }
    return typed;
}

auto needs_quotes(std::string_view field, char delimiter) -> bool {
    return field.find_first_of(std::string{delimiter, '"', '\n', '\r'}) != std::string_view::npos;
}

auto quote(std::string_view field) -> std::string {
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

auto render_field(std::string_view field, bool is_string, const CsvWriteOptions& options)
    -> std::string {
    switch (options.quote) {
        case QuoteStyle::Always:
            return quote(field);
        case QuoteStyle::Never:
            return std::string(field);
        case QuoteStyle::NonNumeric:
            if (is_string) {
                return quote(field);
            }
            break;
        case QuoteStyle::Necessary:
            break;
    }
    return needs_quotes(field, options.delimiter) ? quote(field) : std::string(field);
}

// Round-trippable cell text, unlike the display formatter.
auto cell_text(const Series& column, std::size_t row) -> std::string {
    return column.visit([row](const auto& col) -> std::string {
        using T = typename std::decay_t<decltype(col)>::value_type;
        auto text = cast_value<std::string, T>(T(col[row]));
        return text.value_or(std::string{});
    });
}

}  // namespace

auto read_csv_string(std::string_view text, const CsvReadOptions& options) -> Result<Table> {
    const std::string body = preprocess(text, options);
    try {
        std::istringstream stream(body);
        rapidcsv::Document doc(stream, rapidcsv::LabelParams(options.header ? 0 : -1, -1),
                               rapidcsv::SeparatorParams(options.delimiter, false,
                                                         rapidcsv::sPlatformHasCR, true));

        std::vector<std::string> names;
        if (options.header) {
            names = doc.GetColumnNames();
        } else {
            for (std::size_t i = 0; i < doc.GetColumnCount(); ++i) {
                names.push_back(fmt::format("column_{}", i));
            }
        }

        std::vector<std::size_t> selected;
        if (options.use_columns.has_value()) {
            for (const auto& wanted : *options.use_columns) {
                auto it = std::ranges::find(names, wanted);
                if (it == names.end()) {
                    return make_error(ErrorKind::Parse, "csv: column '{}' not found in header",
                                      wanted);
                }
                selected.push_back(static_cast<std::size_t>(it - names.begin()));
            }
        } else {
            for (std::size_t i = 0; i < names.size(); ++i) {
                selected.push_back(i);
            }
        }

        Table table;
        for (auto idx : selected) {
            auto cells = doc.GetColumn<std::string>(idx);
            auto column = build_column(names[idx], cells, options);
            if (!column) {
                return std::unexpected(std::move(column.error()));
            }
            if (auto added = table.add_column(std::move(*column)); !added) {
                return make_error(ErrorKind::Parse, "csv: {}", added.error().message);
            }
        }
        spdlog::debug("read_csv: {} rows x {} columns", table.rows(), table.cols());
        return table;
    } catch (const std::exception& e) {
        return make_error(ErrorKind::Parse, "csv: {}", e.what());
    }
}

auto read_csv(const std::filesystem::path& path, const CsvReadOptions& options) -> Result<Table> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error(ErrorKind::Parse, "csv: cannot open {}", path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return read_csv_string(text, options);
}

auto write_csv_string(const Table& table, const CsvWriteOptions& options) -> std::string {
    std::string out;
    const auto& columns = table.columns();
    if (options.header) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) {
                out.push_back(options.delimiter);
            }
            out += render_field(columns[c].name(), true, options);
        }
        out += options.line_terminator;
    }
    for (std::size_t r = 0; r < table.rows(); ++r) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) {
                out.push_back(options.delimiter);
            }
            if (!columns[c].is_valid(r)) {
                out += options.null_repr;
                continue;
            }
            const bool is_string = columns[c].dtype() == DataType::String;
            out += render_field(cell_text(columns[c], r), is_string, options);
        }
        out += options.line_terminator;
    }
    return out;
}

auto write_csv(const Table& table, const std::filesystem::path& path,
               const CsvWriteOptions& options) -> Result<std::size_t> {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return make_error(ErrorKind::Io, "csv: cannot open {} for writing", path.string());
    }
    out << write_csv_string(table, options);
    out.flush();
    if (!out) {
        return make_error(ErrorKind::Io, "csv: failed writing {}", path.string());
    }
    spdlog::debug("write_csv: {} rows to {}", table.rows(), path.string());
    return table.rows();
}

}  // namespace strata::csv
