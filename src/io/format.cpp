#include <strata/io/format.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <ostream>
#include <vector>

namespace strata {

namespace {

// Row indices to display; std::nullopt marks the elided middle.
auto display_rows(std::size_t rows, std::size_t max_rows)
    -> std::vector<std::optional<std::size_t>> {
    std::vector<std::optional<std::size_t>> out;
    if (rows <= max_rows) {
        for (std::size_t r = 0; r < rows; ++r) {
            out.emplace_back(r);
        }
        return out;
    }
    const std::size_t front = (max_rows + 1) / 2;
    const std::size_t back = max_rows / 2;
    for (std::size_t r = 0; r < front; ++r) {
        out.emplace_back(r);
    }
    out.emplace_back(std::nullopt);
    for (std::size_t r = rows - back; r < rows; ++r) {
        out.emplace_back(r);
    }
    return out;
}

auto render(const std::vector<const Series*>& columns, const std::vector<std::string>& headers,
            std::size_t rows, std::size_t max_rows) -> std::string {
    const auto shown = display_rows(rows, max_rows);

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(columns.size());
    std::vector<std::size_t> widths(columns.size());
    for (std::size_t c = 0; c < columns.size(); ++c) {
        widths[c] = headers[c].size();
        cells[c].reserve(shown.size());
        for (const auto& row : shown) {
            auto s = row.has_value() ? columns[c]->format_cell(*row) : std::string("...");
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);
    for (std::size_t c = 0; c < columns.size(); ++c) {
        fmt::format_to(out, "{}{:<{}}", c > 0 ? "  " : "", headers[c], widths[c]);
    }
    fmt::format_to(out, "\n");
    for (std::size_t c = 0; c < columns.size(); ++c) {
        fmt::format_to(out, "{}{}", c > 0 ? "  " : "", std::string(widths[c], '-'));
    }
    fmt::format_to(out, "\n");
    for (std::size_t r = 0; r < shown.size(); ++r) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            fmt::format_to(out, "{}{:<{}}", c > 0 ? "  " : "", cells[c][r], widths[c]);
        }
        fmt::format_to(out, "\n");
    }
    return fmt::to_string(buf);
}

}  // namespace

auto format_table(const Table& table, std::size_t max_rows) -> std::string {
    if (table.empty()) {
        return "(empty table)\n";
    }
    std::vector<const Series*> columns;
    std::vector<std::string> headers;
    for (const auto& column : table.columns()) {
        columns.push_back(&column);
        headers.push_back(column.name());
    }
    auto text = render(columns, headers, table.rows(), max_rows);
    text += fmt::format("[{} rows x {} columns]\n", table.rows(), table.cols());
    return text;
}

auto format_series(const Series& series, std::size_t max_rows) -> std::string {
    auto header = fmt::format("{} ({})", series.name(), dtype_name(series.dtype()));
    auto text = render({&series}, {header}, series.size(), max_rows);
    text += fmt::format("[{} rows]\n", series.size());
    return text;
}

void print(const Table& table, std::ostream& out, std::size_t max_rows) {
    out << format_table(table, max_rows);
}

void print(const Series& series, std::ostream& out, std::size_t max_rows) {
    out << format_series(series, max_rows);
}

}  // namespace strata
