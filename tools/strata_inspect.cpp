#include <strata/strata.hpp>

#include <CLI/CLI.hpp>
#include <csv.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

auto parse_sort_key(std::string_view spec) -> strata::SortKey {
    strata::SortKey key;
    auto colon = spec.rfind(':');
    if (colon != std::string_view::npos) {
        auto direction = spec.substr(colon + 1);
        if (direction == "desc" || direction == "asc") {
            key.descending = direction == "desc";
            spec = spec.substr(0, colon);
        }
    }
    key.name = std::string(spec);
    return key;
}

void configure_logging(bool verbose) {
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    const char* env = std::getenv("STRATA_LOG_LEVEL");
    if (env != nullptr) {
        spdlog::set_level(spdlog::level::from_str(env));
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

auto fail(const strata::Error& error) -> int {
    spdlog::error("{}", strata::to_string(error));
    return 1;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"strata_inspect: load a CSV file and summarise, sort or aggregate it"};

    std::string path;
    bool verbose = false;
    bool no_header = false;
    bool schema = false;
    std::size_t skip_rows = 0;
    std::size_t head = 10;
    char delimiter = ',';
    std::vector<std::string> columns;
    std::vector<std::string> nulls;
    std::vector<std::string> sort_specs;
    std::vector<std::string> group_keys;
    std::string agg = "count";

    app.add_option("csv", path, "CSV file to load")->required()->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("--no-header", no_header, "Treat the first line as data");
    app.add_flag("--schema", schema, "Print column names and types");
    app.add_option("--skip-rows", skip_rows, "Lines to skip before the header");
    app.add_option("--head", head, "Rows to print")->capture_default_str();
    app.add_option("--delimiter", delimiter, "Field separator")->capture_default_str();
    app.add_option("--columns", columns, "Columns to load, in order")->delimiter(',');
    app.add_option("--null", nulls, "Additional cell values read as null");
    app.add_option("--sort", sort_specs, "Sort key, optionally suffixed with :asc or :desc");
    app.add_option("--group-by", group_keys, "Group-by key column")->delimiter(',');
    app.add_option("--agg", agg, "Aggregation applied per group")
        ->check(CLI::IsMember({"sum", "mean", "min", "max", "count"}))
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    configure_logging(verbose);

    strata::csv::CsvReadOptions options;
    options.header = !no_header;
    options.skip_rows = skip_rows;
    options.delimiter = delimiter;
    if (!columns.empty()) {
        options.use_columns = columns;
    }
    options.null_values.insert(options.null_values.end(), nulls.begin(), nulls.end());

    auto table = strata::csv::read_csv(path, options);
    if (!table) {
        return fail(table.error());
    }
    spdlog::info("loaded {} ({} rows x {} columns)", path, table->rows(), table->cols());

    if (schema) {
        for (const auto& column : table->columns()) {
            fmt::print("{}: {} ({} nulls)\n", column.name(), strata::dtype_name(column.dtype()),
                       column.null_count());
        }
    }

    strata::Table result = std::move(*table);

    if (!group_keys.empty()) {
        auto grouped = result.groupby(group_keys);
        if (!grouped) {
            return fail(grouped.error());
        }
        strata::Result<strata::Table> aggregated;
        if (agg == "sum") {
            aggregated = grouped->sum();
        } else if (agg == "mean") {
            aggregated = grouped->mean();
        } else if (agg == "min") {
            aggregated = grouped->min();
        } else if (agg == "max") {
            aggregated = grouped->max();
        } else {
            aggregated = grouped->count();
        }
        if (!aggregated) {
            return fail(aggregated.error());
        }
        result = std::move(*aggregated);
    }

    if (!sort_specs.empty()) {
        std::vector<strata::SortKey> keys;
        keys.reserve(sort_specs.size());
        for (const auto& spec : sort_specs) {
            keys.push_back(parse_sort_key(spec));
        }
        auto sorted = result.sort_by(keys);
        if (!sorted) {
            return fail(sorted.error());
        }
        result = std::move(*sorted);
    }

    strata::print(result.head(head), std::cout, head);
    if (result.rows() > head) {
        fmt::print("({} of {} rows shown)\n", head, result.rows());
    }
    return 0;
}
