#include <strata/engine/group.hpp>
#include <strata/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace strata;

namespace {

template <typename T>
concept groupable = requires(T&& table) {
    std::forward<T>(table).groupby(std::vector<std::string>{"k"});
};

using OptI64 = std::vector<std::optional<std::int64_t>>;
using OptF64 = std::vector<std::optional<double>>;
using OptStr = std::vector<std::optional<std::string>>;

auto make_sales() -> Table {
    Table table;
    REQUIRE(table
                .add_column(Column<std::string>::from_options(
                    "region", {std::string("east"), std::string("west"), std::string("east"),
                               std::nullopt, std::string("west"), std::nullopt}))
                .has_value());
    REQUIRE(table
                .add_column(Column<std::int64_t>::from_options(
                    "units", {1, std::nullopt, 3, 4, std::nullopt, 6}))
                .has_value());
    REQUIRE(table
                .add_column(Column<double>::from_options(
                    "price", {1.0, 2.0, 3.0, 4.0, 5.0, std::nullopt}))
                .has_value());
    REQUIRE(table.add_column(Column<std::string>("rep", {"ann", "bo", "cy", "di", "ed", "flo"}))
                .has_value());
    return table;
}

template <typename T>
auto column_of(const Table& table, const std::string& name) -> const Column<T>& {
    auto col = table.downcast_column<T>(name);
    REQUIRE(col.has_value());
    return **col;
}

}  // namespace

TEST_CASE("GroupBy orders groups by first appearance", "[engine][groupby]") {
    auto table = make_sales();
    auto grouped = table.groupby({"region"});
    REQUIRE(grouped.has_value());
    REQUIRE(grouped->ngroups() == 3);
    REQUIRE(**grouped->group_rows(0) == std::vector<std::size_t>{0, 2});
    REQUIRE(**grouped->group_rows(1) == std::vector<std::size_t>{1, 4});
    // Null keys form their own group.
    REQUIRE(**grouped->group_rows(2) == std::vector<std::size_t>{3, 5});
    REQUIRE(grouped->group_rows(3).error().kind == ErrorKind::IndexOutOfRange);

    auto keys = grouped->key_table();
    REQUIRE(keys.has_value());
    REQUIRE(column_of<std::string>(*keys, "region").to_options() ==
            OptStr{std::string("east"), std::string("west"), std::nullopt});
}

TEST_CASE("GroupBy partitions every row exactly once", "[engine][groupby]") {
    auto table = make_sales();
    auto grouped = table.groupby({"region", "rep"});
    REQUIRE(grouped.has_value());
    REQUIRE(grouped->ngroups() == 6);

    std::vector<std::size_t> seen;
    for (std::size_t g = 0; g < grouped->ngroups(); ++g) {
        auto members = grouped->group_rows(g);
        REQUIRE(members.has_value());
        const auto& rows = **members;
        REQUIRE_FALSE(rows.empty());
        seen.insert(seen.end(), rows.begin(), rows.end());
    }
    std::ranges::sort(seen);
    REQUIRE(seen == std::vector<std::size_t>{0, 1, 2, 3, 4, 5});
}

TEST_CASE("GroupBy numeric aggregations skip nulls", "[engine][groupby]") {
    auto table = make_sales();
    auto grouped = table.groupby({"region"});
    REQUIRE(grouped.has_value());

    SECTION("sum widens and leaves all-null groups null") {
        auto out = grouped->sum();
        REQUIRE(out.has_value());
        // String columns other than the key are not aggregated.
        REQUIRE(out->column_names() == std::vector<std::string>{"region", "units", "price"});
        REQUIRE(column_of<std::int64_t>(*out, "units").to_options() ==
                OptI64{4, std::nullopt, 10});
        REQUIRE(column_of<double>(*out, "price").to_options() == OptF64{4.0, 7.0, 4.0});
    }

    SECTION("group sums add up to the column total") {
        auto out = grouped->sum();
        REQUIRE(out.has_value());
        const auto& per_group = column_of<std::int64_t>(*out, "units");
        REQUIRE(per_group.sum() == column_of<std::int64_t>(table, "units").sum());
    }

    SECTION("mean is f64") {
        auto out = grouped->mean();
        REQUIRE(out.has_value());
        REQUIRE(column_of<double>(*out, "units").to_options() ==
                OptF64{2.0, std::nullopt, 5.0});
        REQUIRE(column_of<double>(*out, "price").to_options() == OptF64{2.0, 3.5, 4.0});
    }

    SECTION("min and max keep the input type") {
        auto lo = grouped->min();
        auto hi = grouped->max();
        REQUIRE(lo.has_value());
        REQUIRE(hi.has_value());
        REQUIRE(column_of<double>(*lo, "price").to_options() == OptF64{1.0, 2.0, 4.0});
        REQUIRE(column_of<double>(*hi, "price").to_options() == OptF64{3.0, 5.0, 4.0});
        REQUIRE(column_of<std::int64_t>(*hi, "units").to_options() ==
                OptI64{3, std::nullopt, 6});
    }

    SECTION("count is the group size") {
        auto out = grouped->count();
        REQUIRE(out.has_value());
        REQUIRE(out->column_names() == std::vector<std::string>{"region", "count"});
        REQUIRE(column_of<std::uint64_t>(*out, "count").values() ==
                std::vector<std::uint64_t>{2, 2, 2});
    }
}

TEST_CASE("GroupBy sum widens narrow types", "[engine][groupby]") {
    Table table;
    REQUIRE(table.add_column(Column<std::int64_t>("k", {1, 1})).has_value());
    REQUIRE(table.add_column(Column<std::int8_t>("small", {100, 100})).has_value());
    REQUIRE(table.add_column(Column<std::uint8_t>("bytes", {200, 200})).has_value());
    REQUIRE(table.add_column(Column<float>("f", {0.5F, 0.25F})).has_value());

    auto out = table.groupby({"k"}).and_then([](const GroupBy& g) { return g.sum(); });
    REQUIRE(out.has_value());
    REQUIRE(out->dtypes() == std::vector<DataType>{DataType::Int64, DataType::Int64,
                                                   DataType::UInt64, DataType::Float64});
    REQUIRE(column_of<std::int64_t>(*out, "small")[0] == 200);
    REQUIRE(column_of<std::uint64_t>(*out, "bytes")[0] == 400);
    REQUIRE(column_of<double>(*out, "f")[0] == 0.75);
}

TEST_CASE("GroupBy explicit aggregation list", "[engine][groupby]") {
    auto table = make_sales();
    auto grouped = table.groupby({"region"});
    REQUIRE(grouped.has_value());

    SECTION("mixed aggregations with aliases") {
        auto out = grouped->agg({
            {"units", AggFunc::Sum, "total_units"},
            {"units", AggFunc::Count, "n_units"},
            {"", AggFunc::Count, ""},
            {"rep", AggFunc::First, ""},
            {"rep", AggFunc::Last, "last_rep"},
            {"rep", AggFunc::Max, "max_rep"},
        });
        REQUIRE(out.has_value());
        REQUIRE(out->column_names() ==
                std::vector<std::string>{"region", "total_units", "n_units", "count", "rep",
                                         "last_rep", "max_rep"});
        REQUIRE(column_of<std::uint64_t>(*out, "n_units").values() ==
                std::vector<std::uint64_t>{2, 0, 2});
        REQUIRE(column_of<std::uint64_t>(*out, "count").values() ==
                std::vector<std::uint64_t>{2, 2, 2});
        REQUIRE(column_of<std::string>(*out, "rep").values() ==
                std::vector<std::string>{"ann", "bo", "di"});
        REQUIRE(column_of<std::string>(*out, "last_rep").values() ==
                std::vector<std::string>{"cy", "ed", "flo"});
        REQUIRE(column_of<std::string>(*out, "max_rep").values() ==
                std::vector<std::string>{"cy", "ed", "flo"});
    }

    SECTION("sum of a string column is unsupported") {
        auto out = grouped->agg({{"rep", AggFunc::Sum, ""}});
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::UnsupportedAggregation);
    }

    SECTION("unknown column") {
        auto out = grouped->agg({{"missing", AggFunc::Min, ""}});
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::ColumnNotFound);
    }
}

TEST_CASE("GroupBy rejects bad keys", "[engine][groupby]") {
    auto table = make_sales();
    REQUIRE(table.groupby({}).error().kind == ErrorKind::InvalidArgument);
    REQUIRE(table.groupby({"nope"}).error().kind == ErrorKind::ColumnNotFound);
}

TEST_CASE("GroupBy treats NaN keys as one group", "[engine][groupby]") {
    Table table;
    REQUIRE(table.add_column(Column<double>("k", {std::nan(""), 1.0, std::nan("")})).has_value());
    REQUIRE(table.add_column(Column<std::int64_t>("v", {1, 2, 3})).has_value());

    auto grouped = table.groupby({"k"});
    REQUIRE(grouped.has_value());
    REQUIRE(grouped->ngroups() == 2);
    REQUIRE(**grouped->group_rows(0) == std::vector<std::size_t>{0, 2});
}

TEST_CASE("GroupBy cannot borrow a temporary table", "[engine][groupby]") {
    STATIC_REQUIRE(groupable<Table&>);
    STATIC_REQUIRE(groupable<const Table&>);
    STATIC_REQUIRE_FALSE(groupable<Table>);
    STATIC_REQUIRE_FALSE(groupable<const Table>);
}

TEST_CASE("agg_func names round trip", "[engine][groupby]") {
    REQUIRE(parse_agg_func("mean") == std::optional<AggFunc>{AggFunc::Mean});
    REQUIRE(agg_func_name(AggFunc::Count) == "count");
    REQUIRE_FALSE(parse_agg_func("median").has_value());
}
