#include <strata/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace strata;

namespace {

auto make_table() -> Table {
    Table table;
    REQUIRE(table.add_column(Column<std::string>("symbol", {"A", "B", "C", "D"})).has_value());
    REQUIRE(table.add_column(Column<double>("price", {10.0, 20.5, 30.0, 40.25})).has_value());
    REQUIRE(table
                .add_column(Column<std::int64_t>::from_options(
                    "qty", {100, std::nullopt, 300, 400}))
                .has_value());
    return table;
}

}  // namespace

TEST_CASE("Table column management", "[table]") {
    auto table = make_table();

    SECTION("shape and metadata") {
        REQUIRE(table.rows() == 4);
        REQUIRE(table.cols() == 3);
        REQUIRE(table.shape() == std::pair<std::size_t, std::size_t>{4, 3});
        REQUIRE(table.column_names() == std::vector<std::string>{"symbol", "price", "qty"});
        REQUIRE(table.dtypes() ==
                std::vector<DataType>{DataType::String, DataType::Float64, DataType::Int64});
        REQUIRE(table.contains("price"));
        REQUIRE_FALSE(table.contains("volume"));
    }

    SECTION("duplicate name is rejected") {
        auto res = table.add_column(Column<double>("price", {1.0, 2.0, 3.0, 4.0}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::DuplicateColumn);
        REQUIRE(table.cols() == 3);
    }

    SECTION("length mismatch is rejected") {
        auto res = table.add_column(Column<double>("volume", {1.0, 2.0}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::LengthMismatch);
        REQUIRE_FALSE(table.contains("volume"));
    }

    SECTION("add under a new name") {
        REQUIRE(table.add_column("flag", Column<bool>("ignored", {true, false, true, false}))
                    .has_value());
        REQUIRE(table.column_names().back() == "flag");
    }

    SECTION("drop and rename") {
        REQUIRE(table.rename_column("qty", "quantity").has_value());
        REQUIRE(table.contains("quantity"));
        REQUIRE_FALSE(table.contains("qty"));
        REQUIRE(table.rename_column("quantity", "price").error().kind ==
                ErrorKind::DuplicateColumn);

        REQUIRE(table.drop_column("price").has_value());
        REQUIRE(table.column_names() == std::vector<std::string>{"symbol", "quantity"});
        REQUIRE((*table.column("quantity"))->null_count() == 1);
        REQUIRE(table.drop_column("price").error().kind == ErrorKind::ColumnNotFound);
    }
}

TEST_CASE("Table from_columns validates input", "[table]") {
    std::vector<Series> ok{Column<std::int64_t>("a", {1, 2}), Column<bool>("b", {true, false})};
    auto table = Table::from_columns(std::move(ok));
    REQUIRE(table.has_value());
    REQUIRE(table->shape() == std::pair<std::size_t, std::size_t>{2, 2});

    std::vector<Series> ragged{Column<std::int64_t>("a", {1, 2}), Column<bool>("b", {true})};
    REQUIRE(Table::from_columns(std::move(ragged)).error().kind == ErrorKind::LengthMismatch);
}

TEST_CASE("Table column lookup", "[table]") {
    auto table = make_table();

    SECTION("missing column lists what is available") {
        auto res = table.column("volume");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::ColumnNotFound);
        REQUIRE(res.error().message == "column not found: volume (available: symbol, price, qty)");
        REQUIRE(table.find("volume") == nullptr);
    }

    SECTION("downcast checks the runtime type") {
        auto price = table.downcast_column<double>("price");
        REQUIRE(price.has_value());
        REQUIRE((**price)[1] == 20.5);

        auto wrong = table.downcast_column<std::int64_t>("price");
        REQUIRE_FALSE(wrong.has_value());
        REQUIRE(wrong.error().kind == ErrorKind::TypeMismatch);

        auto missing = table.downcast_column<double>("nope");
        REQUIRE(missing.error().kind == ErrorKind::ColumnNotFound);
    }

    SECTION("positional access") {
        REQUIRE((*table.column_at(2))->name() == "qty");
        REQUIRE(table.column_at(3).error().kind == ErrorKind::IndexOutOfRange);
    }
}

TEST_CASE("Table selection", "[table]") {
    auto table = make_table();

    SECTION("select reorders columns") {
        auto out = table.select({"qty", "symbol"});
        REQUIRE(out.has_value());
        REQUIRE(out->column_names() == std::vector<std::string>{"qty", "symbol"});
        REQUIRE(out->rows() == 4);

        REQUIRE(table.select({"symbol", "bogus"}).error().kind == ErrorKind::ColumnNotFound);
    }

    SECTION("drop returns a new table") {
        auto out = table.drop("price");
        REQUIRE(out.has_value());
        REQUIRE(out->cols() == 2);
        REQUIRE(table.cols() == 3);
    }

    SECTION("filter keeps mask-true rows in order") {
        auto mask = Mask::from_options("m", {true, false, std::nullopt, true});
        auto out = table.filter(mask);
        REQUIRE(out.has_value());
        REQUIRE(out->rows() == 2);
        auto symbols = out->downcast_column<std::string>("symbol");
        REQUIRE((*symbols)->values() == std::vector<std::string>{"A", "D"});
    }

    SECTION("filter by a derived predicate") {
        auto price = table.downcast_column<double>("price");
        auto out = table.filter((*price)->gt(15.0));
        REQUIRE(out.has_value());
        REQUIRE(out->rows() == 3);
        auto qty = out->downcast_column<std::int64_t>("qty");
        REQUIRE((*qty)->to_options() ==
                std::vector<std::optional<std::int64_t>>{std::nullopt, 300, 400});
    }

    SECTION("filter length mismatch") {
        auto res = table.filter(Mask("m", {true, false}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::LengthMismatch);
    }

    SECTION("par_filter matches filter") {
        auto mask = Mask::from_options("m", {true, false, std::nullopt, true});
        auto serial = table.filter(mask);
        auto parallel = table.par_filter(mask, 3);
        REQUIRE(parallel.has_value());
        REQUIRE(parallel->equals(*serial));
        REQUIRE(parallel->column_names() == table.column_names());

        REQUIRE(table.par_filter(Mask("m", {true})).error().kind == ErrorKind::LengthMismatch);
    }

    SECTION("head and tail") {
        auto top = table.head(2);
        REQUIRE(top.rows() == 2);
        REQUIRE((*top.downcast_column<std::string>("symbol"))->values() ==
                std::vector<std::string>{"A", "B"});

        auto bottom = table.tail(3);
        REQUIRE(bottom.rows() == 3);
        REQUIRE((*bottom.downcast_column<std::string>("symbol"))->values() ==
                std::vector<std::string>{"B", "C", "D"});

        REQUIRE(table.head(100).rows() == 4);
        REQUIRE(table.head(0).rows() == 0);
        REQUIRE(table.head(0).cols() == 3);
    }

    SECTION("take gathers rows") {
        std::vector<std::size_t> idx{3, 3, 0};
        auto out = table.take(idx);
        REQUIRE(out.has_value());
        REQUIRE((*out->downcast_column<std::string>("symbol"))->values() ==
                std::vector<std::string>{"D", "D", "A"});
    }
}

TEST_CASE("Table equality", "[table]") {
    auto a = make_table();
    auto b = make_table();
    REQUIRE(a.equals(b));

    REQUIRE(b.rename_column("qty", "q").has_value());
    REQUIRE_FALSE(a.equals(b));

    REQUIRE(a.equals(*a.select({"symbol", "price", "qty"})));
    REQUIRE_FALSE(a.equals(*a.select({"price", "symbol", "qty"})));
}
