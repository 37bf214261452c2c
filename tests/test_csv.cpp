#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <csv.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

using namespace strata;
using strata::csv::CsvReadOptions;
using strata::csv::CsvWriteOptions;
using strata::csv::QuoteStyle;

namespace {

void write_file(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

template <typename T>
auto column_of(const Table& table, const std::string& name) -> const Column<T>& {
    auto col = table.downcast_column<T>(name);
    REQUIRE(col.has_value());
    return **col;
}

}  // namespace

TEST_CASE("Read simple CSV - int and string columns", "[csv]") {
    auto path = tmp("strata_test_simple.csv");
    write_file(path, "price,symbol\n10,A\n20,B\n30,A\n");

    auto table = csv::read_csv(path);
    REQUIRE(table.has_value());
    REQUIRE(table->shape() == std::pair<std::size_t, std::size_t>{3, 2});
    REQUIRE(column_of<std::int64_t>(*table, "price").values() ==
            std::vector<std::int64_t>{10, 20, 30});
    REQUIRE(column_of<std::string>(*table, "symbol").values() ==
            std::vector<std::string>{"A", "B", "A"});
}

TEST_CASE("Read CSV - type inference", "[csv]") {
    auto table = csv::read_csv_string("px,qty,flag,label\n1.5,10,true,x\n2.25,20,False,7\n");
    REQUIRE(table.has_value());
    REQUIRE(table->dtypes() == std::vector<DataType>{DataType::Float64, DataType::Int64,
                                                     DataType::Bool, DataType::String});
    REQUIRE(column_of<double>(*table, "px")[1] == Catch::Approx(2.25));
    REQUIRE(column_of<bool>(*table, "flag").values() == std::vector<bool>{true, false});
    REQUIRE(column_of<std::string>(*table, "label").values() ==
            std::vector<std::string>{"x", "7"});
}

TEST_CASE("Read CSV - nulls", "[csv]") {
    SECTION("empty cells are null by default") {
        auto table = csv::read_csv_string("a,b\n1,\n,y\n3,z\n");
        REQUIRE(table.has_value());
        REQUIRE(column_of<std::int64_t>(*table, "a").to_options() ==
                std::vector<std::optional<std::int64_t>>{1, std::nullopt, 3});
        REQUIRE(column_of<std::string>(*table, "b").null_count() == 1);
    }

    SECTION("custom null tokens") {
        CsvReadOptions opts;
        opts.null_values = {"NA", "-"};
        auto table = csv::read_csv_string("a\nNA\n2\n-\n", opts);
        REQUIRE(table.has_value());
        REQUIRE(column_of<std::int64_t>(*table, "a").to_options() ==
                std::vector<std::optional<std::int64_t>>{std::nullopt, 2, std::nullopt});
    }

    SECTION("an all-null column is str") {
        auto table = csv::read_csv_string("a,b\n1,\n2,\n");
        REQUIRE(table.has_value());
        REQUIRE(column_of<std::string>(*table, "b").null_count() == 2);
    }
}

TEST_CASE("Read CSV - layout options", "[csv]") {
    SECTION("skip_rows drops leading lines") {
        CsvReadOptions opts;
        opts.skip_rows = 2;
        auto table = csv::read_csv_string("generated by tool\nversion 3\nid,v\n1,2\n", opts);
        REQUIRE(table.has_value());
        REQUIRE(table->column_names() == std::vector<std::string>{"id", "v"});
        REQUIRE(table->rows() == 1);
    }

    SECTION("comment lines") {
        CsvReadOptions opts;
        opts.comment_char = '#';
        auto table = csv::read_csv_string("id,v\n# skipped\n1,2\n3,4\n", opts);
        REQUIRE(table.has_value());
        REQUIRE(column_of<std::int64_t>(*table, "id").values() == std::vector<std::int64_t>{1, 3});
    }

    SECTION("no header names columns by position") {
        CsvReadOptions opts;
        opts.header = false;
        auto table = csv::read_csv_string("1,a\n2,b\n", opts);
        REQUIRE(table.has_value());
        REQUIRE(table->column_names() == std::vector<std::string>{"column_0", "column_1"});
        REQUIRE(table->rows() == 2);
    }

    SECTION("use_columns selects and orders") {
        CsvReadOptions opts;
        opts.use_columns = std::vector<std::string>{"c", "a"};
        auto table = csv::read_csv_string("a,b,c\n1,2,3\n", opts);
        REQUIRE(table.has_value());
        REQUIRE(table->column_names() == std::vector<std::string>{"c", "a"});
    }

    SECTION("use_columns with an unknown name") {
        CsvReadOptions opts;
        opts.use_columns = std::vector<std::string>{"a", "zzz"};
        auto table = csv::read_csv_string("a,b\n1,2\n", opts);
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().kind == ErrorKind::Parse);
    }

    SECTION("custom delimiter") {
        CsvReadOptions opts;
        opts.delimiter = ';';
        auto table = csv::read_csv_string("a;b\n1;x,y\n", opts);
        REQUIRE(table.has_value());
        REQUIRE(column_of<std::string>(*table, "b")[0] == "x,y");
    }

    SECTION("quoted fields") {
        auto table = csv::read_csv_string("name,v\n\"Smith, J\",1\n");
        REQUIRE(table.has_value());
        REQUIRE(column_of<std::string>(*table, "name")[0] == "Smith, J");
    }
}

TEST_CASE("Read CSV - explicit types", "[csv]") {
    SECTION("dtypes override inference") {
        CsvReadOptions opts;
        opts.dtypes = {{"id", DataType::String}, {"v", DataType::Float32}};
        auto table = csv::read_csv_string("id,v\n1,2\n", opts);
        REQUIRE(table.has_value());
        REQUIRE(table->dtypes() == std::vector<DataType>{DataType::String, DataType::Float32});
    }

    SECTION("unrepresentable values are a parse error") {
        CsvReadOptions opts;
        opts.dtypes = {{"v", DataType::UInt8}};
        auto table = csv::read_csv_string("v\n1\n300\n", opts);
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().kind == ErrorKind::Parse);
    }

    SECTION("inference can be turned off") {
        CsvReadOptions opts;
        opts.infer_types = false;
        auto table = csv::read_csv_string("id\n1\n", opts);
        REQUIRE(table.has_value());
        REQUIRE(table->dtypes() == std::vector<DataType>{DataType::String});
    }
}

TEST_CASE("Read CSV - missing file", "[csv]") {
    auto table = csv::read_csv(tmp("strata_test_does_not_exist.csv"));
    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().kind == ErrorKind::Parse);
}

TEST_CASE("Write CSV", "[csv]") {
    Table table;
    REQUIRE(table.add_column(Column<std::int64_t>::from_options("id", {1, 2, std::nullopt}))
                .has_value());
    REQUIRE(table.add_column(Column<std::string>("name", {"plain", "a,b", "x"})).has_value());
    REQUIRE(table.add_column(Column<double>::from_options("px", {1.5, std::nullopt, 3.0}))
                .has_value());

    SECTION("minimal quoting and empty nulls") {
        REQUIRE(csv::write_csv_string(table) ==
                "id,name,px\n1,plain,1.5\n2,\"a,b\",\n,x,3\n");
    }

    SECTION("null representation and non-numeric quoting") {
        CsvWriteOptions opts;
        opts.null_repr = "NA";
        opts.quote = QuoteStyle::NonNumeric;
        REQUIRE(csv::write_csv_string(table, opts) ==
                "\"id\",\"name\",\"px\"\n1,\"plain\",1.5\n2,\"a,b\",NA\nNA,\"x\",3\n");
    }

    SECTION("embedded quotes are doubled") {
        Table quoted;
        REQUIRE(quoted.add_column(Column<std::string>("s", {"say \"hi\""})).has_value());
        REQUIRE(csv::write_csv_string(quoted) == "s\n\"say \"\"hi\"\"\"\n");
    }

    SECTION("write then read back") {
        auto path = tmp("strata_test_roundtrip.csv");
        auto written = csv::write_csv(table, path);
        REQUIRE(written.has_value());
        REQUIRE(*written == 3);

        auto back = csv::read_csv(path);
        REQUIRE(back.has_value());
        REQUIRE(back->equals(table));
    }

    SECTION("unwritable path") {
        auto written = csv::write_csv(table, tmp("strata_no_such_dir") / "out.csv");
        REQUIRE_FALSE(written.has_value());
        REQUIRE(written.error().kind == ErrorKind::Io);
    }
}
