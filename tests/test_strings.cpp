#include <strata/core/strings.hpp>

#include <catch2/catch_test_macros.hpp>

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace strata;

namespace {

template <typename T>
concept string_viewable = requires(T&& series) { str(std::forward<T>(series)); };

template <typename T>
concept accessor_source = std::constructible_from<StringAccessor, T>;

using OptStr = std::vector<std::optional<std::string>>;

auto names() -> Column<std::string> {
    return Column<std::string>::from_options(
        "name", {std::string("  Alice "), std::nullopt, std::string("bob"), std::string("")});
}

}  // namespace

TEST_CASE("String lengths and case mapping keep nulls", "[core][strings]") {
    auto col = names();
    StringAccessor acc(col);

    auto len = acc.str_len();
    REQUIRE(len.name() == "name_len");
    REQUIRE(len.to_options() ==
            std::vector<std::optional<std::uint32_t>>{8, std::nullopt, 3, 0});

    auto upper = acc.to_uppercase();
    REQUIRE(upper.name() == "name_upper");
    REQUIRE(upper.to_options() ==
            OptStr{std::string("  ALICE "), std::nullopt, std::string("BOB"), std::string("")});

    REQUIRE(acc.to_lowercase().to_options() ==
            OptStr{std::string("  alice "), std::nullopt, std::string("bob"), std::string("")});
}

TEST_CASE("String predicates produce non-null masks", "[core][strings]") {
    auto col = names();
    StringAccessor acc(col);

    auto hit = acc.contains("li");
    REQUIRE(hit.values() == std::vector<bool>{true, false, false, false});
    REQUIRE(hit.null_count() == 0);

    REQUIRE(acc.starts_with("b").values() == std::vector<bool>{false, false, true, false});
    REQUIRE(acc.ends_with(" ").values() == std::vector<bool>{true, false, false, false});
    // Every non-null string contains the empty pattern.
    REQUIRE(acc.contains("").values() == std::vector<bool>{true, false, true, true});
}

TEST_CASE("String replace and strip", "[core][strings]") {
    Column<std::string> col("s", {"a-b-c", "  pad  ", "---"});
    StringAccessor acc(col);

    REQUIRE(acc.replace("-", "+").values() ==
            std::vector<std::string>{"a+b+c", "  pad  ", "+++"});
    REQUIRE(acc.replace("--", "=").values() == std::vector<std::string>{"a-b-c", "  pad  ", "=-"});
    REQUIRE(acc.strip().values()[1] == "pad");
    REQUIRE(acc.lstrip().values()[1] == "pad  ");
    REQUIRE(acc.rstrip().values()[1] == "  pad");
}

TEST_CASE("String accessor on a runtime-typed column", "[core][strings]") {
    Series text = names();
    auto acc = str(text);
    REQUIRE(acc.has_value());
    REQUIRE(acc->str_len().size() == 4);

    Series numbers = Column<std::int64_t>("n", {1, 2});
    auto bad = str(numbers);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("String accessor cannot borrow a temporary", "[core][strings]") {
    STATIC_REQUIRE(string_viewable<Series&>);
    STATIC_REQUIRE(string_viewable<const Series&>);
    STATIC_REQUIRE_FALSE(string_viewable<Series>);
    STATIC_REQUIRE_FALSE(string_viewable<const Series>);

    STATIC_REQUIRE(accessor_source<const Column<std::string>&>);
    STATIC_REQUIRE_FALSE(accessor_source<Column<std::string>>);
    STATIC_REQUIRE_FALSE(accessor_source<Column<std::string>&&>);
}
