#include <strata/strata.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

auto main() -> int {
    // A column of prices with one missing value
    auto prices = strata::Column<double>::from_options(
        "price", {100.5, 200.3, std::nullopt, 175.8, 320.1});

    fmt::print("=== Column operations ===\n");
    fmt::print("prices: {} elements, {} null\n", prices.size(), prices.null_count());

    auto expensive = prices.gt(150.0);
    fmt::print("prices > 150: {} rows\n", std::ranges::count(expensive.values(), true));

    auto bps = prices.mul(100.0);
    fmt::print("first price in bps: {}\n", bps[0]);

    auto doubled = prices.par_apply([](std::optional<double> p) -> std::optional<double> {
        if (!p) {
            return std::nullopt;
        }
        return *p * 2.0;
    });
    fmt::print("doubled mean: {}\n", doubled.mean().value_or(0.0));

    fmt::print("\n=== Table ===\n");

    strata::Table trades;
    auto ok = trades.add_column(strata::Column<std::string>("symbol", {"A", "B", "A", "C", "B"}))
                  .and_then([&] { return trades.add_column(prices); })
                  .and_then([&] {
                      return trades.add_column(
                          strata::Column<std::int64_t>("qty", {10, 5, 7, 1, 3}));
                  });
    if (!ok) {
        fmt::print("error: {}\n", strata::to_string(ok.error()));
        return 1;
    }
    strata::print(trades, std::cout);

    auto sorted = trades.sort({"symbol", "price"}, std::vector<bool>{false, true});
    if (sorted) {
        fmt::print("\nsorted by symbol, price desc:\n");
        strata::print(*sorted, std::cout);
    }

    auto grouped = trades.groupby({"symbol"}).and_then([](const strata::GroupBy& g) {
        return g.sum();
    });
    if (grouped) {
        fmt::print("\nsum by symbol:\n");
        strata::print(*grouped, std::cout);
    }

    return 0;
}
