#include <strata/core/parallel.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using strata::parallel_for_ranges;

namespace {

/// Starts `limit` threads, then reports resource exhaustion.
struct LimitedLauncher {
    std::size_t limit;

    template <typename Task>
    void operator()(std::vector<std::thread>& pool, Task&& task) const {
        if (pool.size() >= limit) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        pool.emplace_back(std::forward<Task>(task));
    }
};

}  // namespace

TEST_CASE("parallel_for_ranges covers every index once", "[core][parallel]") {
    std::vector<int> hits(1000, 0);
    parallel_for_ranges(hits.size(), 4, [&](std::size_t begin, std::size_t end) {
        for (auto i = begin; i < end; ++i) {
            ++hits[i];
        }
    });
    REQUIRE(hits == std::vector<int>(1000, 1));

    SECTION("an empty range never calls the body") {
        bool called = false;
        parallel_for_ranges(0, 4, [&](std::size_t, std::size_t) { called = true; });
        REQUIRE_FALSE(called);
    }
}

TEST_CASE("parallel_for_ranges rethrows a worker exception", "[core][parallel]") {
    REQUIRE_THROWS_AS(parallel_for_ranges(100, 4,
                                          [](std::size_t begin, std::size_t) {
                                              if (begin > 0) {
                                                  throw std::runtime_error("range failed");
                                              }
                                          }),
                      std::runtime_error);
}

TEST_CASE("Rows run on the caller when a worker cannot start", "[core][parallel]") {
    std::vector<int> hits(100, 0);
    auto mark = [&](std::size_t begin, std::size_t end) {
        for (auto i = begin; i < end; ++i) {
            ++hits[i];
        }
    };

    SECTION("after some workers started") {
        REQUIRE_NOTHROW(strata::detail::for_ranges_with(hits.size(), 4, mark, LimitedLauncher{2}));
        REQUIRE(hits == std::vector<int>(100, 1));
    }

    SECTION("before any worker started") {
        REQUIRE_NOTHROW(strata::detail::for_ranges_with(hits.size(), 4, mark, LimitedLauncher{0}));
        REQUIRE(hits == std::vector<int>(100, 1));
    }

    SECTION("a failure on the caller still joins the started workers") {
        auto fail_late = [&](std::size_t begin, std::size_t end) {
            mark(begin, end);
            if (end == hits.size()) {
                throw std::runtime_error("tail failed");
            }
        };
        REQUIRE_THROWS_AS(
            strata::detail::for_ranges_with(hits.size(), 4, fail_late, LimitedLauncher{1}),
            std::runtime_error);
        REQUIRE(hits == std::vector<int>(100, 1));
    }
}
