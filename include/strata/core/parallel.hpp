#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace strata {

/// Number of workers used when a caller passes 0.
[[nodiscard]] inline auto default_worker_count() noexcept -> std::size_t {
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

namespace detail {

/// parallel_for_ranges with the thread start-up supplied by the caller:
/// `launch(pool, task)` must append a thread running `task` to `pool`, or
/// throw std::system_error.
template <typename Body, typename Launch>
void for_ranges_with(std::size_t n, std::size_t workers, Body&& body, Launch&& launch) {
    if (workers == 0) {
        workers = default_worker_count();
    }
    const std::size_t threads = std::min(workers, n);
    if (threads <= 1) {
        if (n > 0) {
            body(std::size_t{0}, n);
        }
        return;
    }
    const std::size_t chunk = (n + threads - 1) / threads;
    spdlog::debug("parallel_for_ranges: {} rows over {} workers (chunk {})", n, threads, chunk);

    std::vector<std::exception_ptr> failures(threads);
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        std::size_t start = t * chunk;
        if (start >= n) {
            break;
        }
        std::size_t end = std::min(n, start + chunk);
        try {
            launch(pool, [&body, &failures, t, start, end] {
                try {
                    body(start, end);
                } catch (...) {
                    failures[t] = std::current_exception();
                }
            });
        } catch (const std::system_error& e) {
            // Out of threads: finish the remaining rows here.
            spdlog::warn("parallel_for_ranges: started {} of {} workers ({})", pool.size(),
                         threads, e.what());
            try {
                body(start, n);
            } catch (...) {
                failures[t] = std::current_exception();
            }
            break;
        }
    }
    for (auto& th : pool) {
        th.join();
    }
    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
}

}  // namespace detail

/// Split [0, n) into at most `workers` contiguous ranges and run
/// `body(begin, end)` for each on its own thread. Returns after every
/// worker has joined. The first exception thrown by any range is rethrown
/// on the calling thread. When a worker thread cannot be started, the rows
/// not yet handed out run on the calling thread.
template <typename Body>
void parallel_for_ranges(std::size_t n, std::size_t workers, Body&& body) {
    detail::for_ranges_with(n, workers, std::forward<Body>(body),
                            [](std::vector<std::thread>& pool, auto&& task) {
                                pool.emplace_back(std::forward<decltype(task)>(task));
                            });
}

}  // namespace strata
