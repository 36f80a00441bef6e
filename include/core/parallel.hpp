#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace ormaudit {

/**
 * @brief Apply fn to every input on up to `workers` threads
 *
 * Inputs are split into contiguous ranges, one per thread; results come
 * back in input order. fn must only share read-only state between calls.
 *
 * If fn throws, the worker that hit it stops, every started thread is
 * joined and the exception of the lowest failing range is rethrown to the
 * caller. A failure to start a thread is handled the same way.
 */
template<typename In, typename Fn>
[[nodiscard]] auto parallel_map_ordered(const std::vector<In>& inputs, size_t workers, Fn fn)
    -> std::vector<decltype(fn(inputs.front()))> {
    using Out = decltype(fn(inputs.front()));
    std::vector<Out> results(inputs.size());

    workers = std::clamp<size_t>(workers, 1, std::max<size_t>(inputs.size(), 1));
    if (workers == 1) {
        for (size_t i = 0; i < inputs.size(); ++i) {
            results[i] = fn(inputs[i]);
        }
        return results;
    }

    const size_t chunk = (inputs.size() + workers - 1) / workers;
    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);

    const auto join_all = [&threads] {
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    };

    try {
        for (size_t w = 0; w < workers; ++w) {
            const size_t begin = w * chunk;
            const size_t end = std::min(inputs.size(), begin + chunk);
            if (begin >= end) break;
            threads.emplace_back([&, w, begin, end] {
                try {
                    for (size_t i = begin; i < end; ++i) {
                        results[i] = fn(inputs[i]);
                    }
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
    } catch (...) {
        join_all();
        throw;
    }
    join_all();

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }
    return results;
}

} // namespace ormaudit
