#ifndef TOON_PARALLEL_HPP
#define TOON_PARALLEL_HPP

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

namespace toonpack {

// Worker count for `requested` (0 = hardware concurrency)
inline size_t resolve_workers(size_t requested) {
    if (requested > 0) return requested;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

// Run fn(begin, end) over contiguous slices of [0, n), one slice per worker.
// Slices share nothing but `fn`; the first failing slice's exception is
// rethrown on the calling thread after every worker has joined.  `spawn`
// turns a task into a running std::thread; if it throws, the workers already
// started are joined before the error propagates.
template <typename Fn, typename Spawn>
void parallel_for_ranges(size_t n, size_t workers, Fn fn, Spawn spawn) {
    if (workers <= 1 || n < 2) {
        fn(size_t(0), n);
        return;
    }

    workers = std::min(workers, n);
    const size_t chunk = (n + workers - 1) / workers;

    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);

    try {
        for (size_t w = 0; w < workers; w++) {
            size_t begin = w * chunk;
            if (begin >= n) break;
            size_t end = std::min(n, begin + chunk);
            threads.push_back(spawn(std::function<void()>([&fn, &errors, w, begin, end] {
                try {
                    fn(begin, end);
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            })));
        }
    } catch (...) {
        for (auto& t : threads) {
            t.join();
        }
        throw;
    }

    for (auto& t : threads) {
        t.join();
    }
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

template <typename Fn>
void parallel_for_ranges(size_t n, size_t workers, Fn fn) {
    parallel_for_ranges(n, workers, std::move(fn),
                        [](std::function<void()> task) { return std::thread(std::move(task)); });
}

} // namespace toonpack

#endif // TOON_PARALLEL_HPP
