#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace protscope {
namespace threading {

/**
 * Fork-join pool for independent per-item work.
 *
 * Uses std::thread (not OpenMP). Work is split into contiguous chunks, one
 * per thread; parallel_for blocks until every worker has finished. The first
 * exception thrown by any worker is rethrown on the calling thread after all
 * workers have joined.
 *
 * Usage:
 *   ThreadPool pool(4);
 *   pool.parallel_for(1000, [&](int tid, size_t begin, size_t end) {
 *       for (size_t i = begin; i < end; i++) {
 *           out[i] = work(in[i]);
 *       }
 *   });
 */
class ThreadPool {
public:
    /**
     * @param num_threads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::thread::hardware_concurrency();
        }
        num_threads_ = std::max<size_t>(1, num_threads);
    }

    template <typename Func>
    void parallel_for(size_t count, Func&& func) {
        if (count == 0)
            return;

        const size_t workers_needed = std::min(num_threads_, count);
        const size_t chunk_size = (count + workers_needed - 1) / workers_needed;

        std::vector<std::exception_ptr> errors(workers_needed);
        std::vector<std::thread> workers;
        workers.reserve(workers_needed);

        for (size_t tid = 0; tid < workers_needed; tid++) {
            size_t begin = tid * chunk_size;
            size_t end = std::min(begin + chunk_size, count);

            if (begin >= count)
                break;

            workers.emplace_back([tid, begin, end, &func, &errors]() {
                try {
                    func(static_cast<int>(tid), begin, end);
                } catch (...) {
                    errors[tid] = std::current_exception();
                }
            });
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    size_t num_threads() const {
        return num_threads_;
    }

private:
    size_t num_threads_;
};

}  // namespace threading
}  // namespace protscope
