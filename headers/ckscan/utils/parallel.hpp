#ifndef CKSCAN_UTILS_PARALLEL_HPP
#define CKSCAN_UTILS_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Bounded worker pool and a parallel map over it.
 *
 * Both analysis phases fan out one task per file onto a ThreadPool owned by
 * the analyzer. Results come back in input order regardless of completion
 * order.
 */

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace ckscan::parallel {

    /**
     * Returns the number of hardware threads available, at least 1.
     */
    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * Fixed-size pool of worker threads fed from a FIFO task queue.
     *
     * Destroying the pool drains the queue before joining the workers.
     */
    class ThreadPool {
    public:
        /**
         * @param num_threads Number of worker threads (0 = hardware concurrency).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Queues a callable and returns a future for its result.
         *
         * Exceptions thrown by the callable are delivered through the future.
         *
         * @throws std::runtime_error if the pool is shutting down.
         */
        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using return_type = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Maps a function over a vector on the given pool.
     *
     * The returned vector is in input order. If a task throws, the first
     * exception in input order is rethrown once every task has finished.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F&, const T&>> {
        using ResultType = std::invoke_result_t<F&, const T&>;

        std::vector<std::future<ResultType>> futures;
        futures.reserve(items.size());

        for (const auto& item : items) {
            futures.push_back(pool.submit([&f, &item]() {
                return f(item);
            }));
        }

        // Tasks hold references to f and items; none may outlive this call.
        for (const auto& future : futures) {
            future.wait();
        }

        std::vector<ResultType> results;
        results.reserve(items.size());

        for (auto& future : futures) {
            results.push_back(future.get());
        }

        return results;
    }

}  // namespace ckscan::parallel

#endif //CKSCAN_UTILS_PARALLEL_HPP
