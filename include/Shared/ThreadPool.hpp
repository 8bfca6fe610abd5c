// =============================================================================
// SKYROAM - THREAD POOL
// Fixed worker set used by the ingestion worker for per-chunk meshing
// =============================================================================
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <algorithm>
#include <exception>
#include <type_traits>

namespace skyroam {

class ThreadPool {
public:
    explicit ThreadPool(std::size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }

        m_workers.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            m_workers.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a task and get a future for the result.
    // After shutdown() the task runs inline on the caller.
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_stop) {
                m_tasks.emplace([task]() { (*task)(); });
                m_condition.notify_one();
                return result;
            }
        }

        (*task)();
        return result;
    }

    // Run fn(i) for i in [0, count) across the pool; results keep index order.
    // Every task has finished before this returns or throws; the first
    // exception thrown by fn is rethrown on the calling thread.
    template<typename F>
    auto map_ordered(std::size_t count, F fn) -> std::vector<std::invoke_result_t<F, std::size_t>> {
        using ReturnType = std::invoke_result_t<F, std::size_t>;

        std::vector<std::future<ReturnType>> futures;
        futures.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            futures.push_back(submit([fn, i]() { return fn(i); }));
        }

        std::vector<ReturnType> results;
        results.reserve(count);
        std::exception_ptr first_error;
        for (auto& f : futures) {
            try {
                results.push_back(f.get());
            } catch (...) {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
        return results;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_workers.size();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stop) return;
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        m_workers.clear();
    }

private:
    void worker_loop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_condition.wait(lock, [this] {
                    return m_stop || !m_tasks.empty();
                });

                // Drain remaining work before exiting
                if (m_stop && m_tasks.empty()) {
                    return;
                }

                task = std::move(m_tasks.front());
                m_tasks.pop();
            }

            task();
        }
    }

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;

    std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_stop = false;
};

} // namespace skyroam
