#pragma once

/** \file thread_pool.hpp
 *  \brief Fixed-size worker pool used to fan out predicate and group evaluation.
 *
 * Centralized FIFO task queue. Tasks are independent; the pool gives no
 * ordering guarantee between them.
 */

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace verdict::core {

class ThreadPool {
public:
    /** \brief Construct the pool.
     *
     * \param num_threads Number of worker threads (0 = hardware concurrency / 2, at least 1)
     */
    explicit ThreadPool(std::size_t num_threads = 0)
        : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /** \brief Submit a task.
     *
     * \return Future for the task result; exceptions thrown by the task are
     *         delivered through the future.
     * \throws std::runtime_error if the pool is stopping
     */
    template<typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>> {
        using return_type = std::invoke_result_t<std::decay_t<Func>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<Func>(func));
        auto future = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("Thread pool is stopped");
            }
            tasks_.emplace_back([task] { (*task)(); });
        }

        cv_.notify_one();
        return future;
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t {
        return workers_.size();
    }

private:
    auto worker_loop() -> void {
        #if defined(__linux__)
          pthread_setname_np(pthread_self(), "verdict-worker");
        #endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_;
};

/** \brief Futures of one fan-out; waits for any still pending on destruction.
 *
 * Tasks capturing the submitter's locals by reference stay valid even when
 * the submitting scope unwinds before collecting every result. Call reserve()
 * before submitting so add() never allocates after a task is queued.
 */
template<typename T>
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup() { wait(); }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    auto reserve(std::size_t n) -> void { futures_.reserve(n); }
    auto add(std::future<T> future) -> void { futures_.push_back(std::move(future)); }

    /** \brief Block until every task not yet collected has finished. */
    auto wait() -> void {
        for (auto& f : futures_) {
            if (f.valid()) {
                f.wait();
            }
        }
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return futures_.size(); }
    auto operator[](std::size_t i) -> std::future<T>& { return futures_[i]; }

private:
    std::vector<std::future<T>> futures_;
};

} // namespace verdict::core
