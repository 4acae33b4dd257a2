// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/thread/thread.hpp>

namespace strata {

//! \brief Fixed-size pool of worker threads draining a FIFO task queue
//! \details Destroying the pool runs every task already submitted before joining the workers
class ThreadPool {
  public:
    //! \param thread_count number of workers, at least one is always started
    //! \param stack_size stack size of each worker, zero for the OS default
    explicit ThreadPool(unsigned thread_count = std::thread::hardware_concurrency(), size_t stack_size = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    unsigned get_thread_count() const { return static_cast<unsigned>(workers_.size()); }

    //! Number of tasks queued or running
    size_t get_tasks_total() const;

    //! \brief Queues a callable and returns a future holding its result or the exception it threw
    template <typename F, typename R = std::invoke_result_t<std::decay_t<F>>>
    [[nodiscard]] std::future<R> submit(F&& task) {
        // std::function needs a copyable target
        auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
        std::future<R> result = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return result;
    }

    //! \brief Blocks until the queue is drained and no task is running
    void wait_for_tasks();

  private:
    void enqueue(std::function<void()> task);
    void run_worker();

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> queue_;
    size_t pending_{0};
    bool stopping_{false};
    std::vector<boost::thread> workers_;
};

}  // namespace strata
