// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "thread_pool.hpp"

namespace strata {

ThreadPool::ThreadPool(unsigned thread_count, size_t stack_size) {
    boost::thread::attributes attrs;
    if (stack_size != 0) {
        attrs.set_stack_size(stack_size);
    }
    const unsigned count{thread_count != 0 ? thread_count : 1};
    workers_.reserve(count);
    for (unsigned i{0}; i < count; ++i) {
        workers_.emplace_back(attrs, [this] { run_worker(); });
    }
}

ThreadPool::~ThreadPool() {
    wait_for_tasks();
    {
        std::scoped_lock lock{mutex_};
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

size_t ThreadPool::get_tasks_total() const {
    std::scoped_lock lock{mutex_};
    return pending_;
}

void ThreadPool::wait_for_tasks() {
    std::unique_lock lock{mutex_};
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::scoped_lock lock{mutex_};
        queue_.push_back(std::move(task));
        ++pending_;
    }
    work_cv_.notify_one();
}

void ThreadPool::run_worker() {
    std::unique_lock lock{mutex_};
    while (true) {
        work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;
        }
        auto task{std::move(queue_.front())};
        queue_.pop_front();

        lock.unlock();
        task();
        lock.lock();

        if (--pending_ == 0) {
            idle_cv_.notify_all();
        }
    }
}

}  // namespace strata
