#ifndef CLUMP_THREAD_POOL_HPP
#define CLUMP_THREAD_POOL_HPP

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "executor.hpp"

namespace concurrency {
    class ThreadPool : public IExecutor {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool() override;
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        void enqueue(std::function<void()> next_task) override;
        void wait_all() override;

        [[nodiscard]] size_t size() const { return threads_.size(); }

       private:
        std::vector<std::thread> threads_;  // reserve
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        bool stop_ = false;
        size_t active_tasks_ = 0;
        std::condition_variable completion_cv_;
    };
}  // namespace concurrency

#endif
