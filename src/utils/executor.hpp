#ifndef CLUMP_EXECUTOR_HPP
#define CLUMP_EXECUTOR_HPP

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace concurrency {
    // Tasks handed to an executor must not throw.
    class IExecutor {
       public:
        IExecutor() = default;
        virtual ~IExecutor() = default;
        IExecutor(const IExecutor&) = delete;
        IExecutor& operator=(const IExecutor&) = delete;
        IExecutor(IExecutor&&) = delete;
        IExecutor& operator=(IExecutor&&) = delete;

        virtual void enqueue(std::function<void()> next_task) = 0;
        virtual void wait_all() = 0;
    };

    enum class SchedulerKind { THREAD_PER_TASK, THREAD_POOL };

    struct SchedulerOptions {
        SchedulerKind kind_ = SchedulerKind::THREAD_PER_TASK;
        unsigned int pool_threads_ = 0;  // 0 => std::thread::hardware_concurrency()
    };

    // Receives the number of tasks the caller is about to enqueue.
    using ExecutorFactory = std::function<std::unique_ptr<IExecutor>(size_t task_count)>;

    class ThreadPerTaskExecutor : public IExecutor {
       public:
        ThreadPerTaskExecutor() = default;
        ~ThreadPerTaskExecutor() override;
        ThreadPerTaskExecutor(const ThreadPerTaskExecutor&) = delete;
        ThreadPerTaskExecutor& operator=(const ThreadPerTaskExecutor&) = delete;
        ThreadPerTaskExecutor(ThreadPerTaskExecutor&&) = delete;
        ThreadPerTaskExecutor& operator=(ThreadPerTaskExecutor&&) = delete;

        void enqueue(std::function<void()> next_task) override;
        void wait_all() override;

       private:
        std::mutex threads_mutex_;
        std::vector<std::thread> threads_;
    };

    [[nodiscard]] ExecutorFactory make_executor_factory(const SchedulerOptions& options);

    // Installs the process-wide default scheduler. Only the first call has an effect; returns whether it applied.
    bool select_scheduler(const SchedulerOptions& options);

    [[nodiscard]] ExecutorFactory default_executor_factory();
}  // namespace concurrency

#endif
