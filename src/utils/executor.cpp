#include "executor.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "thread_pool.hpp"

namespace concurrency {

    namespace {
        std::mutex scheduler_mutex;
        bool scheduler_selected = false;
        SchedulerOptions selected_options;
    }  // namespace

    ThreadPerTaskExecutor::~ThreadPerTaskExecutor() { wait_all(); }

    void ThreadPerTaskExecutor::enqueue(std::function<void()> next_task) {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        threads_.emplace_back(std::move(next_task));
    }

    void ThreadPerTaskExecutor::wait_all() {
        std::vector<std::thread> to_join;
        {
            std::lock_guard<std::mutex> lock(threads_mutex_);
            to_join.swap(threads_);
        }

        for (auto& thread : to_join) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    ExecutorFactory make_executor_factory(const SchedulerOptions& options) {
        if (options.kind_ == SchedulerKind::THREAD_POOL) {
            const size_t configured = options.pool_threads_ != 0 ? options.pool_threads_ : std::max(1U, std::thread::hardware_concurrency());

            return [configured](size_t task_count) -> std::unique_ptr<IExecutor> {
                return std::make_unique<ThreadPool>(std::max<size_t>(1, std::min(configured, task_count)));
            };
        }

        return [](size_t /*task_count*/) -> std::unique_ptr<IExecutor> { return std::make_unique<ThreadPerTaskExecutor>(); };
    }

    bool select_scheduler(const SchedulerOptions& options) {
        std::lock_guard<std::mutex> lock(scheduler_mutex);
        if (scheduler_selected) {
            logging::logger()->debug("Scheduler already selected, ignoring new selection");
            return false;
        }

        selected_options = options;
        scheduler_selected = true;
        logging::logger()->debug("Using {} scheduler", options.kind_ == SchedulerKind::THREAD_POOL ? "thread pool" : "thread-per-task");
        return true;
    }

    ExecutorFactory default_executor_factory() {
        std::lock_guard<std::mutex> lock(scheduler_mutex);
        return make_executor_factory(selected_options);
    }
}  // namespace concurrency
