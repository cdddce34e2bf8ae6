#ifndef PARCEL_BRIDGE_THREAD_POOL_HPP
#define PARCEL_BRIDGE_THREAD_POOL_HPP

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {
    // Fixed set of workers draining one FIFO queue. Destruction drains the queue before joining.
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        void enqueue(std::function<void()> task);

        // Blocks until the queue is empty and no task is running, then rethrows the first exception a task
        // raised since the previous wait_all().
        void wait_all();

        [[nodiscard]] size_t thread_count() const { return workers_.size(); }

       private:
        void work();

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable task_ready_;
        std::condition_variable idle_;
        size_t running_ = 0;
        bool stopping_ = false;
        std::exception_ptr first_error_;
    };
}  // namespace concurrency

#endif
