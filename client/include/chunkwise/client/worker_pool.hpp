#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "chunkwise/client/cancellation.hpp"

namespace chunkwise::client
{

    /**
     * Fixed set of threads draining a FIFO task queue.
     *
     * Once the token is cancelled, queued tasks are discarded without running;
     * tasks already running are expected to observe the token themselves.
     */
    class WorkerPool
    {
    public:
        WorkerPool(std::size_t threads, CancellationToken token);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        void submit(std::function<void()> task);

        /// Blocks until the queue is empty and no task runs. Rethrows the first exception a task threw.
        void wait_idle();

        void shutdown();

        std::size_t size() const { return workers_.size(); }

    private:
        void worker_loop();

        CancellationToken token_;
        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable task_cv_;
        std::condition_variable idle_cv_;
        std::size_t active_{0};
        bool stop_{false};
        std::exception_ptr first_error_;
    };

} // namespace chunkwise::client
