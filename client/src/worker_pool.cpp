#include "chunkwise/client/worker_pool.hpp"

#include <stdexcept>
#include <utility>

namespace chunkwise::client
{

    WorkerPool::WorkerPool(std::size_t threads, CancellationToken token) : token_(std::move(token))
    {
        if (threads == 0)
        {
            threads = 1;
        }
        workers_.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i)
        {
            workers_.emplace_back([this]
                                  { worker_loop(); });
        }
    }

    WorkerPool::~WorkerPool()
    {
        shutdown();
    }

    void WorkerPool::submit(std::function<void()> task)
    {
        {
            std::lock_guard lock(mutex_);
            if (stop_)
            {
                throw std::runtime_error("WorkerPool is stopped");
            }
            tasks_.push(std::move(task));
        }
        task_cv_.notify_one();
    }

    void WorkerPool::wait_idle()
    {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this]
                      { return tasks_.empty() && active_ == 0; });
        if (first_error_)
        {
            auto error = std::exchange(first_error_, nullptr);
            std::rethrow_exception(error);
        }
    }

    void WorkerPool::shutdown()
    {
        {
            std::lock_guard lock(mutex_);
            stop_ = true;
        }
        task_cv_.notify_all();
        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void WorkerPool::worker_loop()
    {
        for (;;)
        {
            std::function<void()> task;
            {
                std::unique_lock lock(mutex_);
                task_cv_.wait(lock, [this]
                              { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty())
                {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
                ++active_;
            }

            if (!token_.is_cancelled())
            {
                try
                {
                    task();
                }
                catch (...)
                {
                    std::lock_guard lock(mutex_);
                    if (!first_error_)
                    {
                        first_error_ = std::current_exception();
                    }
                }
            }

            {
                std::lock_guard lock(mutex_);
                --active_;
                if (tasks_.empty() && active_ == 0)
                {
                    idle_cv_.notify_all();
                }
            }
        }
    }

} // namespace chunkwise::client
