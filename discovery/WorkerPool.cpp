#include "WorkerPool.hpp"

namespace netwake::discovery
{
    WorkerPool::WorkerPool(size_t workerCount) : running_(true)
    {
        if (workerCount == 0)
            workerCount = 1;

        workers_.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i)
            workers_.emplace_back(&WorkerPool::ProcessLoop, this);
    }

    WorkerPool::~WorkerPool()
    {
        Stop();
    }

    std::future<void> WorkerPool::Submit(std::function<void()> job)
    {
        auto task = std::make_shared<std::packaged_task<void()>>(std::move(job));
        std::future<void> done = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            job_queue_.push(std::move(task));
        }
        queue_cv_.notify_one();
        return done;
    }

    void WorkerPool::Stop()
    {
        running_ = false;
        queue_cv_.notify_all();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
                worker.join();
        }
    }

    void WorkerPool::ProcessLoop()
    {
        while (true)
        {
            Job current_job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                queue_cv_.wait(lock, [this]
                               { return !job_queue_.empty() || !running_; });

                if (!running_ && job_queue_.empty())
                    break;

                current_job = std::move(job_queue_.front());
                job_queue_.pop();
            }

            // packaged_task stores any exception in its future.
            (*current_job)();
        }
    }
}
