#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace netwake::discovery
{
    // Fixed set of worker threads draining a job queue. At most WorkerCount() jobs
    // run at once. Stop() lets queued jobs finish, then joins.
    class WorkerPool
    {
    private:
        using Job = std::shared_ptr<std::packaged_task<void()>>;

        std::vector<std::thread> workers_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::queue<Job> job_queue_;
        std::atomic<bool> running_;

        void ProcessLoop();

    public:
        explicit WorkerPool(size_t workerCount);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        std::future<void> Submit(std::function<void()> job);
        void Stop();

        size_t WorkerCount() const { return workers_.size(); }
    };
}
