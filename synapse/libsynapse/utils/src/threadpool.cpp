#include "threadpool.hpp"

#include <algorithm>

namespace synapse::utils
{
ThreadPool::ThreadPool(size_t thread_count)
    : running_ {true}
{
    thread_count = std::max<size_t>(thread_count, 1);
    threads_.reserve(thread_count);
    for (size_t i = 0; i != thread_count; ++i)
    {
        threads_.emplace_back(&ThreadPool::thread_routine, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lock {mutex_};
        running_ = false;
    }

    cv_jobs_available_.notify_all();
    for (auto &th : threads_)
    {
        th.join();
    }

    // Jobs that never got to run are reported as cancelled so nobody waits on them forever
    while (!jobs_.empty())
    {
        const auto &completion_token = jobs_.front().second;
        completion_token.cancel();
        completion_token.complete();
        jobs_.pop();
    }
}

CompletionToken ThreadPool::add_job(Job &&job)
{
    CompletionToken completion_token;

    {
        std::lock_guard lock {mutex_};
        jobs_.emplace(std::move(job), completion_token);
    }
    cv_jobs_available_.notify_one();

    return completion_token;
}

size_t ThreadPool::thread_count() const
{
    return threads_.size();
}

size_t ThreadPool::default_thread_count()
{
    return std::max<size_t>(std::thread::hardware_concurrency(), 2);
}

void ThreadPool::thread_routine()
{
    for (;;)
    {
        std::unique_lock lock {mutex_};
        cv_jobs_available_.wait(lock, [this] { return !jobs_.empty() || !running_; });

        if (!running_)
        {
            break;
        }

        auto [job, completion_token] = std::move(jobs_.front());
        jobs_.pop();

        lock.unlock();

        if (!completion_token.is_cancelled())
        {
            job(completion_token);
        }
        completion_token.complete();
    }
}
}  // namespace synapse::utils
