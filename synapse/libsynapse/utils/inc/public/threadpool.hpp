#ifndef SYNAPSE_UTILS_THREADPOOL_HPP_
#define SYNAPSE_UTILS_THREADPOOL_HPP_

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include "executer.hpp"

namespace synapse::utils
{
class ThreadPool : public Executer
{
public:
    explicit ThreadPool(size_t thread_count = default_thread_count());
    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    ~ThreadPool() override;
    CompletionToken add_job(Job &&job) override;

    [[nodiscard]] size_t thread_count() const;

    static size_t default_thread_count();

private:
    void thread_routine();

    std::vector<std::thread>                    threads_;
    std::queue<std::pair<Job, CompletionToken>> jobs_;
    std::mutex                                  mutex_;
    std::condition_variable                     cv_jobs_available_;
    bool                                        running_;
};
}  // namespace synapse::utils

#endif  // SYNAPSE_UTILS_THREADPOOL_HPP_
