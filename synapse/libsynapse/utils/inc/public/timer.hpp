#ifndef SYNAPSE_UTILS_TIMER_HPP_
#define SYNAPSE_UTILS_TIMER_HPP_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "completiontoken.hpp"

namespace synapse::utils
{
// Forward declarations
class Executer;

/*
 * Periodic callback driven by one long running job on the given executer. stop() wakes the job
 * up and blocks until it has left, so the callback never runs after stop() returns.
 */
class Timer
{
public:
    using Period   = std::chrono::milliseconds;
    using Clock    = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    explicit Timer(std::shared_ptr<Executer> executer);
    Timer(const Timer &) = delete;
    Timer &operator=(const Timer &) = delete;
    ~Timer();

    bool               start(Period period, Callback &&callback);
    bool               stop();
    [[nodiscard]] bool is_running() const;

private:
    void loop(const CompletionToken &completion_token);

    const std::shared_ptr<Executer> executer_;
    std::optional<CompletionToken>  completion_token_;
    Period                          period_;
    Callback                        callback_;
    bool                            stop_requested_;
    mutable std::mutex              mutex_;
    std::condition_variable         cv_stop_;
};
}  // namespace synapse::utils

#endif  // SYNAPSE_UTILS_TIMER_HPP_
