#include "timer.hpp"

#include <glog/logging.h>

#include "executer.hpp"

namespace synapse::utils
{
Timer::Timer(std::shared_ptr<Executer> executer)
    : executer_ {std::move(executer)}
    , period_ {}
    , stop_requested_ {false}
{}

Timer::~Timer()
{
    if (is_running())
    {
        stop();
    }
}

bool Timer::start(Period period, Callback &&callback)
{
    std::lock_guard lock {mutex_};

    if (completion_token_)
    {
        LOG(WARNING) << "Timer already running";
        return false;
    }

    period_           = period;
    callback_         = std::move(callback);
    stop_requested_   = false;
    completion_token_ = executer_->add_job(
        [this](const CompletionToken &completion_token) { loop(completion_token); });

    return true;
}

bool Timer::stop()
{
    CompletionToken completion_token;
    {
        std::lock_guard lock {mutex_};

        if (!completion_token_)
        {
            LOG(WARNING) << "Timer not running";
            return false;
        }

        completion_token = *completion_token_;
        completion_token_.reset();
        stop_requested_ = true;
        completion_token.cancel();
    }
    cv_stop_.notify_all();

    completion_token.wait_for_completion();
    return true;
}

bool Timer::is_running() const
{
    std::lock_guard lock {mutex_};
    return completion_token_.has_value();
}

void Timer::loop(const CompletionToken &completion_token)
{
    std::unique_lock lock {mutex_};
    for (;;)
    {
        bool stopped = cv_stop_.wait_for(
            lock, period_, [&] { return stop_requested_ || completion_token.is_cancelled(); });
        if (stopped)
        {
            break;
        }

        auto callback = callback_;
        lock.unlock();
        callback();
        lock.lock();
    }
}
}  // namespace synapse::utils
