#include "completiontoken.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace synapse::utils
{
struct CompletionToken::Impl
{
    std::atomic_bool        cancelled {false};
    bool                    completed {false};
    std::mutex              mutex;
    std::condition_variable cv_completed;
};

CompletionToken::CompletionToken()
    : impl_ {std::make_shared<Impl>()}
{}

CompletionToken::CompletionToken(CompletionToken &&other) noexcept
    : impl_ {other.impl_}
{}

CompletionToken &CompletionToken::operator=(CompletionToken &&rhs) noexcept
{
    impl_ = rhs.impl_;
    return *this;
}

void CompletionToken::cancel() const
{
    impl_->cancelled = true;
}

bool CompletionToken::is_cancelled() const
{
    return impl_->cancelled;
}

void CompletionToken::complete() const
{
    {
        std::lock_guard lock {impl_->mutex};
        impl_->completed = true;
    }
    impl_->cv_completed.notify_all();
}

bool CompletionToken::is_completed() const
{
    std::lock_guard lock {impl_->mutex};
    return impl_->completed;
}

void CompletionToken::wait_for_completion() const
{
    std::unique_lock lock {impl_->mutex};
    impl_->cv_completed.wait(lock, [this] { return impl_->completed; });
}

bool CompletionToken::wait_for_completion(std::chrono::milliseconds timeout) const
{
    std::unique_lock lock {impl_->mutex};
    return impl_->cv_completed.wait_for(lock, timeout, [this] { return impl_->completed; });
}

bool operator==(const CompletionToken &lhs, const CompletionToken &rhs)
{
    return lhs.impl_ == rhs.impl_;
}
}  // namespace synapse::utils
