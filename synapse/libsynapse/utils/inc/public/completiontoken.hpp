#ifndef SYNAPSE_UTILS_COMPLETIONTOKEN_HPP_
#define SYNAPSE_UTILS_COMPLETIONTOKEN_HPP_

#include <chrono>
#include <memory>

namespace synapse::utils
{
/*
 * Shared handle between the producer of a job and the code executing it. Copies refer to the
 * same state. The executing side polls is_cancelled() at its check-points and calls complete()
 * exactly once when done; complete() is idempotent.
 */
class CompletionToken
{
public:
    CompletionToken();
    CompletionToken(const CompletionToken &other) = default;
    CompletionToken &operator=(const CompletionToken &rhs) = default;
    CompletionToken(CompletionToken &&other) noexcept;
    CompletionToken &operator=(CompletionToken &&rhs) noexcept;

    void               cancel() const;
    [[nodiscard]] bool is_cancelled() const;
    void               complete() const;
    [[nodiscard]] bool is_completed() const;
    void               wait_for_completion() const;
    [[nodiscard]] bool wait_for_completion(std::chrono::milliseconds timeout) const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;

    friend bool operator==(const CompletionToken &, const CompletionToken &);
};
}  // namespace synapse::utils

#endif  // SYNAPSE_UTILS_COMPLETIONTOKEN_HPP_
