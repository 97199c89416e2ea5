#ifndef SYNAPSE_UTILS_DEFER_HPP_
#define SYNAPSE_UTILS_DEFER_HPP_

#include <utility>

namespace synapse::utils
{
/*
 * Runs the wrapped callable when the enclosing scope is left. Used mostly for releasing
 * OpenSSL handles on every return path.
 */
template<typename Callable>
class ScopeExit
{
public:
    explicit ScopeExit(Callable &&callable)
        : callable_ {std::forward<Callable>(callable)}
        , armed_ {true}
    {}

    ScopeExit(ScopeExit &&other) noexcept
        : callable_ {std::move(other.callable_)}
        , armed_ {other.armed_}
    {
        other.armed_ = false;
    }

    ScopeExit(const ScopeExit &) = delete;
    ScopeExit &operator=(const ScopeExit &) = delete;
    ScopeExit &operator=(ScopeExit &&) = delete;

    ~ScopeExit()
    {
        if (armed_)
        {
            callable_();
        }
    }

    void dismiss()
    {
        armed_ = false;
    }

private:
    Callable callable_;
    bool     armed_;
};

template<typename Callable>
ScopeExit<Callable> make_scope_exit(Callable &&callable)
{
    return ScopeExit<Callable>(std::forward<Callable>(callable));
}
}  // namespace synapse::utils

#ifdef __COUNTER__
#define SYNAPSE_DEFER_ID __COUNTER__
#else
#define SYNAPSE_DEFER_ID __LINE__
#endif

#define SYNAPSE_DEFER_CONCAT_IMPL(a, b) a##b
#define SYNAPSE_DEFER_CONCAT(a, b)      SYNAPSE_DEFER_CONCAT_IMPL(a, b)
#define DEFER(...)                                                     \
    auto SYNAPSE_DEFER_CONCAT(scope_exit_, SYNAPSE_DEFER_ID) =        \
        ::synapse::utils::make_scope_exit([&] { __VA_ARGS__; })

#endif  // SYNAPSE_UTILS_DEFER_HPP_
