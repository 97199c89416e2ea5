#ifndef SYNAPSE_UTILS_EXECUTER_HPP_
#define SYNAPSE_UTILS_EXECUTER_HPP_

#include <functional>

#include "completiontoken.hpp"

namespace synapse::utils
{
class Executer
{
public:
    using Job = std::function<void(const CompletionToken &)>;

    virtual ~Executer()                         = default;
    virtual CompletionToken add_job(Job &&job) = 0;
};
}  // namespace synapse::utils

#endif  // SYNAPSE_UTILS_EXECUTER_HPP_
