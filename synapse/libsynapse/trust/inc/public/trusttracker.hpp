#ifndef SYNAPSE_TRUST_TRUSTTRACKER_HPP_
#define SYNAPSE_TRUST_TRUSTTRACKER_HPP_

#include <string>

namespace synapse::trust
{
class TrustTracker
{
public:
    virtual ~TrustTracker() = default;

    // Score in [0, 1] summarizing the history of the given producer
    [[nodiscard]] virtual double get_trust_score(const std::string &agent_id) const = 0;
};
}  // namespace synapse::trust

#endif  // SYNAPSE_TRUST_TRUSTTRACKER_HPP_
