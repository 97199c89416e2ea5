#ifndef SYNAPSE_TRUST_IDENTITY_HPP_
#define SYNAPSE_TRUST_IDENTITY_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace synapse::trust
{
class Identity
{
public:
    virtual ~Identity() = default;

    [[nodiscard]] virtual std::string agent_id() const = 0;

    // PEM encoded
    [[nodiscard]] virtual std::string public_key() const = 0;

    // Empty on failure
    [[nodiscard]] virtual std::vector<uint8_t> sign(const std::string &payload) const = 0;
};
}  // namespace synapse::trust

#endif  // SYNAPSE_TRUST_IDENTITY_HPP_
