#ifndef SYNAPSE_TRUST_ATTESTATION_HPP_
#define SYNAPSE_TRUST_ATTESTATION_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace synapse::crypto
{
// Forward declarations
class Base64Encoder;
}  // namespace synapse::crypto

namespace synapse::trust
{
// Signed quality rating of a shard, consumed by an external trust tracking system
struct Attestation
{
    std::string          shard_hash;
    std::string          provider_agent_id;
    std::string          consumer_agent_id;
    double               rating = 0;
    std::string          feedback;
    std::string          timestamp;
    std::vector<uint8_t> signature;

    // Compact JSON of every field but the signature, keys in lexicographic order
    [[nodiscard]] std::string    signed_payload() const;
    [[nodiscard]] nlohmann::json to_json(const crypto::Base64Encoder &b64) const;
};
}  // namespace synapse::trust

#endif  // SYNAPSE_TRUST_ATTESTATION_HPP_
