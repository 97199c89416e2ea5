#include "attestation.hpp"

#include "base64encoder.hpp"

namespace synapse::trust
{
namespace
{
nlohmann::json unsigned_fields(const Attestation &a)
{
    // nlohmann::json objects keep their keys sorted
    return {{"shard_hash", a.shard_hash}, {"provider_agent_id", a.provider_agent_id},
        {"consumer_agent_id", a.consumer_agent_id}, {"rating", a.rating},
        {"feedback", a.feedback}, {"timestamp", a.timestamp}};
}
}  // namespace

std::string Attestation::signed_payload() const
{
    return unsigned_fields(*this).dump();
}

nlohmann::json Attestation::to_json(const crypto::Base64Encoder &b64) const
{
    auto json         = unsigned_fields(*this);
    json["signature"] = b64.encode(signature.data(), signature.size());
    return json;
}
}  // namespace synapse::trust
