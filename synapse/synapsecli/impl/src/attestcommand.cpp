#include "attestcommand.hpp"

#include <utility>

#include "synapsenode.hpp"

namespace synapsecli
{
AttestCommand::AttestCommand(std::string shard_path, double rating, std::string feedback)
    : shard_path_ {std::move(shard_path)}
    , rating_ {rating}
    , feedback_ {std::move(feedback)}
{}

bool AttestCommand::execute(
    synapse::SynapseNode &node, nlohmann::json &result, synapse::model::Error &error) const
{
    synapse::model::Shard shard;
    if (!node.load_shard(shard_path_, shard, error))
    {
        return false;
    }

    nlohmann::json attestation;
    if (!node.attest(shard, rating_, feedback_, attestation, error))
    {
        return false;
    }

    result["attestation"] = std::move(attestation);
    return true;
}

double AttestCommand::rating() const
{
    return rating_;
}
}  // namespace synapsecli
