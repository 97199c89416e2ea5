#include "signcommand.hpp"

#include <utility>

#include "jsonformat.hpp"
#include "synapsenode.hpp"

namespace synapsecli
{
SignCommand::SignCommand(std::string shard_path)
    : shard_path_ {std::move(shard_path)}
{}

bool SignCommand::execute(
    synapse::SynapseNode &node, nlohmann::json &result, synapse::model::Error &error) const
{
    synapse::model::Shard shard;
    if (!node.load_shard(shard_path_, shard, error) || !node.sign_shard(shard, error))
    {
        return false;
    }

    result["shard"]   = to_json(shard);
    result["message"] = "Signed " + shard.display_name;
    return true;
}
}  // namespace synapsecli
