#include "createshardcommand.hpp"

#include <utility>

#include "jsonformat.hpp"
#include "synapsenode.hpp"

namespace synapsecli
{
CreateShardCommand::CreateShardCommand(synapse::ShardOptions options)
    : options_ {std::move(options)}
{}

bool CreateShardCommand::execute(
    synapse::SynapseNode &node, nlohmann::json &result, synapse::model::Error &error) const
{
    synapse::model::Shard shard;
    if (!node.create_shard(options_, shard, error))
    {
        return false;
    }

    result["shard"]   = to_json(shard);
    result["message"] = "Created memory shard: " + shard.display_name;
    return true;
}

const synapse::ShardOptions &CreateShardCommand::options() const
{
    return options_;
}
}  // namespace synapsecli
