#include "generatelinkcommand.hpp"

#include <utility>

#include "synapsenode.hpp"

namespace synapsecli
{
GenerateLinkCommand::GenerateLinkCommand(std::string shard_path, std::vector<std::string> trackers)
    : shard_path_ {std::move(shard_path)}
    , trackers_ {std::move(trackers)}
{}

bool GenerateLinkCommand::execute(
    synapse::SynapseNode &node, nlohmann::json &result, synapse::model::Error &error) const
{
    synapse::model::Shard shard;
    if (!node.load_shard(shard_path_, shard, error))
    {
        return false;
    }

    auto link = node.announce(shard, trackers_, error);
    if (!link)
    {
        return false;
    }

    result["link"]         = node.encode_link(*link);
    result["content_hash"] = link->content_hash;
    result["display_name"] = link->display_name;
    result["trackers"]     = link->trackers;
    result["message"]      = "Generated link for: " + link->display_name;
    return true;
}

const std::vector<std::string> &GenerateLinkCommand::trackers() const
{
    return trackers_;
}
}  // namespace synapsecli
