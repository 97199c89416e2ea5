#include "listseedscommand.hpp"

#include "jsonformat.hpp"
#include "synapsenode.hpp"

namespace synapsecli
{
bool ListSeedsCommand::execute(
    synapse::SynapseNode &node, nlohmann::json &result, synapse::model::Error & /*error*/) const
{
    auto seeds = nlohmann::json::array();
    for (const auto &status : node.list_sessions())
    {
        if (status.status == synapse::transfer::SessionStatus::Status::SEEDING)
        {
            seeds.push_back(to_json(status));
        }
    }

    result["count"]      = seeds.size();
    result["seeds"]      = std::move(seeds);
    result["statistics"] = to_json(node.statistics());
    return true;
}
}  // namespace synapsecli
