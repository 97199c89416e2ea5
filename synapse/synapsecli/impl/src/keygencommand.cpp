#include "keygencommand.hpp"

#include <string>

#include "synapsenode.hpp"

namespace synapsecli
{
KeygenCommand::KeygenCommand(bool overwrite)
    : overwrite_ {overwrite}
{}

bool KeygenCommand::execute(
    synapse::SynapseNode &node, nlohmann::json &result, synapse::model::Error &error) const
{
    std::string agent_id;
    if (!node.generate_identity(overwrite_, agent_id, error))
    {
        return false;
    }

    result["agent_id"] = agent_id;
    result["message"]  = "Generated identity " + agent_id;
    return true;
}

bool KeygenCommand::overwrite() const
{
    return overwrite_;
}
}  // namespace synapsecli
