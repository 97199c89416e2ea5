#include "verifycommand.hpp"

#include <utility>

#include "jsonformat.hpp"
#include "synapsenode.hpp"

namespace synapsecli
{
VerifyCommand::VerifyCommand(std::string shard_path)
    : shard_path_ {std::move(shard_path)}
{}

bool VerifyCommand::execute(
    synapse::SynapseNode &node, nlohmann::json &result, synapse::model::Error &error) const
{
    synapse::model::Shard shard;
    if (!node.load_shard(shard_path_, shard, error))
    {
        return false;
    }
    result["shard"] = to_json(shard);

    synapse::model::Error first_error;
    auto check = [&](const char *name, bool passed, const synapse::model::Error &check_error) {
        result["checks"][name] = passed;
        if (!passed)
        {
            if (!first_error)
            {
                first_error = check_error;
            }
            result["failures"][name] = check_error.message;
        }
    };

    synapse::model::Error integrity_error;
    check("integrity",
        node.verify_file_integrity(shard.file_path, shard.content_hash, integrity_error),
        integrity_error);

    synapse::model::Error signature_error;
    check("signature", node.verify_signature(shard, signature_error), signature_error);

    synapse::model::Error reputation_error;
    check("reputation", node.verify_reputation(shard, reputation_error), reputation_error);

    if (first_error)
    {
        error = first_error;
        return false;
    }
    return true;
}
}  // namespace synapsecli
