#ifndef SYNAPSECLI_CREATESHARDCOMMAND_HPP_
#define SYNAPSECLI_CREATESHARDCOMMAND_HPP_

#include "executablecommand.hpp"
#include "shardoptions.hpp"

namespace synapsecli
{
class CreateShardCommand : public ExecutableCommand
{
public:
    explicit CreateShardCommand(synapse::ShardOptions options);
    [[nodiscard]] bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const override;

    [[nodiscard]] const synapse::ShardOptions &options() const;

private:
    synapse::ShardOptions options_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_CREATESHARDCOMMAND_HPP_
