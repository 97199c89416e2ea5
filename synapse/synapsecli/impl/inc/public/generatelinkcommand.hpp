#ifndef SYNAPSECLI_GENERATELINKCOMMAND_HPP_
#define SYNAPSECLI_GENERATELINKCOMMAND_HPP_

#include <string>
#include <vector>

#include "executablecommand.hpp"

namespace synapsecli
{
// Announces a shard and prints its link URI. Without trackers the configured ones are used.
class GenerateLinkCommand : public ExecutableCommand
{
public:
    GenerateLinkCommand(std::string shard_path, std::vector<std::string> trackers);
    [[nodiscard]] bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const override;

    [[nodiscard]] const std::vector<std::string> &trackers() const;

private:
    std::string              shard_path_;
    std::vector<std::string> trackers_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_GENERATELINKCOMMAND_HPP_
