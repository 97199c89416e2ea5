#ifndef SYNAPSECLI_SIGNCOMMAND_HPP_
#define SYNAPSECLI_SIGNCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace synapsecli
{
class SignCommand : public ExecutableCommand
{
public:
    explicit SignCommand(std::string shard_path);
    [[nodiscard]] bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const override;

private:
    std::string shard_path_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_SIGNCOMMAND_HPP_
