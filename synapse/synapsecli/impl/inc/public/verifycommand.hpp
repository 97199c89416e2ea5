#ifndef SYNAPSECLI_VERIFYCOMMAND_HPP_
#define SYNAPSECLI_VERIFYCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace synapsecli
{
/*
 * Runs the trust checks on a local shard and reports each of them. The command fails on the first
 * failed check in the order integrity, signature, reputation; the report is still filled.
 */
class VerifyCommand : public ExecutableCommand
{
public:
    explicit VerifyCommand(std::string shard_path);
    [[nodiscard]] bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const override;

private:
    std::string shard_path_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_VERIFYCOMMAND_HPP_
