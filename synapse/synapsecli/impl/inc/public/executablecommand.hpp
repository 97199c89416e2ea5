#ifndef SYNAPSECLI_EXECUTABLECOMMAND_HPP_
#define SYNAPSECLI_EXECUTABLECOMMAND_HPP_

#include <nlohmann/json.hpp>

#include "error.hpp"

namespace synapse
{
// Forward declarations
class SynapseNode;
}  // namespace synapse

namespace synapsecli
{
class ExecutableCommand
{
public:
    virtual ~ExecutableCommand() = default;

    // Fills the result document on success, the error otherwise
    [[nodiscard]] virtual bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const = 0;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_EXECUTABLECOMMAND_HPP_
