#ifndef SYNAPSECLI_LISTSEEDSCOMMAND_HPP_
#define SYNAPSECLI_LISTSEEDSCOMMAND_HPP_

#include "executablecommand.hpp"

namespace synapsecli
{
class ListSeedsCommand : public ExecutableCommand
{
public:
    [[nodiscard]] bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const override;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_LISTSEEDSCOMMAND_HPP_
