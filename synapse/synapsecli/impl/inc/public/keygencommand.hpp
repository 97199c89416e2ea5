#ifndef SYNAPSECLI_KEYGENCOMMAND_HPP_
#define SYNAPSECLI_KEYGENCOMMAND_HPP_

#include "executablecommand.hpp"

namespace synapsecli
{
class KeygenCommand : public ExecutableCommand
{
public:
    explicit KeygenCommand(bool overwrite);
    [[nodiscard]] bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const override;

    [[nodiscard]] bool overwrite() const;

private:
    bool overwrite_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_KEYGENCOMMAND_HPP_
