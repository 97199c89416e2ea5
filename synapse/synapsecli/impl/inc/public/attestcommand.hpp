#ifndef SYNAPSECLI_ATTESTCOMMAND_HPP_
#define SYNAPSECLI_ATTESTCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace synapsecli
{
class AttestCommand : public ExecutableCommand
{
public:
    AttestCommand(std::string shard_path, double rating, std::string feedback);
    [[nodiscard]] bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const override;

    [[nodiscard]] double rating() const;

private:
    std::string shard_path_;
    double      rating_;
    std::string feedback_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_ATTESTCOMMAND_HPP_
