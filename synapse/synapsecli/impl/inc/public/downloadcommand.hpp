#ifndef SYNAPSECLI_DOWNLOADCOMMAND_HPP_
#define SYNAPSECLI_DOWNLOADCOMMAND_HPP_

#include <ostream>
#include <string>

#include "executablecommand.hpp"

namespace synapsecli
{
class DownloadCommand : public ExecutableCommand
{
public:
    DownloadCommand(std::string link_uri, std::string output_dir, std::ostream &progress_stream);
    [[nodiscard]] bool execute(synapse::SynapseNode &node, nlohmann::json &result,
        synapse::model::Error &error) const override;

private:
    std::string   link_uri_;
    std::string   output_dir_;
    std::ostream &progress_stream_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_DOWNLOADCOMMAND_HPP_
