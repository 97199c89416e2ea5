#ifndef SYNAPSECLI_COMMANDINTERPRETER_HPP_
#define SYNAPSECLI_COMMANDINTERPRETER_HPP_

#include <memory>
#include <string>

#include "command.hpp"
#include "executablecommand.hpp"

namespace synapsecli
{
class CommandInterpreter
{
public:
    [[nodiscard]] std::unique_ptr<ExecutableCommand> interpret(
        const Command &command, std::string &err) const;
    [[nodiscard]] static std::string usage();
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_COMMANDINTERPRETER_HPP_
