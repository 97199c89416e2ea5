#ifndef SYNAPSECLI_COMMANDREADER_HPP_
#define SYNAPSECLI_COMMANDREADER_HPP_

#include <set>
#include <string>
#include <vector>

#include "command.hpp"

namespace synapsecli
{
/*
 * Splits the program arguments into a command. Everything of the form "--name" is an option; it
 * takes the following argument as its value unless the name is a known flag or the next argument
 * is itself an option.
 */
class CommandReader
{
public:
    CommandReader(int argc, const char *const *argv);
    CommandReader(std::vector<std::string> arguments, std::set<std::string> flags);

    [[nodiscard]] Command read_command(std::string &err) const;

private:
    std::vector<std::string> arguments_;
    std::set<std::string>    flags_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_COMMANDREADER_HPP_
