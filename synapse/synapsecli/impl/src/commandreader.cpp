#include "commandreader.hpp"

#include <utility>

namespace synapsecli
{
namespace
{
constexpr char const *option_prefix = "--";

bool is_option(const std::string &arg)
{
    return arg.rfind(option_prefix, 0) == 0;
}
}  // namespace

CommandReader::CommandReader(int argc, const char *const *argv)
    : flags_ {"force"}
{
    for (int i = 1; i < argc; ++i)
    {
        arguments_.emplace_back(argv[i]);
    }
}

CommandReader::CommandReader(std::vector<std::string> arguments, std::set<std::string> flags)
    : arguments_ {std::move(arguments)}
    , flags_ {std::move(flags)}
{}

Command CommandReader::read_command(std::string &err) const
{
    Command command;

    for (size_t i = 0; i != arguments_.size(); ++i)
    {
        const std::string &arg = arguments_[i];
        if (!is_option(arg))
        {
            if (command.cmd.empty())
            {
                command.cmd = arg;
            }
            else
            {
                command.args.push_back(arg);
            }
            continue;
        }

        std::string name = arg.substr(2);
        if (name.empty())
        {
            err = "Empty option name";
            return {};
        }
        if (command.has_option(name))
        {
            err = "Option --" + name + " given more than once";
            return {};
        }

        std::string value;
        bool        takes_value = flags_.count(name) == 0;
        if (takes_value && i + 1 < arguments_.size() && !is_option(arguments_[i + 1]))
        {
            value = arguments_[++i];
        }
        command.options.emplace(std::move(name), std::move(value));
    }

    if (!command)
    {
        err = "No command given";
        return {};
    }

    return command;
}
}  // namespace synapsecli
