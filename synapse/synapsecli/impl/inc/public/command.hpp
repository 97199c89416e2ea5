#ifndef SYNAPSECLI_COMMAND_HPP_
#define SYNAPSECLI_COMMAND_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace synapsecli
{
// One invocation of the command line utility: "cmd --option value --flag positional..."
struct Command
{
    [[nodiscard]] bool valid() const
    {
        return !cmd.empty();
    }

    explicit operator bool() const
    {
        return valid();
    }

    [[nodiscard]] bool has_option(const std::string &name) const
    {
        return options.count(name) != 0;
    }

    [[nodiscard]] std::optional<std::string> option(const std::string &name) const
    {
        auto it = options.find(name);
        if (it == options.cend())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string                        cmd;
    std::vector<std::string>           args;
    std::map<std::string, std::string> options;  // flags are stored with an empty value
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_COMMAND_HPP_
