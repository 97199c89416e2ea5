#include "commandinterpreter.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <vector>

#include "attestcommand.hpp"
#include "createshardcommand.hpp"
#include "downloadcommand.hpp"
#include "generatelinkcommand.hpp"
#include "keygencommand.hpp"
#include "listseedscommand.hpp"
#include "signcommand.hpp"
#include "verifycommand.hpp"

namespace synapsecli
{
namespace
{
constexpr char const *create_shard_command_name  = "create-shard";
constexpr char const *generate_link_command_name = "generate-link";
constexpr char const *download_command_name      = "download";
constexpr char const *verify_command_name        = "verify";
constexpr char const *list_seeds_command_name    = "list-seeds";
constexpr char const *keygen_command_name        = "keygen";
constexpr char const *sign_command_name          = "sign";
constexpr char const *attest_command_name        = "attest";

// Accepted by every command, consumed before interpretation
constexpr char const *data_dir_option = "data-dir";

std::vector<std::string> split_list(const std::string &str)
{
    std::vector<std::string> items;
    std::istringstream       ss {str};
    std::string              item;
    while (std::getline(ss, item, ','))
    {
        auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos)
        {
            continue;
        }
        auto last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

template<typename T>
bool parse_number(const std::string &str, T &out)
{
    std::istringstream ss {str};
    T                  value;
    if (str.empty() || str.front() == '-' || !(ss >> value) || !ss.eof())
    {
        return false;
    }
    out = value;
    return true;
}

bool check_options(const Command &command, const std::set<std::string> &allowed,
    const std::set<std::string> &required, const std::string &usage, std::string &err)
{
    if (!command.args.empty())
    {
        err = "Unexpected argument " + command.args.front() + ". Usage: " + usage;
        return false;
    }
    for (const auto &[name, value] : command.options)
    {
        if (name != data_dir_option && allowed.count(name) == 0 && required.count(name) == 0)
        {
            err = "Unknown option --" + name + ". Usage: " + usage;
            return false;
        }
    }
    for (const auto &name : required)
    {
        auto value = command.option(name);
        if (!value || value->empty())
        {
            err = "Missing --" + name + ". Usage: " + usage;
            return false;
        }
    }
    return true;
}

const char *create_shard_usage()
{
    return "create-shard --source {file} --name {display name} [--tags {a,b}] [--model {name}] "
           "[--dimensions {n}] [--count {n}]";
}
}  // namespace

std::unique_ptr<ExecutableCommand> CommandInterpreter::interpret(
    const Command &command, std::string &err) const
{
    if (!command)
    {
        err = "Invalid command object";
        return nullptr;
    }

    if (command.cmd == create_shard_command_name)
    {
        if (!check_options(command, {"tags", "model", "dimensions", "count"}, {"source", "name"},
                create_shard_usage(), err))
        {
            return nullptr;
        }

        synapse::ShardOptions options;
        options.source_path  = *command.option("source");
        options.display_name = *command.option("name");
        if (auto tags = command.option("tags"))
        {
            options.tags = split_list(*tags);
        }
        if (auto model = command.option("model"); model && !model->empty())
        {
            options.embedding_model = *model;
        }
        if (auto dimensions = command.option("dimensions"))
        {
            if (!parse_number(*dimensions, options.dimensions) || options.dimensions == 0)
            {
                err = "Invalid dimensions " + *dimensions;
                return nullptr;
            }
        }
        if (auto count = command.option("count"))
        {
            if (!parse_number(*count, options.entry_count))
            {
                err = "Invalid count " + *count;
                return nullptr;
            }
        }
        return std::make_unique<CreateShardCommand>(std::move(options));
    }
    else if (command.cmd == generate_link_command_name)
    {
        if (!check_options(command, {"trackers"}, {"shard"},
                "generate-link --shard {file} [--trackers {url,url}]", err))
        {
            return nullptr;
        }
        std::vector<std::string> trackers;
        if (auto list = command.option("trackers"))
        {
            trackers = split_list(*list);
        }
        return std::make_unique<GenerateLinkCommand>(*command.option("shard"), std::move(trackers));
    }
    else if (command.cmd == download_command_name)
    {
        if (!check_options(
                command, {"output"}, {"link"}, "download --link {uri} [--output {dir}]", err))
        {
            return nullptr;
        }
        return std::make_unique<DownloadCommand>(
            *command.option("link"), command.option("output").value_or(""), std::cerr);
    }
    else if (command.cmd == verify_command_name)
    {
        if (!check_options(command, {}, {"shard"}, "verify --shard {file}", err))
        {
            return nullptr;
        }
        return std::make_unique<VerifyCommand>(*command.option("shard"));
    }
    else if (command.cmd == list_seeds_command_name)
    {
        if (!check_options(command, {}, {}, "list-seeds", err))
        {
            return nullptr;
        }
        return std::make_unique<ListSeedsCommand>();
    }
    else if (command.cmd == keygen_command_name)
    {
        if (!check_options(command, {"force"}, {}, "keygen [--force]", err))
        {
            return nullptr;
        }
        return std::make_unique<KeygenCommand>(command.has_option("force"));
    }
    else if (command.cmd == sign_command_name)
    {
        if (!check_options(command, {}, {"shard"}, "sign --shard {file}", err))
        {
            return nullptr;
        }
        return std::make_unique<SignCommand>(*command.option("shard"));
    }
    else if (command.cmd == attest_command_name)
    {
        if (!check_options(command, {"feedback"}, {"shard", "rating"},
                "attest --shard {file} --rating {0..1} [--feedback {text}]", err))
        {
            return nullptr;
        }
        double rating = 0;
        if (!parse_number(*command.option("rating"), rating) || rating > 1)
        {
            err = "Rating must be a number between 0 and 1";
            return nullptr;
        }
        return std::make_unique<AttestCommand>(
            *command.option("shard"), rating, command.option("feedback").value_or(""));
    }
    else
    {
        err = "Unknown command " + command.cmd;
        return nullptr;
    }
}

std::string CommandInterpreter::usage()
{
    std::ostringstream ss;
    ss << "Usage: synapsecli [--data-dir {dir}] {command} [options]\n"
       << "Commands:\n"
       << "  " << create_shard_usage() << '\n'
       << "  generate-link --shard {file} [--trackers {url,url}]\n"
       << "  download --link {uri} [--output {dir}]\n"
       << "  verify --shard {file}\n"
       << "  list-seeds\n"
       << "  keygen [--force]\n"
       << "  sign --shard {file}\n"
       << "  attest --shard {file} --rating {0..1} [--feedback {text}]\n";
    return ss.str();
}
}  // namespace synapsecli
