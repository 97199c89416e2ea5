#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "commandinterpreter.hpp"
#include "commandreader.hpp"
#include "jsonformat.hpp"
#include "simulatedtransferengine.hpp"
#include "synapsenode.hpp"

namespace
{
constexpr char const *config_file_name = "config.json";
constexpr char const *data_dir_option  = "data-dir";
constexpr char const *help_command     = "help";

std::string get_app_data_dir()
{
    const char *home = std::getenv("HOME");
    return std::filesystem::path {home ? home : "."} / ".synapse";
}

nlohmann::json default_configuration()
{
    return {{"listen_port", 6881},
        {"trackers",
            {"udp://tracker.opentrackr.org:1337/announce", "udp://open.tracker.cl:1337/announce"}},
        {"peer_liveness_window", 300}, {"discovery_timeout", 30}, {"announce_timeout", 10},
        {"min_trust_score", 0.6}, {"require_signatures", false}, {"hash_algorithm", "sha256"},
        {"peer_list_file", "peers.txt"}, {"identity_dir", "identity"},
        {"trust_scores_file", "trust_scores.json"}};
}

bool write_file_if_not_exists(const std::string &path, const std::string &content)
{
    if (!std::filesystem::is_regular_file(path))
    {
        // If there is a file which is not regular and with the same name, delete it
        std::error_code ec;
        std::filesystem::remove_all(path, ec);

        std::ofstream fs {path};
        if (!fs)
        {
            return false;
        }
        fs << content;
    }
    return true;
}

int print_result(const nlohmann::json &document)
{
    std::cout << document.dump(2) << '\n';
    return document.at("status") == "success" ? EXIT_SUCCESS : EXIT_FAILURE;
}

int fail(synapse::model::ErrorCode code, const std::string &message)
{
    synapse::model::Error error;
    error.set(code, message);
    return print_result(synapsecli::make_error_document(error));
}
}  // namespace

int main(int argc, char **argv)
{
    google::InitGoogleLogging(argv[0]);

    std::string         err;
    synapsecli::Command cmd = synapsecli::CommandReader {argc, argv}.read_command(err);
    if (!cmd)
    {
        std::cerr << synapsecli::CommandInterpreter::usage();
        return fail(synapse::model::ErrorCode::FORMAT, err);
    }
    if (cmd.cmd == help_command)
    {
        std::cout << synapsecli::CommandInterpreter::usage();
        return EXIT_SUCCESS;
    }

    synapsecli::CommandInterpreter interpreter;
    auto                           exec_cmd = interpreter.interpret(cmd, err);
    if (!exec_cmd)
    {
        return fail(synapse::model::ErrorCode::FORMAT, err);
    }

    std::string app_data_dir = cmd.option(data_dir_option).value_or(get_app_data_dir());
    if (app_data_dir.empty())
    {
        return fail(synapse::model::ErrorCode::FORMAT, "Missing value for --data-dir");
    }

    std::error_code ec;
    std::filesystem::create_directories(app_data_dir, ec);
    if (ec)
    {
        return fail(synapse::model::ErrorCode::IO,
            "Cannot create data directory " + app_data_dir + ": " + ec.message());
    }

    auto config_path = (std::filesystem::path {app_data_dir} / config_file_name).string();
    if (!write_file_if_not_exists(config_path, default_configuration().dump(4)))
    {
        return fail(synapse::model::ErrorCode::IO, "Cannot open " + config_path + " for writing");
    }

    synapse::SynapseNode node {
        app_data_dir, config_file_name, std::make_shared<synapsecli::SimulatedTransferEngine>()};
    LOG(INFO) << "Node " << node.node_id() << " running " << cmd.cmd;

    nlohmann::json        result = nlohmann::json::object();
    synapse::model::Error error;
    bool                  success = exec_cmd->execute(node, result, error);
    node.shutdown();

    if (!success)
    {
        auto document = synapsecli::make_error_document(error);
        if (!result.empty())
        {
            document["details"] = std::move(result);
        }
        return print_result(document);
    }
    return print_result(synapsecli::make_success_document(std::move(result)));
}
