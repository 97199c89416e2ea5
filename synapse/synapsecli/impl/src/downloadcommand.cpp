#include "downloadcommand.hpp"

#include <utility>

#include <glog/logging.h>

#include "jsonformat.hpp"
#include "synapsenode.hpp"
#include "transferprogressprinter.hpp"

namespace synapsecli
{
namespace
{
constexpr int transfer_progress_print_timeout_ms = 1000;
}  // namespace

DownloadCommand::DownloadCommand(
    std::string link_uri, std::string output_dir, std::ostream &progress_stream)
    : link_uri_ {std::move(link_uri)}
    , output_dir_ {std::move(output_dir)}
    , progress_stream_ {progress_stream}
{}

bool DownloadCommand::execute(
    synapse::SynapseNode &node, nlohmann::json &result, synapse::model::Error &error) const
{
    synapse::model::Link link;
    if (!node.decode_link(link_uri_, link, error))
    {
        return false;
    }

    LOG(INFO) << "Downloading " << link.display_name << " (" << link.content_hash << ") from "
              << link.trackers.size() << " trackers";

    TransferProgressPrinter progress_printer {
        progress_stream_, link.file_size, transfer_progress_print_timeout_ms};
    auto file_path = node.request(
        link, output_dir_, [&](double percentage) { progress_printer.on_progress(percentage); },
        error);
    if (!file_path)
    {
        return false;
    }

    result["file_path"] = *file_path;
    result["link"]      = to_json(link);
    if (auto status = node.get_status(link.content_hash))
    {
        result["session"] = to_json(*status);
    }
    result["message"] = "Downloaded: " + link.display_name + " (simulated)";
    return true;
}
}  // namespace synapsecli
