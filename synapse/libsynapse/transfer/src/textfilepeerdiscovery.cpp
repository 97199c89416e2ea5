#include "textfilepeerdiscovery.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <glog/logging.h>

#include "executer.hpp"

namespace synapse::transfer
{
TextFilePeerDiscovery::TextFilePeerDiscovery(
    std::string file_path, std::shared_ptr<utils::Executer> executer)
    : file_path_ {std::move(file_path)}
    , executer_ {std::move(executer)}
{}

std::future<std::vector<model::Peer>> TextFilePeerDiscovery::discover_peers(
    const model::Link &link)
{
    VLOG(1) << "Looking up peers of " << link.content_hash << " in " << file_path_;
    return load_async();
}

std::future<bool> TextFilePeerDiscovery::announce(
    const model::Link &link, const std::string &tracker)
{
    LOG(INFO) << "Announce of " << link.content_hash << " to " << tracker
              << " skipped, static peer list in use";

    std::promise<bool> promise;
    promise.set_value(true);
    return promise.get_future();
}

std::future<std::vector<model::Peer>> TextFilePeerDiscovery::refresh(
    const std::vector<model::Peer> & /*known_peers*/)
{
    return load_async();
}

std::future<std::vector<model::Peer>> TextFilePeerDiscovery::load_async() const
{
    auto promise = std::make_shared<std::promise<std::vector<model::Peer>>>();

    executer_->add_job([promise, file_path = file_path_](const utils::CompletionToken &) {
        promise->set_value(load(file_path));
    });

    return promise->get_future();
}

std::vector<model::Peer> TextFilePeerDiscovery::load(const std::string &file_path)
{
    std::vector<model::Peer> peers;

    std::ifstream fs {file_path};
    if (!fs)
    {
        LOG(WARNING) << "Peer list " << file_path << " not found";
        return peers;
    }

    auto        now = model::Peer::Clock::now();
    std::string line;
    size_t      line_number = 0;
    while (std::getline(fs, line))
    {
        ++line_number;
        if (line.empty() || line.front() == '#')
        {
            continue;
        }

        std::istringstream ss {line};
        model::Peer        peer;
        unsigned long      port = 0;
        if (!(ss >> peer.peer_id >> peer.address >> port) ||
            port > std::numeric_limits<uint16_t>::max())
        {
            LOG(WARNING) << file_path << ":" << line_number << ": malformed peer entry";
            continue;
        }

        peer.port      = uint16_t(port);
        peer.last_seen = now;
        peers.push_back(std::move(peer));
    }

    return peers;
}
}  // namespace synapse::transfer
