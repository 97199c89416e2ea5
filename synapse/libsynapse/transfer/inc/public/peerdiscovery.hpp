#ifndef SYNAPSE_TRANSFER_PEERDISCOVERY_HPP_
#define SYNAPSE_TRANSFER_PEERDISCOVERY_HPP_

#include <future>
#include <string>
#include <vector>

#include "link.hpp"
#include "peer.hpp"

namespace synapse::transfer
{
// Tracker and DHT access. Implementations may block, fail or throw; the node bounds every wait.
class PeerDiscovery
{
public:
    virtual ~PeerDiscovery() = default;

    [[nodiscard]] virtual std::future<std::vector<model::Peer>> discover_peers(
        const model::Link &link) = 0;
    [[nodiscard]] virtual std::future<bool> announce(
        const model::Link &link, const std::string &tracker) = 0;
    [[nodiscard]] virtual std::future<std::vector<model::Peer>> refresh(
        const std::vector<model::Peer> &known_peers) = 0;
};
}  // namespace synapse::transfer

#endif  // SYNAPSE_TRANSFER_PEERDISCOVERY_HPP_
