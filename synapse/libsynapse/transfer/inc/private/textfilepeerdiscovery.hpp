#ifndef SYNAPSE_TRANSFER_TEXTFILEPEERDISCOVERY_HPP_
#define SYNAPSE_TRANSFER_TEXTFILEPEERDISCOVERY_HPP_

#include <memory>
#include <string>

#include "peerdiscovery.hpp"

namespace synapse::utils
{
// Forward declarations
class Executer;
}  // namespace synapse::utils

namespace synapse::transfer
{
/*
 * Static peer list read from a text file, one peer per line:
 *   <peer id> <address> <port>
 * Empty lines and lines starting with '#' are ignored. Every listed peer is reported as seen at
 * the time the file is read. Tracker announces have no wire protocol here and are only logged.
 */
class TextFilePeerDiscovery : public PeerDiscovery
{
public:
    TextFilePeerDiscovery(std::string file_path, std::shared_ptr<utils::Executer> executer);

    [[nodiscard]] std::future<std::vector<model::Peer>> discover_peers(
        const model::Link &link) override;
    [[nodiscard]] std::future<bool> announce(
        const model::Link &link, const std::string &tracker) override;
    [[nodiscard]] std::future<std::vector<model::Peer>> refresh(
        const std::vector<model::Peer> &known_peers) override;

private:
    [[nodiscard]] std::future<std::vector<model::Peer>> load_async() const;
    [[nodiscard]] static std::vector<model::Peer>       load(const std::string &file_path);

    const std::string                      file_path_;
    const std::shared_ptr<utils::Executer> executer_;
};
}  // namespace synapse::transfer

#endif  // SYNAPSE_TRANSFER_TEXTFILEPEERDISCOVERY_HPP_
