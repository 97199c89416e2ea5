#ifndef SYNAPSE_TRANSFER_PEERCACHE_HPP_
#define SYNAPSE_TRANSFER_PEERCACHE_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "peer.hpp"

namespace synapse::transfer
{
/*
 * Known peers of a node. Readers get an immutable snapshot without blocking; writers build a new
 * list and swap it in.
 */
class PeerCache
{
public:
    using Snapshot  = std::shared_ptr<const std::vector<model::Peer>>;
    using TimePoint = model::Peer::TimePoint;

    explicit PeerCache(std::chrono::seconds liveness_window = model::Peer::default_liveness_window);

    [[nodiscard]] Snapshot                 snapshot() const;
    [[nodiscard]] std::vector<model::Peer> alive_peers(
        TimePoint now = model::Peer::Clock::now()) const;
    [[nodiscard]] size_t                   size() const;
    [[nodiscard]] std::chrono::seconds     liveness_window() const;

    void   replace(std::vector<model::Peer> peers);
    void   merge(const std::vector<model::Peer> &peers);
    size_t prune(TimePoint now = model::Peer::Clock::now());

private:
    void publish(std::vector<model::Peer> peers);

    const std::chrono::seconds liveness_window_;
    Snapshot                   peers_;
    std::mutex                 writer_mutex_;
};
}  // namespace synapse::transfer

#endif  // SYNAPSE_TRANSFER_PEERCACHE_HPP_
