#include "peercache.hpp"

#include <algorithm>
#include <iterator>

namespace synapse::transfer
{
PeerCache::PeerCache(std::chrono::seconds liveness_window)
    : liveness_window_ {liveness_window}
    , peers_ {std::make_shared<const std::vector<model::Peer>>()}
{}

PeerCache::Snapshot PeerCache::snapshot() const
{
    return std::atomic_load(&peers_);
}

std::vector<model::Peer> PeerCache::alive_peers(TimePoint now) const
{
    auto                     peers = snapshot();
    std::vector<model::Peer> alive;
    std::copy_if(peers->cbegin(), peers->cend(), std::back_inserter(alive),
        [&](const model::Peer &p) { return p.is_alive(liveness_window_, now); });
    return alive;
}

size_t PeerCache::size() const
{
    return snapshot()->size();
}

std::chrono::seconds PeerCache::liveness_window() const
{
    return liveness_window_;
}

void PeerCache::replace(std::vector<model::Peer> peers)
{
    std::lock_guard lock {writer_mutex_};
    publish(std::move(peers));
}

void PeerCache::merge(const std::vector<model::Peer> &peers)
{
    std::lock_guard lock {writer_mutex_};

    std::vector<model::Peer> merged {*snapshot()};
    for (const auto &peer : peers)
    {
        auto it = std::find_if(merged.begin(), merged.end(),
            [&](const model::Peer &p) { return p.peer_id == peer.peer_id; });
        if (it == merged.end())
        {
            merged.push_back(peer);
        }
        else if (it->last_seen <= peer.last_seen)
        {
            *it = peer;
        }
    }

    publish(std::move(merged));
}

size_t PeerCache::prune(TimePoint now)
{
    std::lock_guard lock {writer_mutex_};

    std::vector<model::Peer> kept {*snapshot()};
    size_t                   old_size = kept.size();
    kept.erase(std::remove_if(kept.begin(), kept.end(),
                   [&](const model::Peer &p) { return !p.is_alive(liveness_window_, now); }),
        kept.end());

    size_t removed = old_size - kept.size();
    publish(std::move(kept));
    return removed;
}

void PeerCache::publish(std::vector<model::Peer> peers)
{
    std::atomic_store(&peers_,
        Snapshot {std::make_shared<const std::vector<model::Peer>>(std::move(peers))});
}
}  // namespace synapse::transfer
