#ifndef SYNAPSE_TRANSFER_TRANSFERENGINE_HPP_
#define SYNAPSE_TRANSFER_TRANSFERENGINE_HPP_

#include <functional>
#include <vector>

#include "peer.hpp"

namespace synapse::transfer
{
// Forward declarations
class Session;

/*
 * Moves the bytes of one session. transfer() returns once the session has all its bytes, has been
 * paused (session completion token cancelled) or has failed. Counters are updated through
 * Session::add_downloaded/add_uploaded; those return false once the session stopped being active.
 */
class TransferEngine
{
public:
    using ProgressCallback = std::function<void(double percentage)>;

    virtual ~TransferEngine() = default;

    virtual void transfer(Session &session, const std::vector<model::Peer> &peers,
        const ProgressCallback &on_progress) = 0;
};
}  // namespace synapse::transfer

#endif  // SYNAPSE_TRANSFER_TRANSFERENGINE_HPP_
