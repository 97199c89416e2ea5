#ifndef SYNAPSECLI_SIMULATEDTRANSFERENGINE_HPP_
#define SYNAPSECLI_SIMULATEDTRANSFERENGINE_HPP_

#include <cstddef>

#include "transferengine.hpp"

namespace synapsecli
{
/*
 * Stand-in transfer engine for the command line utility. No bytes leave or reach the network: the
 * output file is allocated at the announced size and filled with zeros chunk by chunk, so the
 * session goes through the same progress, pause and completion steps as a real transfer.
 */
class SimulatedTransferEngine : public synapse::transfer::TransferEngine
{
public:
    explicit SimulatedTransferEngine(size_t chunk_size = 64 * 1024);

    void transfer(synapse::transfer::Session &session,
        const std::vector<synapse::model::Peer> &peers,
        const ProgressCallback                  &on_progress) override;

private:
    const size_t chunk_size_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_SIMULATEDTRANSFERENGINE_HPP_
