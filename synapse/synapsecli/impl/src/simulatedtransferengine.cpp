#include "simulatedtransferengine.hpp"

#include <algorithm>
#include <vector>

#include <glog/logging.h>

#include "mappedartifact.hpp"
#include "session.hpp"

namespace synapsecli
{
SimulatedTransferEngine::SimulatedTransferEngine(size_t chunk_size)
    : chunk_size_ {std::max<size_t>(chunk_size, 1)}
{}

void SimulatedTransferEngine::transfer(synapse::transfer::Session &session,
    const std::vector<synapse::model::Peer> &peers, const ProgressCallback &on_progress)
{
    LOG(WARNING) << "No wire protocol available, simulating the transfer of "
                 << session.content_hash() << " from " << peers.size() << " peers";

    auto file =
        synapse::storage::MappedArtifact::allocate(session.file_path(), session.total_size());
    if (!file)
    {
        session.fail("Cannot open " + session.file_path() + " for writing");
        return;
    }

    const std::vector<uint8_t> chunk(chunk_size_, 0);
    for (size_t offset = 0; offset < file.size();)
    {
        if (session.completion_token().is_cancelled())
        {
            VLOG(1) << "Transfer of " << session.content_hash() << " cancelled at " << offset;
            break;
        }

        size_t amount = std::min(chunk_size_, file.size() - offset);
        if (file.write(offset, amount, chunk.data()) != amount)
        {
            session.fail("Write to " + session.file_path() + " failed");
            return;
        }
        offset += amount;

        if (!session.add_downloaded(amount))
        {
            break;
        }
        on_progress(session.progress());
    }

    if (!file.flush())
    {
        LOG(WARNING) << "Cannot flush " << session.file_path();
    }
}
}  // namespace synapsecli
