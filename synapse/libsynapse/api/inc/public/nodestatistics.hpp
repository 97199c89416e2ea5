#ifndef SYNAPSE_API_NODESTATISTICS_HPP_
#define SYNAPSE_API_NODESTATISTICS_HPP_

#include <cstddef>
#include <string>

namespace synapse
{
struct NodeStatistics
{
    std::string        node_id;
    long long          uptime_seconds   = 0;
    unsigned long long total_uploaded   = 0;
    unsigned long long total_downloaded = 0;
    size_t             active_sessions  = 0;
    size_t             active_downloads = 0;
    size_t             active_seeds     = 0;
    size_t             known_peers      = 0;
};
}  // namespace synapse

#endif  // SYNAPSE_API_NODESTATISTICS_HPP_
