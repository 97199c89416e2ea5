#include "defaultconfigvalues.hpp"

#include <vector>

#include <glog/logging.h>

namespace synapse
{
DefaultConfigValues::DefaultConfigValues(const std::string &data_dir)
    : default_values_ {/* NODE_ID */ std::string {} /* = generated at startup */,
          /* LISTEN_PORT */ 6881LL, /* DATA_DIR */ data_dir,
          /* TRACKERS */
          std::vector<std::string> {"udp://tracker.opentrackr.org:1337/announce",
              "udp://open.tracker.cl:1337/announce"},
          /* PEER_LIVENESS_WINDOW */ 300LL /* = 5 minutes */,
          /* DISCOVERY_TIMEOUT */ 30LL, /* ANNOUNCE_TIMEOUT */ 10LL,
          /* PEER_CACHE_REFRESH_PERIOD */ 0LL /* = disabled */, /* MIN_TRUST_SCORE */ 0.6,
          /* REQUIRE_SIGNATURES */ false, /* HASH_ALGORITHM */ std::string {"sha256"},
          /* PEER_LIST_FILE */ std::string {"peers.txt"},
          /* IDENTITY_DIR */ std::string {"identity"},
          /* TRUST_SCORES_FILE */ std::string {"trust_scores.json"},
          /* WORKER_THREAD_COUNT */ 0LL /* = hardware concurrency */}
{}

std::any DefaultConfigValues::get(const config::ConfigKey &key) const
{
    if (key < config::ConfigKey::FIRST_KEY || key >= config::ConfigKey::KEY_COUNT)
    {
        LOG(ERROR) << "Invalid key " << int(key);
        return {};
    }
    return default_values_[key];
}
}  // namespace synapse
