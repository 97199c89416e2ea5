#ifndef SYNAPSE_STORAGE_SHARDMETADATASTORE_HPP_
#define SYNAPSE_STORAGE_SHARDMETADATASTORE_HPP_

#include <string>

#include "error.hpp"
#include "shard.hpp"

namespace synapse::storage
{
// One metadata record per shard, stored beside the artifact it describes
class ShardMetadataStore
{
public:
    virtual ~ShardMetadataStore() = default;

    [[nodiscard]] virtual std::string metadata_path(const std::string &artifact_path) const = 0;
    virtual bool save(const model::Shard &shard, model::Error &error) const                 = 0;
    virtual bool load(
        const std::string &artifact_path, model::Shard &out, model::Error &error) const = 0;
};
}  // namespace synapse::storage

#endif  // SYNAPSE_STORAGE_SHARDMETADATASTORE_HPP_
