#ifndef SYNAPSE_STORAGE_JSONSHARDMETADATASTORE_HPP_
#define SYNAPSE_STORAGE_JSONSHARDMETADATASTORE_HPP_

#include <memory>

#include "shardmetadatastore.hpp"

namespace synapse::crypto
{
// Forward declarations
class Base64Encoder;
}  // namespace synapse::crypto

namespace synapse::storage
{
class JSONShardMetadataStore : public ShardMetadataStore
{
public:
    explicit JSONShardMetadataStore(std::shared_ptr<const crypto::Base64Encoder> b64);
    ~JSONShardMetadataStore() override;

    [[nodiscard]] std::string metadata_path(const std::string &artifact_path) const override;
    bool save(const model::Shard &shard, model::Error &error) const override;
    bool load(
        const std::string &artifact_path, model::Shard &out, model::Error &error) const override;

private:
    const std::shared_ptr<const crypto::Base64Encoder> b64_;
};
}  // namespace synapse::storage

#endif  // SYNAPSE_STORAGE_JSONSHARDMETADATASTORE_HPP_
