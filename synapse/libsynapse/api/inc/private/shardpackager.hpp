#ifndef SYNAPSE_API_SHARDPACKAGER_HPP_
#define SYNAPSE_API_SHARDPACKAGER_HPP_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "error.hpp"
#include "hashalgorithm.hpp"
#include "link.hpp"
#include "shard.hpp"
#include "shardoptions.hpp"

namespace synapse::utils
{
// Forward declarations
class Executer;
}  // namespace synapse::utils

namespace synapse::storage
{
// Forward declarations
class ContentHasher;
class ShardMetadataStore;
}  // namespace synapse::storage

namespace synapse::trust
{
// Forward declarations
class Identity;
}  // namespace synapse::trust

namespace synapse
{
/*
 * Producer side of the shard lifecycle: packaging an artifact, hashing it, deriving links and
 * signing. Every change to a shard is persisted through the metadata store.
 */
class ShardPackager
{
public:
    ShardPackager(std::shared_ptr<storage::ContentHasher> content_hasher,
        std::shared_ptr<storage::ShardMetadataStore> metadata_store,
        std::shared_ptr<utils::Executer> executer, crypto::HashAlgorithm hash_algorithm,
        std::vector<std::string> default_trackers);
    ~ShardPackager();

    bool create_shard(const ShardOptions &options, model::Shard &out, model::Error &error) const;
    bool load_shard(
        const std::string &artifact_path, model::Shard &out, model::Error &error) const;

    // Assigns the content hash, or verifies it if the shard already carries one
    bool compute_hash(model::Shard &shard, model::Error &error) const;

    [[nodiscard]] std::optional<model::Link> derive_link(model::Shard &shard,
        const std::vector<std::string> &trackers, model::Error &error) const;

    bool sign_shard(
        model::Shard &shard, const trust::Identity &identity, model::Error &error) const;

    bool hash_file(const std::string &file_path, crypto::HashAlgorithm algorithm,
        std::string &out, model::Error &error) const;

private:
    const std::shared_ptr<storage::ContentHasher>      content_hasher_;
    const std::shared_ptr<storage::ShardMetadataStore> metadata_store_;
    const std::shared_ptr<utils::Executer>             executer_;
    const crypto::HashAlgorithm                        hash_algorithm_;
    const std::vector<std::string>                     default_trackers_;
};
}  // namespace synapse

#endif  // SYNAPSE_API_SHARDPACKAGER_HPP_
