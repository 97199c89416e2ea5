#ifndef SYNAPSE_MODEL_SHARD_HPP_
#define SYNAPSE_MODEL_SHARD_HPP_

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace synapse::model
{
/*
 * A packaged vector database export. The content hash is the identity of the shard; the rest is
 * descriptive metadata. A shard is persisted next to its artifact and only the signature fields
 * may be added afterwards.
 */
struct Shard
{
    std::string                         file_path;
    std::string                         embedding_model;
    unsigned                            dimensions  = 0;
    unsigned long long                  entry_count = 0;
    std::set<std::string>               tags;
    std::string                         content_hash;
    std::string                         display_name;
    std::optional<std::string>          creator_id;
    std::optional<std::string>          creator_public_key;
    std::optional<std::vector<uint8_t>> signature;

    [[nodiscard]] bool has_hash() const
    {
        return !content_hash.empty();
    }

    [[nodiscard]] bool is_signed() const
    {
        return signature.has_value() || creator_public_key.has_value();
    }

    // Canonical bytes covered by the creator signature
    [[nodiscard]] std::string signed_payload() const;
};
}  // namespace synapse::model

#endif  // SYNAPSE_MODEL_SHARD_HPP_
