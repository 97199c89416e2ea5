#ifndef SYNAPSE_API_SYNAPSENODE_HPP_
#define SYNAPSE_API_SYNAPSENODE_HPP_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.hpp"
#include "link.hpp"
#include "nodestatistics.hpp"
#include "sessionstatus.hpp"
#include "shard.hpp"
#include "shardoptions.hpp"
#include "synapseapidefs.h"

namespace synapse::transfer
{
// Forward declarations
class TransferEngine;
}  // namespace synapse::transfer

namespace synapse
{
// Forward declarations
class SynapseNodeImpl;

class SYNAPSE_API SynapseNode
{
public:
    using ProgressCallback = std::function<void(double percentage)>;

    SynapseNode(const std::string &data_dir, const std::string &config_file_name,
        std::shared_ptr<transfer::TransferEngine> transfer_engine);
    SynapseNode(SynapseNode &&other) noexcept;
    SynapseNode &operator=(SynapseNode &&rhs) noexcept;
    ~SynapseNode();

    [[nodiscard]] std::string node_id() const;

    bool create_shard(const ShardOptions &options, model::Shard &out, model::Error &error);
    bool load_shard(const std::string &artifact_path, model::Shard &out, model::Error &error);

    std::optional<model::Link> announce(
        model::Shard &shard, const std::vector<std::string> &trackers, model::Error &error);
    std::optional<std::string> request(const model::Link &link, const std::string &output_dir,
        const ProgressCallback &on_progress, model::Error &error);

    [[nodiscard]] std::string encode_link(const model::Link &link) const;
    bool decode_link(const std::string &uri, model::Link &out, model::Error &error) const;

    bool verify_file_integrity(
        const std::string &file_path, const std::string &expected_hash, model::Error &error) const;
    bool verify_session(const std::string &content_hash, model::Error &error);
    bool verify_signature(const model::Shard &shard, model::Error &error) const;
    bool verify_reputation(const model::Shard &shard, model::Error &error) const;

    // Creates the node identity; fails if one exists and overwrite is false
    bool generate_identity(bool overwrite, std::string &agent_id, model::Error &error);
    bool sign_shard(model::Shard &shard, model::Error &error);
    // Signed rating of a shard by this node's identity, serialized for publication
    bool attest(const model::Shard &shard, double rating, const std::string &feedback,
        nlohmann::json &out, model::Error &error) const;

    [[nodiscard]] std::optional<transfer::SessionStatus> get_status(
        const std::string &content_hash) const;
    [[nodiscard]] std::vector<transfer::SessionStatus> list_sessions() const;
    bool                                               stop(const std::string &content_hash);
    bool remove(const std::string &content_hash, bool delete_file);

    [[nodiscard]] NodeStatistics statistics() const;
    void                         shutdown();

private:
    std::unique_ptr<SynapseNodeImpl> impl_;
};
}  // namespace synapse

#endif  // SYNAPSE_API_SYNAPSENODE_HPP_
