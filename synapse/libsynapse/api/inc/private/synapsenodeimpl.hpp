#ifndef SYNAPSE_API_SYNAPSENODEIMPL_HPP_
#define SYNAPSE_API_SYNAPSENODEIMPL_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "attestation.hpp"
#include "config.hpp"
#include "error.hpp"
#include "link.hpp"
#include "nodestatistics.hpp"
#include "peercache.hpp"
#include "sessionstatus.hpp"
#include "shard.hpp"
#include "shardoptions.hpp"

namespace synapse::utils
{
// Forward declarations
class ThreadPool;
class Timer;
}  // namespace synapse::utils

namespace synapse::crypto
{
// Forward declarations
class Base64Encoder;
class Hasher;
class SignatureScheme;
}  // namespace synapse::crypto

namespace synapse::storage
{
// Forward declarations
class ContentHasher;
}  // namespace synapse::storage

namespace synapse::protocol
{
// Forward declarations
class LinkCodec;
}  // namespace synapse::protocol

namespace synapse::transfer
{
// Forward declarations
class PeerDiscovery;
class Session;
class TransferEngine;
}  // namespace synapse::transfer

namespace synapse::trust
{
// Forward declarations
class Identity;
class TrustGate;
class TrustTracker;
}  // namespace synapse::trust

namespace synapse
{
// Forward declarations
class ShardPackager;

/*
 * Owns the session registry and the peer cache of one node. Several instances can live in the same
 * process. Null collaborators are replaced by the built-in ones: a text file peer list for
 * discovery and RSA signatures. There is no built-in transfer engine.
 */
class SynapseNodeImpl
{
public:
    using ProgressCallback = std::function<void(double percentage)>;

    SynapseNodeImpl(config::Config cfg, std::shared_ptr<transfer::PeerDiscovery> peer_discovery,
        std::shared_ptr<transfer::TransferEngine>      transfer_engine,
        std::shared_ptr<const crypto::SignatureScheme> signature_scheme = nullptr);
    ~SynapseNodeImpl();

    SynapseNodeImpl(const SynapseNodeImpl &) = delete;
    SynapseNodeImpl &operator=(const SynapseNodeImpl &) = delete;

    [[nodiscard]] const std::string    &node_id() const;
    [[nodiscard]] const config::Config &config() const;
    [[nodiscard]] ShardPackager        &shard_packager();

    bool create_shard(const ShardOptions &options, model::Shard &out, model::Error &error);
    bool load_shard(const std::string &artifact_path, model::Shard &out, model::Error &error);

    std::optional<model::Link> announce(
        model::Shard &shard, const std::vector<std::string> &trackers, model::Error &error);
    std::optional<std::string> request(const model::Link &link, const std::string &output_dir,
        const ProgressCallback &on_progress, model::Error &error);

    [[nodiscard]] std::string encode_link(const model::Link &link) const;
    bool decode_link(const std::string &uri, model::Link &out, model::Error &error) const;

    bool verify_integrity(const std::vector<uint8_t> &bytes, const std::string &expected_hash,
        model::Error &error) const;
    bool verify_file_integrity(
        const std::string &file_path, const std::string &expected_hash, model::Error &error) const;
    bool verify_session(const std::string &content_hash, model::Error &error);
    bool verify_signature(const model::Shard &shard, model::Error &error) const;
    bool verify_reputation(const model::Shard &shard, const trust::TrustTracker &trust_tracker,
        model::Error &error) const;
    bool verify_reputation(const model::Shard &shard, const trust::TrustTracker &trust_tracker,
        double min_score, model::Error &error) const;
    bool verify_reputation(const model::Shard &shard, model::Error &error) const;

    [[nodiscard]] trust::Attestation create_attestation(const model::Shard &shard, double rating,
        std::string feedback, const trust::Identity &identity) const;
    [[nodiscard]] nlohmann::json attestation_to_json(const trust::Attestation &attestation) const;

    std::unique_ptr<trust::Identity> generate_identity(bool overwrite, model::Error &error);
    std::unique_ptr<trust::Identity> load_identity(model::Error &error) const;
    bool                             sign_shard(model::Shard &shard, model::Error &error);

    [[nodiscard]] std::optional<transfer::SessionStatus> get_status(
        const std::string &content_hash) const;
    [[nodiscard]] std::vector<transfer::SessionStatus> list_sessions() const;
    bool                                               stop(const std::string &content_hash);
    bool remove(const std::string &content_hash, bool delete_file);

    [[nodiscard]] NodeStatistics statistics() const;
    void                         refresh_peer_cache();
    void                         shutdown();

    static std::string sanitize_file_name(const std::string &name);

private:
    [[nodiscard]] std::shared_ptr<transfer::Session> find_session(
        const std::string &content_hash) const;
    [[nodiscard]] std::vector<model::Peer> discover_peers(const model::Link &link);
    void                                   announce_to_trackers(const model::Link &link);
    [[nodiscard]] std::string              resolve_path(config::ConfigKey key) const;
    [[nodiscard]] bool                     check_running(model::Error &error) const;

    const config::Config                           cfg_;
    const std::string                              node_id_;
    const std::chrono::steady_clock::time_point    started_at_;
    std::shared_ptr<utils::ThreadPool>             thread_pool_;
    std::shared_ptr<crypto::Hasher>                hasher_;
    std::shared_ptr<const crypto::Base64Encoder>   b64_;
    std::shared_ptr<const crypto::SignatureScheme> signature_scheme_;
    std::shared_ptr<storage::ContentHasher>        content_hasher_;
    std::unique_ptr<ShardPackager>                 shard_packager_;
    std::unique_ptr<protocol::LinkCodec>           link_codec_;
    std::unique_ptr<trust::TrustGate>              trust_gate_;
    std::shared_ptr<transfer::PeerDiscovery>       peer_discovery_;
    std::shared_ptr<transfer::TransferEngine>      transfer_engine_;
    transfer::PeerCache                            peer_cache_;
    std::map<std::string, std::shared_ptr<transfer::Session>> sessions_;
    mutable std::mutex                             sessions_mutex_;
    std::atomic_bool                               shut_down_;
    std::unique_ptr<utils::Timer>                  peer_cache_refresh_timer_;
};
}  // namespace synapse

#endif  // SYNAPSE_API_SYNAPSENODEIMPL_HPP_
