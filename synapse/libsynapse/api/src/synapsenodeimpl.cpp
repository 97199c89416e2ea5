#include "synapsenodeimpl.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <future>

#include <glog/logging.h>

#include "base64encoderimpl.hpp"
#include "contenthasherimpl.hpp"
#include "fileidentity.hpp"
#include "hashalgorithm.hpp"
#include "hasherimpl.hpp"
#include "hexencoding.hpp"
#include "jsonshardmetadatastore.hpp"
#include "jsontrusttracker.hpp"
#include "linkcodec.hpp"
#include "random.hpp"
#include "rsasignatureschemeimpl.hpp"
#include "session.hpp"
#include "shardpackager.hpp"
#include "textfilepeerdiscovery.hpp"
#include "threadpool.hpp"
#include "timer.hpp"
#include "transferengine.hpp"
#include "trustgate.hpp"

namespace synapse
{
namespace
{
constexpr char const *node_id_prefix     = "SYNAPSE-";
constexpr size_t      node_id_hex_digits = 16;
constexpr char const *downloads_dir_name = "downloads";
constexpr char const *no_peers_message   = "No peers found";

std::string make_node_id(const config::Config &cfg)
{
    auto node_id = cfg.get_string(config::ConfigKey::NODE_ID);
    if (!node_id.empty())
    {
        return node_id;
    }
    return node_id_prefix + utils::Random::hex_string(node_id_hex_digits);
}

crypto::HashAlgorithm configured_hash_algorithm(const config::Config &cfg)
{
    auto name      = cfg.get_string(config::ConfigKey::HASH_ALGORITHM);
    auto algorithm = crypto::parse_hash_algorithm(name);
    if (!algorithm)
    {
        LOG(WARNING) << "Unknown hash algorithm " << name << ", using sha256";
        return crypto::HashAlgorithm::SHA256;
    }
    return *algorithm;
}

size_t configured_thread_count(const config::Config &cfg)
{
    auto count = cfg.get_integer(config::ConfigKey::WORKER_THREAD_COUNT);
    return count > 0 ? size_t(count) : utils::ThreadPool::default_thread_count();
}

// Waits for an asynchronous collaborator result; a timeout or an exception yields no result
template<typename T>
std::optional<T> bounded_get(std::future<T> &future, long long timeout_seconds, const char *what)
{
    try
    {
        if (timeout_seconds > 0 &&
            future.wait_for(std::chrono::seconds {timeout_seconds}) != std::future_status::ready)
        {
            LOG(WARNING) << what << " timed out after " << timeout_seconds << "s";
            return std::nullopt;
        }
        return future.get();
    }
    catch (const std::exception &e)
    {
        LOG(WARNING) << what << " failed: " << e.what();
        return std::nullopt;
    }
}
}  // namespace

SynapseNodeImpl::SynapseNodeImpl(config::Config cfg,
    std::shared_ptr<transfer::PeerDiscovery>       peer_discovery,
    std::shared_ptr<transfer::TransferEngine>      transfer_engine,
    std::shared_ptr<const crypto::SignatureScheme> signature_scheme)
    : cfg_ {std::move(cfg)}
    , node_id_ {make_node_id(cfg_)}
    , started_at_ {std::chrono::steady_clock::now()}
    , thread_pool_ {std::make_shared<utils::ThreadPool>(configured_thread_count(cfg_))}
    , hasher_ {std::make_shared<crypto::HasherImpl>()}
    , b64_ {std::make_shared<crypto::Base64EncoderImpl>()}
    , signature_scheme_ {signature_scheme ? std::move(signature_scheme) :
                                            std::make_shared<crypto::RSASignatureSchemeImpl>()}
    , content_hasher_ {std::make_shared<storage::ContentHasherImpl>(hasher_)}
    , shard_packager_ {std::make_unique<ShardPackager>(content_hasher_,
          std::make_shared<storage::JSONShardMetadataStore>(b64_), thread_pool_,
          configured_hash_algorithm(cfg_), cfg_.get_string_list(config::ConfigKey::TRACKERS))}
    , link_codec_ {std::make_unique<protocol::LinkCodec>(b64_)}
    , trust_gate_ {std::make_unique<trust::TrustGate>(hasher_, signature_scheme_,
          trust::TrustGate::Policy {cfg_.get_float(config::ConfigKey::MIN_TRUST_SCORE),
              cfg_.get_bool(config::ConfigKey::REQUIRE_SIGNATURES)})}
    , peer_discovery_ {peer_discovery ?
                           std::move(peer_discovery) :
                           std::make_shared<transfer::TextFilePeerDiscovery>(
                               resolve_path(config::ConfigKey::PEER_LIST_FILE), thread_pool_)}
    , transfer_engine_ {std::move(transfer_engine)}
    , peer_cache_ {std::chrono::seconds {cfg_.get_integer(config::ConfigKey::PEER_LIVENESS_WINDOW)}}
    , shut_down_ {false}
{
    if (!transfer_engine_)
    {
        LOG(FATAL) << "A transfer engine is required";
    }

    auto refresh_period = cfg_.get_integer(config::ConfigKey::PEER_CACHE_REFRESH_PERIOD);
    if (refresh_period > 0)
    {
        // The timer loop occupies its executer for the node's lifetime
        peer_cache_refresh_timer_ =
            std::make_unique<utils::Timer>(std::make_shared<utils::ThreadPool>(1));
        peer_cache_refresh_timer_->start(
            std::chrono::seconds {refresh_period}, [this] { refresh_peer_cache(); });
    }

    LOG(INFO) << "Node " << node_id_ << " started";
}

SynapseNodeImpl::~SynapseNodeImpl()
{
    if (!shut_down_)
    {
        shutdown();
    }
}

const std::string &SynapseNodeImpl::node_id() const
{
    return node_id_;
}

const config::Config &SynapseNodeImpl::config() const
{
    return cfg_;
}

ShardPackager &SynapseNodeImpl::shard_packager()
{
    return *shard_packager_;
}

bool SynapseNodeImpl::create_shard(
    const ShardOptions &options, model::Shard &out, model::Error &error)
{
    return shard_packager_->create_shard(options, out, error);
}

bool SynapseNodeImpl::load_shard(
    const std::string &artifact_path, model::Shard &out, model::Error &error)
{
    return shard_packager_->load_shard(artifact_path, out, error);
}

std::optional<model::Link> SynapseNodeImpl::announce(
    model::Shard &shard, const std::vector<std::string> &trackers, model::Error &error)
{
    if (!check_running(error))
    {
        return std::nullopt;
    }

    auto link = shard_packager_->derive_link(shard, trackers, error);
    if (!link)
    {
        return std::nullopt;
    }

    {
        std::lock_guard lock {sessions_mutex_};
        if (sessions_.count(link->content_hash) == 0)
        {
            sessions_.emplace(link->content_hash,
                transfer::Session::create_for_seed(
                    link->content_hash, shard.file_path, link->file_size));
            LOG(INFO) << "Seeding " << shard.display_name << " (" << link->content_hash << ")";
        }
        else
        {
            LOG(INFO) << "Session for " << link->content_hash << " already exists";
        }
    }

    announce_to_trackers(*link);

    return link;
}

std::optional<std::string> SynapseNodeImpl::request(const model::Link &link,
    const std::string &output_dir, const ProgressCallback &on_progress, model::Error &error)
{
    if (!check_running(error))
    {
        return std::nullopt;
    }

    auto content_hash = utils::to_lower_ascii(link.content_hash);
    if (!utils::is_hex_string(content_hash) ||
        !crypto::algorithm_for_hex_length(content_hash.size()))
    {
        error.set(model::ErrorCode::FORMAT, "Invalid content hash " + link.content_hash);
        return std::nullopt;
    }

    std::filesystem::path dir {output_dir};
    if (output_dir.empty())
    {
        dir = std::filesystem::path {cfg_.get_string(config::ConfigKey::DATA_DIR)} /
              downloads_dir_name;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        error.set(model::ErrorCode::IO, "Cannot create " + dir.string() + ": " + ec.message());
        return std::nullopt;
    }

    auto file_name = sanitize_file_name(link.display_name);
    if (file_name.empty())
    {
        file_name = content_hash;
    }
    auto output_path = (dir / file_name).string();

    std::shared_ptr<transfer::Session> session;
    {
        std::lock_guard lock {sessions_mutex_};

        auto it = sessions_.find(content_hash);
        if (it != sessions_.end())
        {
            const auto &existing = it->second;
            LOG(INFO) << "Session for " << content_hash << " already exists ("
                      << transfer::to_string(existing->status()) << ")";
            if (existing->status() == transfer::Session::Status::ERROR)
            {
                auto message = existing->error_message().value_or("Transfer failed");
                error.set(message == no_peers_message ? model::ErrorCode::NO_PEERS :
                                                        model::ErrorCode::IO,
                    message);
                return std::nullopt;
            }
            return existing->file_path();
        }

        session = transfer::Session::create_for_download(content_hash, output_path, link.file_size);
        sessions_.emplace(content_hash, session);
    }

    LOG(INFO) << "Requesting " << link.display_name << " (" << content_hash << ") into "
              << output_path;

    auto peers = discover_peers(link);
    if (peers.empty())
    {
        session->fail(no_peers_message);
        error.set(model::ErrorCode::NO_PEERS, no_peers_message);
        return std::nullopt;
    }

    LOG(INFO) << "Found " << peers.size() << " peers for " << link.display_name;
    session->set_peers(peers);

    try
    {
        transfer_engine_->transfer(*session, peers,
            on_progress ? on_progress : transfer::TransferEngine::ProgressCallback {[](double) {}});
    }
    catch (const std::exception &e)
    {
        session->fail(std::string {"Transfer failed: "} + e.what());
        error.set(model::ErrorCode::IO, std::string {"Transfer failed: "} + e.what());
        return std::nullopt;
    }

    switch (session->status())
    {
        case transfer::Session::Status::PAUSED:
            LOG(INFO) << "Transfer of " << content_hash << " paused";
            break;
        case transfer::Session::Status::ERROR:
            error.set(model::ErrorCode::IO, session->error_message().value_or("Transfer failed"));
            return std::nullopt;
        case transfer::Session::Status::DOWNLOADING:
            if (!session->complete())
            {
                session->fail("Transfer ended before all bytes were received");
                error.set(model::ErrorCode::IO, "Transfer of " + content_hash + " is incomplete");
                return std::nullopt;
            }
            LOG(INFO) << "Download of " << link.display_name << " complete, now seeding";
            break;
        default: break;
    }

    if (on_progress)
    {
        on_progress(session->progress());
    }

    return output_path;
}

std::string SynapseNodeImpl::encode_link(const model::Link &link) const
{
    return link_codec_->encode(link);
}

bool SynapseNodeImpl::decode_link(
    const std::string &uri, model::Link &out, model::Error &error) const
{
    return link_codec_->decode(uri, out, error);
}

bool SynapseNodeImpl::verify_integrity(const std::vector<uint8_t> &bytes,
    const std::string &expected_hash, model::Error &error) const
{
    return trust_gate_->verify_integrity(bytes, expected_hash, error);
}

bool SynapseNodeImpl::verify_file_integrity(
    const std::string &file_path, const std::string &expected_hash, model::Error &error) const
{
    auto algorithm = trust::TrustGate::select_algorithm(expected_hash, error);
    if (!algorithm)
    {
        return false;
    }

    if (!std::filesystem::exists(file_path))
    {
        error.set(model::ErrorCode::NOT_FOUND, "File " + file_path + " not found");
        return false;
    }

    std::string actual_hash;
    if (!shard_packager_->hash_file(file_path, *algorithm, actual_hash, error))
    {
        return false;
    }

    if (!trust::TrustGate::hashes_equal(actual_hash, expected_hash))
    {
        error.set(model::ErrorCode::INTEGRITY,
            "Content hash mismatch: expected " + expected_hash + ", got " + actual_hash);
        return false;
    }

    return true;
}

bool SynapseNodeImpl::verify_session(const std::string &content_hash, model::Error &error)
{
    auto session = find_session(content_hash);
    if (!session)
    {
        error.set(model::ErrorCode::NOT_FOUND, "No session for " + content_hash);
        return false;
    }

    if (!verify_file_integrity(session->file_path(), session->content_hash(), error))
    {
        if (error.code == model::ErrorCode::INTEGRITY)
        {
            // The bytes must be discarded, never assimilated
            session->fail(error.message);
        }
        return false;
    }

    return true;
}

bool SynapseNodeImpl::verify_signature(const model::Shard &shard, model::Error &error) const
{
    return trust_gate_->verify_signature(shard, error);
}

bool SynapseNodeImpl::verify_reputation(const model::Shard &shard,
    const trust::TrustTracker &trust_tracker, model::Error &error) const
{
    return trust_gate_->verify_reputation(shard, trust_tracker, error);
}

bool SynapseNodeImpl::verify_reputation(const model::Shard &shard,
    const trust::TrustTracker &trust_tracker, double min_score, model::Error &error) const
{
    return trust_gate_->verify_reputation(shard, trust_tracker, min_score, error);
}

bool SynapseNodeImpl::verify_reputation(const model::Shard &shard, model::Error &error) const
{
    trust::JSONTrustTracker trust_tracker {resolve_path(config::ConfigKey::TRUST_SCORES_FILE)};
    return trust_gate_->verify_reputation(shard, trust_tracker, error);
}

trust::Attestation SynapseNodeImpl::create_attestation(const model::Shard &shard, double rating,
    std::string feedback, const trust::Identity &identity) const
{
    return trust_gate_->create_attestation(shard, rating, std::move(feedback), identity);
}

nlohmann::json SynapseNodeImpl::attestation_to_json(const trust::Attestation &attestation) const
{
    return attestation.to_json(*b64_);
}

std::unique_ptr<trust::Identity> SynapseNodeImpl::generate_identity(
    bool overwrite, model::Error &error)
{
    return trust::FileIdentity::generate(resolve_path(config::ConfigKey::IDENTITY_DIR),
        signature_scheme_, *hasher_, overwrite, error);
}

std::unique_ptr<trust::Identity> SynapseNodeImpl::load_identity(model::Error &error) const
{
    return trust::FileIdentity::load(
        resolve_path(config::ConfigKey::IDENTITY_DIR), signature_scheme_, error);
}

bool SynapseNodeImpl::sign_shard(model::Shard &shard, model::Error &error)
{
    auto identity = load_identity(error);
    if (!identity)
    {
        return false;
    }
    return shard_packager_->sign_shard(shard, *identity, error);
}

std::optional<transfer::SessionStatus> SynapseNodeImpl::get_status(
    const std::string &content_hash) const
{
    auto session = find_session(content_hash);
    if (!session)
    {
        return std::nullopt;
    }
    return session->snapshot();
}

std::vector<transfer::SessionStatus> SynapseNodeImpl::list_sessions() const
{
    std::vector<std::shared_ptr<transfer::Session>> sessions;
    {
        std::lock_guard lock {sessions_mutex_};
        sessions.reserve(sessions_.size());
        for (const auto &[hash, session] : sessions_)
        {
            sessions.push_back(session);
        }
    }

    std::vector<transfer::SessionStatus> statuses;
    statuses.reserve(sessions.size());
    for (const auto &session : sessions)
    {
        statuses.push_back(session->snapshot());
    }
    return statuses;
}

bool SynapseNodeImpl::stop(const std::string &content_hash)
{
    auto session = find_session(content_hash);
    if (!session)
    {
        LOG(WARNING) << "Cannot stop " << content_hash << ": no such session";
        return false;
    }

    if (!session->pause())
    {
        LOG(WARNING) << "Cannot stop " << content_hash << " from state "
                     << transfer::to_string(session->status());
        return false;
    }

    LOG(INFO) << "Session " << content_hash << " paused";
    return true;
}

bool SynapseNodeImpl::remove(const std::string &content_hash, bool delete_file)
{
    std::shared_ptr<transfer::Session> session;
    {
        std::lock_guard lock {sessions_mutex_};

        auto it = sessions_.find(utils::to_lower_ascii(content_hash));
        if (it == sessions_.end())
        {
            LOG(WARNING) << "Cannot remove " << content_hash << ": no such session";
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    session->pause();

    if (delete_file)
    {
        std::error_code ec;
        std::filesystem::remove(session->file_path(), ec);
        if (ec)
        {
            LOG(WARNING) << "Cannot delete " << session->file_path() << ": " << ec.message();
        }
    }

    LOG(INFO) << "Session " << content_hash << " removed";
    return true;
}

NodeStatistics SynapseNodeImpl::statistics() const
{
    NodeStatistics stats;
    stats.node_id        = node_id_;
    stats.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_)
                               .count();
    stats.known_peers = peer_cache_.size();

    for (const auto &status : list_sessions())
    {
        ++stats.active_sessions;
        stats.total_uploaded += status.uploaded;
        stats.total_downloaded += status.downloaded;
        if (status.status == transfer::SessionStatus::Status::DOWNLOADING)
        {
            ++stats.active_downloads;
        }
        else if (status.status == transfer::SessionStatus::Status::SEEDING)
        {
            ++stats.active_seeds;
        }
    }

    return stats;
}

void SynapseNodeImpl::refresh_peer_cache()
{
    try
    {
        auto future = peer_discovery_->refresh(*peer_cache_.snapshot());
        auto peers  = bounded_get(future,
            cfg_.get_integer(config::ConfigKey::DISCOVERY_TIMEOUT), "Peer cache refresh");
        if (peers)
        {
            peer_cache_.merge(*peers);
        }
    }
    catch (const std::exception &e)
    {
        LOG(WARNING) << "Peer cache refresh failed: " << e.what();
    }

    auto pruned = peer_cache_.prune();
    VLOG(1) << "Peer cache refreshed, " << pruned << " dead peers pruned, " << peer_cache_.size()
            << " known";
}

void SynapseNodeImpl::shutdown()
{
    if (shut_down_.exchange(true))
    {
        LOG(WARNING) << "Node " << node_id_ << " already shut down";
        return;
    }

    if (peer_cache_refresh_timer_)
    {
        peer_cache_refresh_timer_->stop();
    }

    std::lock_guard lock {sessions_mutex_};
    for (auto &[hash, session] : sessions_)
    {
        session->pause();
    }

    LOG(INFO) << "Node " << node_id_ << " shut down";
}

std::string SynapseNodeImpl::sanitize_file_name(const std::string &name)
{
    std::string safe_name;
    std::copy_if(name.cbegin(), name.cend(), std::back_inserter(safe_name), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-' ||
               c == ' ';
    });

    // "." and ".." would escape the output directory
    if (std::all_of(safe_name.cbegin(), safe_name.cend(), [](char c) { return c == '.'; }))
    {
        return "";
    }
    return safe_name;
}

std::shared_ptr<transfer::Session> SynapseNodeImpl::find_session(
    const std::string &content_hash) const
{
    std::lock_guard lock {sessions_mutex_};

    auto it = sessions_.find(utils::to_lower_ascii(content_hash));
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<model::Peer> SynapseNodeImpl::discover_peers(const model::Link &link)
{
    std::optional<std::vector<model::Peer>> discovered;
    try
    {
        auto future = peer_discovery_->discover_peers(link);
        discovered  = bounded_get(
            future, cfg_.get_integer(config::ConfigKey::DISCOVERY_TIMEOUT), "Peer discovery");
    }
    catch (const std::exception &e)
    {
        LOG(WARNING) << "Peer discovery for " << link.content_hash << " failed: " << e.what();
    }

    if (!discovered)
    {
        return {};
    }

    auto now    = model::Peer::Clock::now();
    auto window = peer_cache_.liveness_window();

    std::vector<model::Peer> alive;
    std::copy_if(discovered->cbegin(), discovered->cend(), std::back_inserter(alive),
        [&](const model::Peer &p) { return p.is_alive(window, now); });

    if (alive.size() != discovered->size())
    {
        VLOG(1) << discovered->size() - alive.size() << " stale peers ignored for "
                << link.content_hash;
    }

    peer_cache_.merge(alive);
    return alive;
}

void SynapseNodeImpl::announce_to_trackers(const model::Link &link)
{
    std::vector<std::pair<std::string, std::future<bool>>> pending;
    for (const auto &tracker : link.trackers)
    {
        try
        {
            pending.emplace_back(tracker, peer_discovery_->announce(link, tracker));
        }
        catch (const std::exception &e)
        {
            LOG(WARNING) << "Announce to " << tracker << " failed: " << e.what();
        }
    }

    auto timeout = cfg_.get_integer(config::ConfigKey::ANNOUNCE_TIMEOUT);
    for (auto &[tracker, future] : pending)
    {
        auto accepted = bounded_get(future, timeout, "Announce");
        if (!accepted || !*accepted)
        {
            LOG(WARNING) << "Tracker " << tracker << " did not accept " << link.content_hash;
        }
    }
}

std::string SynapseNodeImpl::resolve_path(config::ConfigKey key) const
{
    std::filesystem::path path {cfg_.get_string(key)};
    if (path.is_absolute())
    {
        return path.string();
    }
    return (std::filesystem::path {cfg_.get_string(config::ConfigKey::DATA_DIR)} / path).string();
}

bool SynapseNodeImpl::check_running(model::Error &error) const
{
    if (shut_down_)
    {
        error.set(model::ErrorCode::IO, "Node " + node_id_ + " is shut down");
        return false;
    }
    return true;
}
}  // namespace synapse
