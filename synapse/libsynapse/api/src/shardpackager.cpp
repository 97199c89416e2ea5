#include "shardpackager.hpp"

#include <filesystem>

#include <glog/logging.h>

#include "contenthasher.hpp"
#include "executer.hpp"
#include "hexencoding.hpp"
#include "identity.hpp"
#include "shardmetadatastore.hpp"
#include "trustgate.hpp"

namespace synapse
{
namespace
{
std::string trim(const std::string &str)
{
    auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}
}  // namespace

ShardPackager::ShardPackager(std::shared_ptr<storage::ContentHasher> content_hasher,
    std::shared_ptr<storage::ShardMetadataStore> metadata_store,
    std::shared_ptr<utils::Executer> executer, crypto::HashAlgorithm hash_algorithm,
    std::vector<std::string> default_trackers)
    : content_hasher_ {std::move(content_hasher)}
    , metadata_store_ {std::move(metadata_store)}
    , executer_ {std::move(executer)}
    , hash_algorithm_ {hash_algorithm}
    , default_trackers_ {std::move(default_trackers)}
{}

ShardPackager::~ShardPackager() = default;

bool ShardPackager::create_shard(
    const ShardOptions &options, model::Shard &out, model::Error &error) const
{
    if (!std::filesystem::is_regular_file(options.source_path))
    {
        error.set(model::ErrorCode::NOT_FOUND, "Source file " + options.source_path + " not found");
        return false;
    }

    model::Shard shard;
    shard.file_path       = options.source_path;
    shard.embedding_model = options.embedding_model;
    shard.dimensions      = options.dimensions;
    shard.entry_count     = options.entry_count;
    shard.display_name    = trim(options.display_name);
    if (shard.display_name.empty())
    {
        shard.display_name = std::filesystem::path {options.source_path}.filename().string();
    }

    for (const auto &tag : options.tags)
    {
        auto trimmed = trim(tag);
        if (!trimmed.empty())
        {
            shard.tags.insert(std::move(trimmed));
        }
    }

    if (!compute_hash(shard, error) || !metadata_store_->save(shard, error))
    {
        return false;
    }

    LOG(INFO) << "Created shard " << shard.display_name << " (" << shard.content_hash << ")";
    out = std::move(shard);
    return true;
}

bool ShardPackager::load_shard(
    const std::string &artifact_path, model::Shard &out, model::Error &error) const
{
    return metadata_store_->load(artifact_path, out, error);
}

bool ShardPackager::compute_hash(model::Shard &shard, model::Error &error) const
{
    if (!std::filesystem::exists(shard.file_path))
    {
        error.set(model::ErrorCode::NOT_FOUND, "Artifact " + shard.file_path + " not found");
        return false;
    }

    if (!shard.has_hash())
    {
        std::string hash;
        if (!hash_file(shard.file_path, hash_algorithm_, hash, error))
        {
            return false;
        }
        shard.content_hash = std::move(hash);
        return true;
    }

    auto algorithm = trust::TrustGate::select_algorithm(shard.content_hash, error);
    if (!algorithm)
    {
        return false;
    }

    std::string actual_hash;
    if (!hash_file(shard.file_path, *algorithm, actual_hash, error))
    {
        return false;
    }

    if (!trust::TrustGate::hashes_equal(actual_hash, shard.content_hash))
    {
        error.set(model::ErrorCode::INTEGRITY, "Artifact " + shard.file_path +
                                                   " no longer matches its content hash " +
                                                   shard.content_hash);
        return false;
    }

    return true;
}

std::optional<model::Link> ShardPackager::derive_link(model::Shard &shard,
    const std::vector<std::string> &trackers, model::Error &error) const
{
    std::error_code ec;
    auto            file_size = std::filesystem::file_size(shard.file_path, ec);
    if (ec)
    {
        error.set(model::ErrorCode::NOT_FOUND, "Artifact " + shard.file_path + " not found");
        return std::nullopt;
    }

    if (!shard.has_hash())
    {
        if (!compute_hash(shard, error))
        {
            return std::nullopt;
        }

        model::Error save_error;
        if (!metadata_store_->save(shard, save_error))
        {
            LOG(WARNING) << "Content hash of " << shard.display_name
                         << " not persisted: " << save_error.message;
        }
    }

    model::Link link;
    link.content_hash       = utils::to_lower_ascii(shard.content_hash);
    link.display_name       = shard.display_name;
    link.trackers           = trackers.empty() ? default_trackers_ : trackers;
    link.embedding_model    = shard.embedding_model;
    link.dimensions         = shard.dimensions;
    link.tags               = shard.tags;
    link.file_size          = file_size;
    link.creator_id         = shard.creator_id;
    link.creator_public_key = shard.creator_public_key;

    return link;
}

bool ShardPackager::sign_shard(
    model::Shard &shard, const trust::Identity &identity, model::Error &error) const
{
    if (!shard.has_hash() && !compute_hash(shard, error))
    {
        return false;
    }

    model::Shard signed_shard {shard};
    signed_shard.creator_id         = identity.agent_id();
    signed_shard.creator_public_key = identity.public_key();

    auto signature = identity.sign(signed_shard.signed_payload());
    if (signature.empty())
    {
        error.set(model::ErrorCode::SIGNATURE, "Cannot sign shard " + shard.display_name);
        return false;
    }
    signed_shard.signature = std::move(signature);

    if (!metadata_store_->save(signed_shard, error))
    {
        return false;
    }

    LOG(INFO) << "Shard " << shard.display_name << " signed by " << *signed_shard.creator_id;
    shard = std::move(signed_shard);
    return true;
}

bool ShardPackager::hash_file(const std::string &file_path, crypto::HashAlgorithm algorithm,
    std::string &out, model::Error &error) const
{
    std::string hash;
    if (!content_hasher_->create_hash(file_path, algorithm, hash, *executer_).get())
    {
        error.set(model::ErrorCode::IO, "Cannot read artifact " + file_path);
        return false;
    }

    out = std::move(hash);
    return true;
}
}  // namespace synapse
