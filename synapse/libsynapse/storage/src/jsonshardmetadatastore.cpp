#include "jsonshardmetadatastore.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "base64encoder.hpp"

namespace synapse::storage
{
namespace
{
constexpr char const *metadata_suffix = ".meta.json";

constexpr char const *key_file_path          = "file_path";
constexpr char const *key_embedding_model    = "embedding_model";
constexpr char const *key_dimension_size     = "dimension_size";
constexpr char const *key_entry_count        = "entry_count";
constexpr char const *key_tags               = "tags";
constexpr char const *key_payload_hash       = "payload_hash";
constexpr char const *key_display_name       = "display_name";
constexpr char const *key_creator_agent_id   = "creator_agent_id";
constexpr char const *key_creator_public_key = "creator_public_key";
constexpr char const *key_signature          = "signature";

bool read_optional_string(
    const nlohmann::json &root, const char *key, std::optional<std::string> &out)
{
    auto it = root.find(key);
    if (it == root.end() || it->is_null())
    {
        out.reset();
        return true;
    }
    if (!it->is_string())
    {
        return false;
    }
    out = it->get<std::string>();
    return true;
}
}  // namespace

JSONShardMetadataStore::JSONShardMetadataStore(std::shared_ptr<const crypto::Base64Encoder> b64)
    : b64_ {std::move(b64)}
{}

JSONShardMetadataStore::~JSONShardMetadataStore() = default;

std::string JSONShardMetadataStore::metadata_path(const std::string &artifact_path) const
{
    return artifact_path + metadata_suffix;
}

bool JSONShardMetadataStore::save(const model::Shard &shard, model::Error &error) const
{
    nlohmann::json root;

    root[key_file_path]       = shard.file_path;
    root[key_embedding_model] = shard.embedding_model;
    root[key_dimension_size]  = shard.dimensions;
    root[key_entry_count]     = shard.entry_count;
    root[key_tags]            = shard.tags;
    root[key_payload_hash]    = shard.content_hash;
    root[key_display_name]    = shard.display_name;

    root[key_creator_agent_id] = shard.creator_id ? nlohmann::json(*shard.creator_id) : nullptr;
    root[key_creator_public_key] =
        shard.creator_public_key ? nlohmann::json(*shard.creator_public_key) : nullptr;
    root[key_signature] =
        shard.signature
            ? nlohmann::json(b64_->encode(shard.signature->data(), shard.signature->size()))
            : nullptr;

    auto          path = metadata_path(shard.file_path);
    std::ofstream fs {path, std::ios::out | std::ios::trunc};
    if (!fs)
    {
        error.set(model::ErrorCode::IO, "Cannot open " + path + " for writing");
        LOG(ERROR) << error.message;
        return false;
    }

    fs << std::setw(4) << root << '\n';
    if (!fs.flush())
    {
        error.set(model::ErrorCode::IO, "Cannot write " + path);
        LOG(ERROR) << error.message;
        return false;
    }

    return true;
}

bool JSONShardMetadataStore::load(
    const std::string &artifact_path, model::Shard &out, model::Error &error) const
{
    auto path = metadata_path(artifact_path);
    if (!std::filesystem::exists(path))
    {
        error.set(model::ErrorCode::NOT_FOUND, "Metadata record " + path + " not found");
        return false;
    }

    std::ifstream fs {path};
    if (!fs)
    {
        error.set(model::ErrorCode::IO, "Cannot open " + path + " for reading");
        LOG(ERROR) << error.message;
        return false;
    }

    auto root = nlohmann::json::parse(fs, nullptr, false);
    if (root.is_discarded() || !root.is_object())
    {
        error.set(model::ErrorCode::FORMAT, "Metadata record " + path + " is not a JSON object");
        return false;
    }

    model::Shard shard;
    try
    {
        shard.file_path       = root.at(key_file_path).get<std::string>();
        shard.embedding_model = root.at(key_embedding_model).get<std::string>();
        shard.dimensions      = root.at(key_dimension_size).get<unsigned>();
        shard.entry_count     = root.at(key_entry_count).get<unsigned long long>();
        shard.content_hash    = root.at(key_payload_hash).get<std::string>();
        shard.display_name    = root.at(key_display_name).get<std::string>();

        auto tags_it = root.find(key_tags);
        if (tags_it != root.end() && !tags_it->is_null())
        {
            shard.tags = tags_it->get<std::set<std::string>>();
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        error.set(
            model::ErrorCode::FORMAT, "Metadata record " + path + " is malformed: " + e.what());
        return false;
    }

    std::optional<std::string> signature;
    if (!read_optional_string(root, key_creator_agent_id, shard.creator_id) ||
        !read_optional_string(root, key_creator_public_key, shard.creator_public_key) ||
        !read_optional_string(root, key_signature, signature))
    {
        error.set(model::ErrorCode::FORMAT,
            "Metadata record " + path + " has malformed creator fields");
        return false;
    }

    if (signature)
    {
        std::vector<uint8_t> bytes;
        if (!b64_->decode(*signature, bytes))
        {
            error.set(model::ErrorCode::FORMAT,
                "Metadata record " + path + " has a malformed signature");
            return false;
        }
        shard.signature = std::move(bytes);
    }

    out = std::move(shard);
    return true;
}
}  // namespace synapse::storage
